//
// Created by zavier on 2021/12/20.
//

#include <sstream>
#include "shardkv/net/uri.h"

namespace shardkv {
static auto g_logger = GetLogInstance();

Uri::Uri()
        : m_port(0) {
}

Uri::ptr Uri::Create(const std::string &uri) {
    if (uri.empty()) {
        return nullptr;
    }
    Uri::ptr res(new Uri);
    if (!res->parse(uri)) {
        SPDLOG_LOGGER_DEBUG(g_logger, "invalid uri: {}", uri);
        return nullptr;
    }
    return res;
}

Address::ptr Uri::createAddress() {
    return Address::Resolve(m_host, getPort());
}

const std::string& Uri::getPath() const {
    static std::string default_path = "/";
    return m_path.empty() ? default_path : m_path;
}

uint32_t Uri::getPort() const {
    if(m_port) {
        return m_port;
    }
    if(m_scheme == "http" || m_scheme.empty()) {
        return 80;
    } else if(m_scheme == "https") {
        return 443;
    }
    return m_port;
}

std::ostream &Uri::dump(std::ostream &ostream) {
    if (!m_scheme.empty()) {
        ostream << m_scheme << "://";
    }
    ostream << m_host
            << (isDefaultPort()? "" : ":" + std::to_string(m_port))
            << getPath()
            << (m_query.empty()? "" : "?") << m_query;
    return ostream;
}

std::string Uri::toString() {
    std::stringstream ss;
    dump(ss);
    return ss.str();
}

bool Uri::isDefaultPort() const {
    if(m_port == 0) {
        return true;
    }
    if(m_scheme == "http") {
        return m_port == 80;
    } else if(m_scheme == "https") {
        return m_port == 443;
    }
    return false;
}

/**
*  [ scheme :// ] host [ : port ] [ path ] [ ? query ] [ # fragment ]
*  fragment 不会发给服务端，直接丢弃
*/
bool Uri::parse(std::string_view uri) {
    size_t pos = uri.find("://");
    if (pos != std::string_view::npos) {
        m_scheme = std::string(uri.substr(0, pos));
        for (char& c : m_scheme) {
            if (!isalnum(c) && c != '+' && c != '-' && c != '.') {
                return false;
            }
            c = (char)tolower(c);
        }
        uri.remove_prefix(pos + 3);
    }

    pos = uri.find('#');
    if (pos != std::string_view::npos) {
        uri = uri.substr(0, pos);
    }
    pos = uri.find('?');
    if (pos != std::string_view::npos) {
        m_query = std::string(uri.substr(pos + 1));
        uri = uri.substr(0, pos);
    }
    pos = uri.find('/');
    if (pos != std::string_view::npos) {
        m_path = std::string(uri.substr(pos));
        uri = uri.substr(0, pos);
    }

    // authority 里的 userinfo 不需要
    pos = uri.rfind('@');
    if (pos != std::string_view::npos) {
        uri.remove_prefix(pos + 1);
    }

    std::string_view port;
    if (!uri.empty() && uri.front() == '[') {
        pos = uri.find(']');
        if (pos == std::string_view::npos) {
            return false;
        }
        m_host = std::string(uri.substr(1, pos - 1));
        uri.remove_prefix(pos + 1);
        if (!uri.empty()) {
            if (uri.front() != ':') {
                return false;
            }
            port = uri.substr(1);
        }
    } else {
        pos = uri.find(':');
        if (pos != std::string_view::npos) {
            port = uri.substr(pos + 1);
            uri = uri.substr(0, pos);
        }
        m_host = std::string(uri);
    }

    if (m_host.empty()) {
        return false;
    }
    if (!port.empty()) {
        uint32_t value = 0;
        for (char c : port) {
            if (!isdigit(c)) {
                return false;
            }
            value = value * 10 + (c - '0');
            if (value > 65535) {
                return false;
            }
        }
        m_port = value;
    }
    return true;
}

}

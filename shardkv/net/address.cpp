//
// Created by zavier on 2021/12/6.
//

#include <arpa/inet.h>
#include <netdb.h>
#include <algorithm>
#include <cstring>
#include <boost/lexical_cast.hpp>

#include "shardkv/net/address.h"

namespace shardkv {
static auto g_logger = GetLogInstance();

namespace {
/**
 * @brief 拆出 host 和 port，port 不存在时为空
 */
bool SplitHostPort(const std::string& str, std::string& host, std::string& port, bool& bracket) {
    bracket = false;
    if (!str.empty() && str.front() == '[') {
        size_t end = str.find(']');
        if (end == std::string::npos) {
            return false;
        }
        bracket = true;
        host = str.substr(1, end - 1);
        if (end + 1 < str.size()) {
            if (str[end + 1] != ':') {
                return false;
            }
            port = str.substr(end + 2);
        }
        return true;
    }
    size_t pos = str.find(':');
    // 多个冒号视为不带端口的 IPv6 地址
    if (pos != std::string::npos && str.find(':', pos + 1) == std::string::npos) {
        host = str.substr(0, pos);
        port = str.substr(pos + 1);
    } else {
        host = str;
    }
    return true;
}
}

Address::ptr Address::Resolve(const std::string& str, uint16_t defaultPort, int family) {
    std::string host, port_str;
    bool bracket;
    if (!SplitHostPort(str, host, port_str, bracket) || host.empty()) {
        SPDLOG_LOGGER_DEBUG(g_logger, "Address::Resolve invalid host {}", str);
        return nullptr;
    }
    uint16_t port = defaultPort;
    if (!port_str.empty()) {
        try {
            port = boost::lexical_cast<uint16_t>(port_str);
        } catch (const boost::bad_lexical_cast&) {
            SPDLOG_LOGGER_DEBUG(g_logger, "Address::Resolve invalid port {}", str);
            return nullptr;
        }
    }

    addrinfo hints{};
    hints.ai_family = bracket || host.find(':') != std::string::npos ? AF_INET6 : family;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    int error = getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (error) {
        SPDLOG_LOGGER_DEBUG(g_logger, "Address::Resolve getaddrinfo({}) err={} errstr={}",
                            host, error, gai_strerror(error));
        return nullptr;
    }
    Address::ptr result = Create(results->ai_addr, results->ai_addrlen);
    freeaddrinfo(results);
    if (result) {
        result->setPort(port);
    }
    return result;
}

Address::ptr Address::Create(const sockaddr* addr, socklen_t addrlen) {
    if (!addr || (addr->sa_family != AF_INET && addr->sa_family != AF_INET6)) {
        return nullptr;
    }
    auto result = std::make_shared<Address>(addr->sa_family);
    memcpy(&result->m_addr, addr, std::min<size_t>(addrlen, sizeof(result->m_addr)));
    return result;
}

Address::Address(int family) {
    m_addr.ss_family = family;
}

socklen_t Address::getAddrLen() const {
    return getFamily() == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
}

uint16_t Address::getPort() const {
    if (getFamily() == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&m_addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&m_addr)->sin_port);
}

void Address::setPort(uint16_t port) {
    if (getFamily() == AF_INET6) {
        reinterpret_cast<sockaddr_in6*>(&m_addr)->sin6_port = htons(port);
    } else {
        reinterpret_cast<sockaddr_in*>(&m_addr)->sin_port = htons(port);
    }
}

std::string Address::toString() const {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (getFamily() == AF_INET6) {
        inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(&m_addr)->sin6_addr, buf, sizeof(buf));
        return fmt::format("[{}]:{}", buf, getPort());
    }
    inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(&m_addr)->sin_addr, buf, sizeof(buf));
    return fmt::format("{}:{}", buf, getPort());
}

bool Address::operator==(const Address& rhs) const {
    return getAddrLen() == rhs.getAddrLen() && memcmp(&m_addr, &rhs.m_addr, getAddrLen()) == 0;
}

}

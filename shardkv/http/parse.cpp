//
// Created by zavier on 2021/12/13.
//

#include <cctype>
#include <cstring>
#include <optional>
#include "shardkv/common/config.h"
#include "shardkv/http/parse.h"

namespace shardkv::http {
static auto g_logger = GetLogInstance();

static ConfigVar<uint64_t>::ptr g_http_request_buffer_size =
        Config::Lookup<uint64_t>("http.request.buffer_size"
                ,(uint64_t)(4 * 1024), "http request buffer size");

static ConfigVar<uint64_t>::ptr g_http_request_max_body_size =
        Config::Lookup<uint64_t>("http.request.max_body_size"
                ,(uint64_t)(64 * 1024 * 1024), "http request max body size");

static ConfigVar<uint64_t>::ptr g_http_response_buffer_size =
        Config::Lookup<uint64_t>("http.response.buffer_size"
                ,(uint64_t)(4 * 1024), "http response buffer size");

static ConfigVar<uint64_t>::ptr g_http_response_max_body_size =
        Config::Lookup<uint64_t>("http.response.max_body_size"
                ,(uint64_t)(64 * 1024 * 1024), "http response max body size");

uint64_t HttpRequestParser::GetHttpRequestBufferSize() {
    return g_http_request_buffer_size->getValue();
}

uint64_t HttpRequestParser::GetHttpRequestMaxBodySize() {
    return g_http_request_max_body_size->getValue();
}

uint64_t HttpResponseParser::GetHttpResponseBufferSize() {
    return g_http_response_buffer_size->getValue();
}

uint64_t HttpResponseParser::GetHttpResponseMaxBodySize() {
    return g_http_response_max_body_size->getValue();
}

namespace {
// 请求目标允许的字符
bool IsUriChar(char c) {
    unsigned char uc = (unsigned char)c;
    return uc > 0x20 && uc < 0x7f;
}

// 头部的值允许 utf-8 字节，不允许控制字符
bool IsFieldChar(char c) {
    unsigned char uc = (unsigned char)c;
    return (uc >= 0x20 && uc != 0x7f) || uc == '\t';
}

std::string_view TrimBlank(std::string_view str) {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
        str.remove_prefix(1);
    }
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
        str.remove_suffix(1);
    }
    return str;
}

// "HTTP/1.1" -> 0x11
std::optional<uint8_t> ParseVersion(std::string_view str) {
    if (str == "HTTP/1.1") {
        return 0x11;
    }
    if (str == "HTTP/1.0") {
        return 0x10;
    }
    return std::nullopt;
}
}

HttpParser::HttpParser(HttpMessage& message, uint64_t maxLine, uint64_t maxBody)
    : m_message(message)
    , m_maxLine(maxLine)
    , m_maxBody(maxBody) {
}

int HttpParser::isFinished() const {
    if (m_error) {
        return -1;
    }
    return m_finish ? 1 : 0;
}

size_t HttpParser::execute(char *data, size_t len, bool chunk) {
    if (chunk && !m_chunk) {
        m_chunk = true;
        m_finish = false;
        m_input.clear();
        m_parser = parseChunked();
        m_parser.resume();
    } else if (!m_parser.valid()) {
        m_parser = parseMessage();
        m_parser.resume();
    }
    size_t offset = 0;
    while (offset < len && isFinished() == 0) {
        if (!collect(data[offset++])) {
            continue;
        }
        m_parser.resume();
        m_error = m_parser.get();
        m_input.clear();
    }
    memmove(data, data + offset, len - offset);
    return offset;
}

bool HttpParser::collect(char c) {
    m_input.push_back(c);
    if (m_want) {
        return m_input.size() == m_want;
    }
    if (c != '\n') {
        if (m_input.size() > m_maxLine) {
            SPDLOG_LOGGER_DEBUG(g_logger, "http line too long, limit={}", m_maxLine);
            m_error = LINE_TOO_LONG;
        }
        return false;
    }
    // 行必须以 CRLF 结束，交给协程前去掉
    if (m_input.size() < 2 || m_input[m_input.size() - 2] != '\r') {
        m_error = INVALID_LINE;
        return false;
    }
    m_input.resize(m_input.size() - 2);
    return true;
}

/**
 * @brief 起始行，头部，空行
 */
Task<HttpParser::Error> HttpParser::parseMessage() {
    m_want = 0;
    co_yield NO_ERROR;
    Error err = parseStartLine(m_input);
    if (err) {
        co_return err;
    }
    while (true) {
        co_yield NO_ERROR;
        if (m_input.empty()) {
            break;
        }
        err = parseHeaderLine(m_input);
        if (err) {
            co_return err;
        }
    }
    std::string conn = m_message.getHeader("connection");
    if (m_message.getVersion() == 0x11) {
        m_message.setClose(strcasecmp(conn.c_str(), "close") == 0);
    } else {
        m_message.setClose(strcasecmp(conn.c_str(), "keep-alive") != 0);
    }
    m_finish = true;
    co_return NO_ERROR;
}

/**
 * @brief chunk 格式：size[;ext] CRLF data CRLF ... 0 CRLF [trailer] CRLF
 */
Task<HttpParser::Error> HttpParser::parseChunked() {
    std::string body;
    while (true) {
        m_want = 0;
        co_yield NO_ERROR;
        std::string_view line = m_input;
        std::string_view hex = TrimBlank(line.substr(0, line.find(';')));
        if (hex.empty() || hex.size() > 15) {
            co_return INVALID_CHUNK;
        }
        size_t size = 0;
        for (char c: hex) {
            int v = HexValue(c);
            if (v < 0) {
                co_return INVALID_CHUNK;
            }
            size = size * 16 + v;
        }
        if (size == 0) {
            break;
        }
        if (body.size() + size > m_maxBody) {
            SPDLOG_LOGGER_DEBUG(g_logger, "chunked body too large, limit={}", m_maxBody);
            co_return INVALID_CHUNK;
        }
        // 数据后面紧跟 CRLF
        m_want = size + 2;
        co_yield NO_ERROR;
        if (m_input.compare(size, 2, "\r\n") != 0) {
            co_return INVALID_CHUNK;
        }
        body.append(m_input, 0, size);
    }
    // trailer 直接丢掉
    m_want = 0;
    do {
        co_yield NO_ERROR;
    } while (!m_input.empty());
    onChunkedBody(std::move(body));
    m_finish = true;
    co_return NO_ERROR;
}

HttpParser::Error HttpParser::parseHeaderLine(std::string_view line) {
    size_t colon = line.find(':');
    if (colon == 0 || colon == std::string_view::npos) {
        return INVALID_HEADER;
    }
    std::string_view key = line.substr(0, colon);
    if (key.find_first_of(" \t") != std::string_view::npos) {
        return INVALID_HEADER;
    }
    std::string_view val = TrimBlank(line.substr(colon + 1));
    for (char c: val) {
        if (!IsFieldChar(c)) {
            return INVALID_HEADER;
        }
    }
    m_message.setHeader(std::string(key), std::string(val));
    return NO_ERROR;
}

HttpRequestParser::HttpRequestParser()
    : HttpRequestParser(std::make_shared<HttpRequest>()) {
}

HttpRequestParser::HttpRequestParser(HttpRequest::ptr data)
    : HttpParser(*data, GetHttpRequestBufferSize(), GetHttpRequestMaxBodySize())
    , m_data(std::move(data)) {
}

/**
 * @brief METHOD SP path[?query][#fragment] SP HTTP/1.x
 */
HttpParser::Error HttpRequestParser::parseStartLine(std::string_view line) {
    size_t sp1 = line.find(' ');
    std::string method = std::string(line.substr(0, sp1));
    m_data->setMethod(StringToMethod(method));
    if (m_data->getMethod() == HttpMethod::INVALID_METHOD) {
        SPDLOG_LOGGER_WARN(g_logger, "invalid http request method: {}", method);
        return INVALID_METHOD;
    }
    if (sp1 == std::string_view::npos) {
        return INVALID_PATH;
    }
    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) {
        return INVALID_PATH;
    }
    std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    // fragment 不会发给服务端，出现时直接丢掉
    target = target.substr(0, target.find('#'));
    if (target.empty()) {
        return INVALID_PATH;
    }
    for (char c: target) {
        if (!IsUriChar(c)) {
            return INVALID_PATH;
        }
    }
    size_t q = target.find('?');
    m_data->setPath(std::string(target.substr(0, q)));
    if (q != std::string_view::npos) {
        m_data->setQuery(std::string(target.substr(q + 1)));
    }

    auto version = ParseVersion(line.substr(sp2 + 1));
    if (!version) {
        SPDLOG_LOGGER_WARN(g_logger, "invalid http request version: {}", line.substr(sp2 + 1));
        return INVALID_VERSION;
    }
    m_data->setVersion(*version);
    return NO_ERROR;
}

HttpResponseParser::HttpResponseParser()
    : HttpResponseParser(std::make_shared<HttpResponse>()) {
}

HttpResponseParser::HttpResponseParser(HttpResponse::ptr data)
    : HttpParser(*data, GetHttpResponseBufferSize(), GetHttpResponseMaxBodySize())
    , m_data(std::move(data)) {
}

bool HttpResponseParser::isChunked() const {
    return strcasecmp(m_data->getHeader("Transfer-Encoding").c_str(), "chunked") == 0;
}

/**
 * @brief HTTP/1.x SP status SP [reason]
 */
HttpParser::Error HttpResponseParser::parseStartLine(std::string_view line) {
    size_t sp1 = line.find(' ');
    auto version = ParseVersion(line.substr(0, sp1));
    if (!version) {
        SPDLOG_LOGGER_WARN(g_logger, "invalid http response version: {}", line.substr(0, sp1));
        return INVALID_VERSION;
    }
    m_data->setVersion(*version);
    if (sp1 == std::string_view::npos) {
        return INVALID_CODE;
    }
    std::string_view rest = line.substr(sp1 + 1);
    size_t sp2 = rest.find(' ');
    std::string_view code = rest.substr(0, sp2);
    if (code.size() != 3) {
        return INVALID_CODE;
    }
    uint32_t status = 0;
    for (char c: code) {
        if (!isdigit(c)) {
            return INVALID_CODE;
        }
        status = status * 10 + (c - '0');
    }
    m_data->setStatus(status);
    // reason 可以为空
    if (sp2 != std::string_view::npos) {
        m_data->setReason(std::string(rest.substr(sp2 + 1)));
    }
    return NO_ERROR;
}

}

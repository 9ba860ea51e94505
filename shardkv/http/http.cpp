//
// Created by zavier on 2021/12/11.
//

#include <cstring>
#include <string_view>
#include <boost/lexical_cast.hpp>
#include "shardkv/common/util.h"
#include "shardkv/http/http.h"
namespace shardkv::http{
static auto g_logger = GetLogInstance();

HttpMethod StringToMethod(const std::string& m){
#define XX(num, name, string)               \
    if(m == #string){                       \
        return HttpMethod::name;            \
    }
    HTTP_METHOD_MAP(XX)
#undef XX
    return HttpMethod::INVALID_METHOD;
}

HttpContentType StringToContentType(const std::string& m){
    std::string type = m.substr(0, m.find(';'));
    while (!type.empty() && isspace(type.back())) {
        type.pop_back();
    }
#define XX(name, string)                            \
    if(strcasecmp(type.c_str(), #string) == 0){     \
        return HttpContentType::name;               \
    }
    HTTP_CONTENT_TYPE(XX)
#undef XX
    return HttpContentType::INVALID_TYPE;
}

std::string HttpMethodToString(HttpMethod m){
    switch (m) {
#define XX(num, name, string) \
        case HttpMethod::name: return #string;
        HTTP_METHOD_MAP(XX)
#undef XX
        default: return "<unknown>";
    }
}

std::string HttpStatusToString(HttpStatus s){
    switch(s) {
#define XX(code, name, msg) \
        case HttpStatus::name: return #msg;
        HTTP_STATUS_MAP(XX)
#undef XX
        default: return "<unknown>";
    }
}

std::string HttpContentTypeToString(HttpContentType t){
    switch (t) {
#define XX(name, string) \
        case HttpContentType::name: return #string;
        HTTP_CONTENT_TYPE(XX)
#undef XX
        default: return "text/plain";
    }
}

bool CaseInsensitiveLess::operator()(const std::string &lhs, const std::string &rhs) const {
    return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
}

namespace {
void ParseUrlEncoded(std::string_view str, HttpMessage::MapType& out) {
    while (!str.empty()) {
        size_t end = str.find('&');
        std::string_view item = str.substr(0, end);
        str = end == std::string_view::npos ? std::string_view{} : str.substr(end + 1);
        if (item.empty()) {
            continue;
        }
        size_t eq = item.find('=');
        if (eq == std::string_view::npos) {
            out[UrlDecode(item)] = "";
        } else {
            out[UrlDecode(item.substr(0, eq))] = UrlDecode(item.substr(eq + 1));
        }
    }
}

std::string VersionString(uint8_t version) {
    return fmt::format("HTTP/{}.{}", version >> 4, version & 0xF);
}
}

std::string HttpMessage::getHeader(const std::string& key, const std::string& def) const {
    auto it = m_headers.find(key);
    return it == m_headers.end() ? def : it->second;
}

uint64_t HttpMessage::getContentLength() const {
    auto it = m_headers.find("Content-Length");
    if (it == m_headers.end()) {
        return 0;
    }
    try {
        return boost::lexical_cast<uint64_t>(it->second);
    } catch (const boost::bad_lexical_cast&) {
        return 0;
    }
}

Json HttpMessage::getJson() const {
    Json json = Json::parse(m_body, nullptr, false);
    if (json.is_discarded() && !m_body.empty()) {
        SPDLOG_LOGGER_DEBUG(g_logger, "parse json body fail, body={}", m_body);
    }
    return json;
}

void HttpMessage::setJson(const Json& json) {
    setContentType(HttpContentType::APPLICATION_JSON);
    // 非法 utf-8 用替换字符输出，不抛异常
    m_body = json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

void HttpMessage::writeHeadersAndBody(std::string& out) const {
    out += fmt::format("connection: {}\r\n", m_close ? "close" : "keep-alive");
    for (auto& [key, val]: m_headers) {
        if (strcasecmp(key.c_str(), "connection") == 0
            || strcasecmp(key.c_str(), "content-length") == 0) {
            continue;
        }
        out += fmt::format("{}: {}\r\n", key, val);
    }
    out += fmt::format("content-length: {}\r\n\r\n", m_body.size());
    out += m_body;
}

HttpRequest::HttpRequest(uint8_t version, bool close)
        : HttpMessage(version, close) {
}

std::string HttpRequest::getParam(const std::string& key, const std::string& def) const {
    auto it = m_params.find(key);
    return it == m_params.end() ? def : it->second;
}

void HttpRequest::initParams() {
    ParseUrlEncoded(m_query, m_params);
    if (getContentType() == HttpContentType::APPLICATION_URLENCODED) {
        ParseUrlEncoded(m_body, m_params);
    }
}

std::string HttpRequest::toString() const {
    // POST /put?key=a HTTP/1.1
    std::string out = fmt::format("{} {}{}{} {}\r\n", HttpMethodToString(m_method), m_path,
                                  m_query.empty() ? "" : "?", m_query, VersionString(m_version));
    writeHeadersAndBody(out);
    return out;
}

HttpResponse::HttpResponse(uint8_t version, bool close)
        : HttpMessage(version, close) {
}

std::string HttpResponse::toString() const {
    // HTTP/1.1 200 OK
    std::string out = fmt::format("{} {} {}\r\n", VersionString(m_version), (uint32_t)m_status,
                                  m_reason.empty() ? HttpStatusToString(m_status) : m_reason);
    writeHeadersAndBody(out);
    return out;
}

}

//
// Created by zavier on 2021/12/11.
//

#ifndef SHARDKV_HTTP_H
#define SHARDKV_HTTP_H

#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace shardkv::http{

using Json = nlohmann::json;

/* Request Methods */
#define HTTP_METHOD_MAP(XX)         \
  XX(0,  DELETE,      DELETE)       \
  XX(1,  GET,         GET)          \
  XX(2,  HEAD,        HEAD)         \
  XX(3,  POST,        POST)         \
  XX(4,  PUT,         PUT)          \
  XX(5,  OPTIONS,     OPTIONS)      \

/* Status Codes */
#define HTTP_STATUS_MAP(XX)                                                 \
  XX(200, OK,                              OK)                              \
  XX(400, BAD_REQUEST,                     Bad Request)                     \
  XX(404, NOT_FOUND,                       Not Found)                       \
  XX(405, METHOD_NOT_ALLOWED,              Method Not Allowed)              \
  XX(408, REQUEST_TIMEOUT,                 Request Timeout)                 \
  XX(413, PAYLOAD_TOO_LARGE,               Payload Too Large)               \
  XX(500, INTERNAL_SERVER_ERROR,           Internal Server Error)           \
  XX(502, BAD_GATEWAY,                     Bad Gateway)                     \
  XX(503, SERVICE_UNAVAILABLE,             Service Unavailable)             \

/* Content Type */
#define HTTP_CONTENT_TYPE(XX)                               \
  XX(TEXT_PLAIN,                text/plain)                 \
  XX(APPLICATION_JSON,          application/json)           \
  XX(APPLICATION_MSGPACK,       application/msgpack)        \
  XX(APPLICATION_URLENCODED,    application/x-www-form-urlencoded) \

enum class HttpMethod {
#define XX(num, name, string) name = num,
    HTTP_METHOD_MAP(XX)
#undef XX
    INVALID_METHOD
};

enum class HttpStatus {
#define XX(code, name, desc) name = code,
    HTTP_STATUS_MAP(XX)
#undef XX
};

enum class HttpContentType {
#define XX(name, desc) name,
    HTTP_CONTENT_TYPE(XX)
#undef XX
        INVALID_TYPE
};

HttpMethod StringToMethod(const std::string& m);
/**
 * @brief 忽略 ';' 之后的参数，"application/json; charset=utf-8" 也会被识别为 APPLICATION_JSON
 */
HttpContentType StringToContentType(const std::string& m);

std::string HttpMethodToString(HttpMethod m);
std::string HttpStatusToString(HttpStatus s);
std::string HttpContentTypeToString(HttpContentType t);

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

/**
 * @brief 请求和响应共有的部分：版本、连接方式、头部和消息体
 */
class HttpMessage {
public:
    using MapType = std::map<std::string, std::string, CaseInsensitiveLess>;

    HttpMessage(uint8_t version, bool close) : m_version(version), m_close(close) {}

    uint8_t getVersion() const { return m_version;}
    void setVersion(uint8_t version) { m_version = version;}
    bool isClose() const { return m_close;}
    void setClose(bool close) { m_close = close;}

    const std::string& getBody() const { return m_body;}
    void setBody(const std::string& body) { m_body = body;}

    const MapType& getHeaders() const { return m_headers;}
    std::string getHeader(const std::string& key, const std::string& def = "") const;
    void setHeader(const std::string& key, const std::string& val) { m_headers[key] = val;}
    bool hasHeader(const std::string& key) const { return m_headers.count(key);}

    /**
     * @brief Content-Length 缺失或非法时为 0
     */
    uint64_t getContentLength() const;
    HttpContentType getContentType() const { return StringToContentType(getHeader("Content-Type"));}
    void setContentType(HttpContentType type) { setHeader("Content-Type", HttpContentTypeToString(type));}

    /**
     * @brief 解析 body 为 json，失败时返回 discarded
     */
    Json getJson() const;
    void setJson(const Json& json);

protected:
    /**
     * @brief 输出头部和消息体，Connection 和 Content-Length 由当前状态生成
     */
    void writeHeadersAndBody(std::string& out) const;
protected:
    uint8_t m_version;
    bool m_close;
    std::string m_body;
    MapType m_headers;
};

class HttpRequest : public HttpMessage {
public:
    using ptr = std::shared_ptr<HttpRequest>;

    explicit HttpRequest(uint8_t version = 0x11, bool close = true);

    HttpMethod getMethod() const { return m_method;}
    void setMethod(HttpMethod method) { m_method = method;}
    const std::string& getPath() const { return m_path;}
    void setPath(const std::string& path) { m_path = path;}
    const std::string& getQuery() const { return m_query;}
    void setQuery(const std::string& query) { m_query = query;}

    const MapType& getParams() const { return m_params;}
    std::string getParam(const std::string& key, const std::string& def = "") const;
    void setParam(const std::string& key, const std::string& val) { m_params[key] = val;}
    bool hasParam(const std::string& key) const { return m_params.count(key);}

    /**
     * @brief 把 query 和 x-www-form-urlencoded 的 body 解析到 params，key 和 value 都做 URL 解码
     */
    void initParams();

    std::string toString() const;
private:
    HttpMethod m_method = HttpMethod::GET;
    std::string m_path = "/";
    std::string m_query;
    MapType m_params;
};

class HttpResponse : public HttpMessage {
public:
    using ptr = std::shared_ptr<HttpResponse>;

    explicit HttpResponse(uint8_t version = 0x11, bool close = true);

    HttpStatus getStatus() const { return m_status;}
    void setStatus(HttpStatus status) { m_status = status;}
    void setStatus(uint32_t status) { m_status = (HttpStatus)status;}
    const std::string& getReason() const { return m_reason;}
    void setReason(const std::string& reason) { m_reason = reason;}

    std::string toString() const;
private:
    HttpStatus m_status = HttpStatus::OK;
    std::string m_reason;
};

}
#endif //SHARDKV_HTTP_H

//
// Created by zavier on 2021/12/18.
//

#ifndef SHARDKV_HTTP_CONNECTION_H
#define SHARDKV_HTTP_CONNECTION_H
#include <atomic>
#include <list>
#include <map>
#include <memory>
#include <libgo/libgo.h>
#include "shardkv/net/socket_stream.h"
#include "shardkv/net/uri.h"
#include "http.h"
namespace shardkv::http {
using Headers = std::map<std::string, std::string>;

/**
 * @brief 一次客户端请求的结果，result 不为 OK 时 response 为空
 */
struct HttpResult {
    using ptr = std::shared_ptr<HttpResult>;
    enum Result {
        OK = 0,
        INVALID_URL,
        INVALID_HOST,
        CONNECT_FAIL,
        SEND_CLOSE_BY_PEER,
        SEND_SOCKET_ERROR,
        TIMEOUT,
        POOL_INVALID_CONNECTION,
    };
    HttpResult(Result result_, HttpResponse::ptr response_, std::string msg_)
        : result(result_), response(std::move(response_)), msg(std::move(msg_)) {}
    std::string toString() const;

    Result result;
    HttpResponse::ptr response;
    std::string msg;
};

class HttpConnectionPool;
/**
 * @brief 客户端的一条 HTTP 连接
 */
class HttpConnection : public SocketStream {
    friend HttpConnectionPool;
public:
    using ptr = std::shared_ptr<HttpConnection>;

    /**
     * @brief 短连接请求，url 可以不带 scheme，如 "127.0.0.1:8011/config"
     */
    static HttpResult::ptr DoRequest(HttpMethod method, const std::string& url, uint64_t timeout_ms,
                                     const Headers& headers = {}, const std::string& body = "");
    static HttpResult::ptr DoPost(const std::string& url, uint64_t timeout_ms,
                                  const Headers& headers = {}, const std::string& body = "") {
        return DoRequest(HttpMethod::POST, url, timeout_ms, headers, body);
    }

    explicit HttpConnection(Socket::ptr socket, bool owner = true);

    /**
     * @brief 接收一个完整响应，支持 content-length 和 chunked 两种 body
     */
    HttpResponse::ptr recvResponse();
    ssize_t sendRequest(HttpRequest::ptr request);
private:
    uint64_t m_createTime = 0;
    uint64_t m_request = 0;
};

/**
 * @brief 对同一个 host:port 的长连接池，连接超过存活时间或请求次数后不再复用
 */
class HttpConnectionPool {
public:
    using ptr = std::shared_ptr<HttpConnectionPool>;
    using MutexType = co::co_mutex;

    /**
     * @param uri "host:port" 或 "http://host:port"
     * @return uri 非法时返回 nullptr
     */
    static HttpConnectionPool::ptr Create(const std::string& uri, uint32_t max_size,
                                          uint32_t max_alive_time, uint32_t max_request);

    HttpConnectionPool(std::string host, uint32_t port, uint32_t max_size,
                       uint32_t max_alive_time, uint32_t max_request);
    ~HttpConnectionPool();

    HttpResult::ptr doPost(const std::string& path, uint64_t timeout_ms,
                           const Headers& headers = {}, const std::string& body = "") {
        return doRequest(HttpMethod::POST, path, timeout_ms, headers, body);
    }
    /**
     * @param path 可以带 query，如 "/get?key=a"
     */
    HttpResult::ptr doRequest(HttpMethod method, const std::string& path, uint64_t timeout_ms,
                              const Headers& headers = {}, const std::string& body = "");

    const std::string& getHost() const { return m_host;}
    uint32_t getPort() const { return m_port;}
private:
    HttpConnection::ptr getConnection(uint64_t timeout_ms);
    void release(HttpConnection* conn);
    bool expired(const HttpConnection* conn, uint64_t now_ms) const;
private:
    std::string m_host;
    uint32_t m_port;
    uint32_t m_maxSize;
    uint32_t m_maxAliveTime;
    uint32_t m_maxRequest;
    MutexType m_mutex;
    std::list<HttpConnection*> m_conns;
    std::atomic<int32_t> m_total{0};
};

}

#endif //SHARDKV_HTTP_CONNECTION_H

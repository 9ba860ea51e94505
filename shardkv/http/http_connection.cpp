//
// Created by zavier on 2021/12/18.
//

#include <algorithm>
#include <cstring>
#include <functional>
#include "shardkv/http/http_connection.h"
#include "shardkv/http/parse.h"

namespace shardkv::http {
static auto g_logger = GetLogInstance();

std::string HttpResult::toString() const {
    return fmt::format("[HttpResult result={} msg={} response={}]", (int)result, msg,
                       response ? response->toString() : "nullptr");
}

HttpConnection::HttpConnection(Socket::ptr socket, bool owner)
        : SocketStream(socket, owner) {
    m_createTime = GetCurrentMS();
}

HttpConnection::~HttpConnection() {
    SPDLOG_LOGGER_TRACE(g_logger, "HttpConnection::~HttpConnection");
}

HttpResponse::ptr HttpConnection::recvResponse() {
    HttpResponseParser parser;
    std::string buffer(HttpResponseParser::GetHttpResponseBufferSize(), '\0');
    size_t left = 0;
    while (parser.isFinished() == 0) {
        ssize_t n = read(&buffer[0], buffer.size());
        if (n <= 0) {
            close();
            return nullptr;
        }
        left = n - parser.execute(&buffer[0], n);
    }
    if (parser.hasError()) {
        SPDLOG_LOGGER_DEBUG(g_logger, "parse http response fail, error={}", parser.hasError());
        close();
        return nullptr;
    }

    HttpResponse::ptr response = parser.getData();
    if (parser.isChunked()) {
        parser.execute(&buffer[0], left, true);
        while (parser.isFinished() == 0) {
            ssize_t n = read(&buffer[0], buffer.size());
            if (n <= 0) {
                close();
                return nullptr;
            }
            parser.execute(&buffer[0], n, true);
        }
        if (parser.hasError()) {
            SPDLOG_LOGGER_DEBUG(g_logger, "parse chunked body fail, error={}", parser.hasError());
            close();
            return nullptr;
        }
        return response;
    }

    uint64_t length = parser.getContentLength();
    if (length > HttpResponseParser::GetHttpResponseMaxBodySize()) {
        close();
        return nullptr;
    }
    if (length > 0) {
        std::string body = buffer.substr(0, std::min<uint64_t>(length, left));
        size_t have = body.size();
        body.resize(length);
        if (have < length && readFixSize(&body[have], length - have) <= 0) {
            close();
            return nullptr;
        }
        response->setBody(std::move(body));
    }
    return response;
}

ssize_t HttpConnection::sendRequest(HttpRequest::ptr request) {
    std::string str = request->toString();
    return writeFixSize(str.c_str(), str.size());
}

namespace {
/**
 * @brief 拆分 path 和 query，拷贝头部，Connection 由调用方决定
 */
HttpRequest::ptr BuildRequest(HttpMethod method, const std::string& target, bool keepalive,
                              const Headers& headers, const std::string& body) {
    HttpRequest::ptr req = std::make_shared<HttpRequest>(0x11, !keepalive);
    req->setMethod(method);
    size_t pos = target.find('?');
    req->setPath(target.substr(0, pos));
    if (pos != std::string::npos) {
        req->setQuery(target.substr(pos + 1));
    }
    for (auto& [key, val]: headers) {
        if (strcasecmp(key.c_str(), "connection") == 0) {
            continue;
        }
        req->setHeader(key, val);
    }
    req->setBody(body);
    return req;
}

/**
 * @brief 在一条已建立的连接上完成一次请求
 */
HttpResult::ptr Exchange(HttpConnection::ptr conn, HttpRequest::ptr req, const std::string& peer, uint64_t timeout_ms) {
    if (timeout_ms != (uint64_t)-1) {
        conn->getSocket()->setRecvTimeout(timeout_ms);
    }
    ssize_t rt = conn->sendRequest(req);
    if (rt == 0) {
        conn->close();
        return std::make_shared<HttpResult>(HttpResult::SEND_CLOSE_BY_PEER, nullptr,
                                            "send request closed by peer: " + peer);
    }
    if (rt < 0) {
        conn->close();
        return std::make_shared<HttpResult>(HttpResult::SEND_SOCKET_ERROR, nullptr,
                                            fmt::format("send request to {} fail, errno={} errstr={}",
                                                        peer, errno, strerror(errno)));
    }
    auto rsp = conn->recvResponse();
    if (!rsp) {
        return std::make_shared<HttpResult>(HttpResult::TIMEOUT, nullptr,
                                            fmt::format("recv response from {} fail, timeout_ms={}", peer, timeout_ms));
    }
    return std::make_shared<HttpResult>(HttpResult::OK, rsp, "ok");
}
}

HttpResult::ptr HttpConnection::DoRequest(HttpMethod method, const std::string& url, uint64_t timeout_ms,
                                          const Headers& headers, const std::string& body) {
    Uri::ptr uri = Uri::Create(url);
    if (!uri) {
        return std::make_shared<HttpResult>(HttpResult::INVALID_URL, nullptr, "invalid url: " + url);
    }
    Address::ptr addr = uri->createAddress();
    if (!addr) {
        return std::make_shared<HttpResult>(HttpResult::INVALID_HOST, nullptr, "invalid host: " + uri->getHost());
    }
    Socket::ptr sock = Socket::CreateTCP(addr);
    if (!sock->connect(addr, timeout_ms)) {
        return std::make_shared<HttpResult>(HttpResult::CONNECT_FAIL, nullptr, "connect fail: " + addr->toString());
    }
    std::string target = uri->getPath();
    if (!uri->getQuery().empty()) {
        target += "?" + uri->getQuery();
    }
    HttpRequest::ptr req = BuildRequest(method, target, false, headers, body);
    if (!req->hasHeader("Host")) {
        req->setHeader("Host", uri->getHost());
    }
    return Exchange(std::make_shared<HttpConnection>(sock), req, addr->toString(), timeout_ms);
}

HttpConnectionPool::ptr HttpConnectionPool::Create(const std::string& uri, uint32_t max_size,
                                                   uint32_t max_alive_time, uint32_t max_request) {
    Uri::ptr turi = Uri::Create(uri);
    if (!turi) {
        SPDLOG_LOGGER_ERROR(g_logger, "invalid uri={}", uri);
        return nullptr;
    }
    return std::make_shared<HttpConnectionPool>(turi->getHost(), turi->getPort(),
                                                max_size, max_alive_time, max_request);
}

HttpConnectionPool::HttpConnectionPool(std::string host, uint32_t port, uint32_t max_size,
                                       uint32_t max_alive_time, uint32_t max_request)
        : m_host(std::move(host))
        , m_port(port)
        , m_maxSize(max_size)
        , m_maxAliveTime(max_alive_time)
        , m_maxRequest(max_request) {
}

HttpConnectionPool::~HttpConnectionPool() {
    std::unique_lock<MutexType> lock(m_mutex);
    for (auto conn : m_conns) {
        delete conn;
    }
    m_conns.clear();
}

bool HttpConnectionPool::expired(const HttpConnection* conn, uint64_t now_ms) const {
    return !conn->isConnected() || conn->m_createTime + m_maxAliveTime <= now_ms;
}

HttpConnection::ptr HttpConnectionPool::getConnection(uint64_t timeout_ms) {
    const uint64_t now_ms = GetCurrentMS();
    std::vector<HttpConnection*> stale;
    HttpConnection* conn = nullptr;
    {
        std::unique_lock<MutexType> lock(m_mutex);
        while (!conn && !m_conns.empty()) {
            HttpConnection* front = m_conns.front();
            m_conns.pop_front();
            if (expired(front, now_ms)) {
                stale.push_back(front);
            } else {
                conn = front;
            }
        }
    }
    for (auto item : stale) {
        delete item;
    }
    m_total -= stale.size();

    if (!conn) {
        Address::ptr addr = Address::Resolve(m_host, m_port);
        if (!addr) {
            SPDLOG_LOGGER_DEBUG(g_logger, "resolve {} fail", m_host);
            return nullptr;
        }
        Socket::ptr sock = Socket::CreateTCP(addr);
        if (!sock->connect(addr, timeout_ms)) {
            SPDLOG_LOGGER_TRACE(g_logger, "connect {} fail", addr->toString());
            return nullptr;
        }
        conn = new HttpConnection(sock);
        ++m_total;
    }
    // 用完后回到池里
    return HttpConnection::ptr(conn, [this](HttpConnection* c) {
        release(c);
    });
}

void HttpConnectionPool::release(HttpConnection* conn) {
    ++conn->m_request;
    if (expired(conn, GetCurrentMS()) || conn->m_request >= m_maxRequest) {
        delete conn;
        --m_total;
        return;
    }
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_conns.size() >= m_maxSize) {
        lock.unlock();
        delete conn;
        --m_total;
        return;
    }
    m_conns.push_back(conn);
}

HttpResult::ptr HttpConnectionPool::doRequest(HttpMethod method, const std::string& path, uint64_t timeout_ms,
                                              const Headers& headers, const std::string& body) {
    HttpRequest::ptr req = BuildRequest(method, path, true, headers, body);
    if (!req->hasHeader("Host")) {
        req->setHeader("Host", fmt::format("{}:{}", m_host, m_port));
    }
    auto conn = getConnection(timeout_ms);
    if (!conn) {
        return std::make_shared<HttpResult>(HttpResult::POOL_INVALID_CONNECTION, nullptr,
                                            fmt::format("no connection to {}:{}", m_host, m_port));
    }
    return Exchange(conn, req, m_host, timeout_ms);
}

}

//
// Created by zavier on 2021/12/15.
//

#ifndef SHARDKV_HTTP_SERVER_H
#define SHARDKV_HTTP_SERVER_H
#include <memory>
#include "shardkv/net/tcp_server.h"
#include "http.h"
#include "http_session.h"
#include "servlet.h"

namespace shardkv::http {
class HttpServer : public TcpServer {
public:
    using ptr = std::shared_ptr<HttpServer>;
    explicit HttpServer(bool keepalive = false, co::Scheduler* worker = &co_sched);
    ServletDispatch::ptr getServletDispatch() const { return m_dispatch;}
    void setName(const std::string& name) override;
protected:
    void handleClient(Socket::ptr client) override;

private:
    bool m_isKeepalive;
    ServletDispatch::ptr m_dispatch;
};
}
#endif //SHARDKV_HTTP_SERVER_H

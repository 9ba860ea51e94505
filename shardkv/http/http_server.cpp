//
// Created by zavier on 2021/12/15.
//

#include <cstring>
#include "shardkv/http/http_server.h"

namespace shardkv::http {
static auto g_logger = GetLogInstance();

HttpServer::HttpServer(bool keepalive, co::Scheduler* worker)
    : TcpServer(worker)
    , m_isKeepalive(keepalive){
    m_dispatch = std::make_shared<ServletDispatch>();
}

void HttpServer::handleClient(Socket::ptr client) {
    SPDLOG_LOGGER_TRACE(g_logger, "handleClient: {}", client->toString());
    HttpSession::ptr session(new HttpSession(client));
    while (!isStop()) {
        HttpRequest::ptr request = session->recvRequest();
        if (!request) {
            SPDLOG_LOGGER_TRACE(g_logger, "recv http request fail, errno={}, errstr={}, client={}, keep_alive={}",
                                errno, strerror(errno), client->toString(), m_isKeepalive);
            break;
        }
        bool close = request->isClose() || !m_isKeepalive;
        HttpResponse::ptr response(new HttpResponse(request->getVersion(), close));
        response->setHeader("Server" ,getName());

        if (m_dispatch->handle(request, response, session) == 0) {
            if (session->sendResponse(response) <= 0) {
                break;
            }
        }

        if (close) {
            break;
        }
    }
    session->close();
}

void HttpServer::setName(const std::string& name) {
    TcpServer::setName(name);
    m_dispatch->setDefault(std::make_shared<NotFoundServlet>(name));
}

}

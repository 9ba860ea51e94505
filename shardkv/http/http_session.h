//
// Created by zavier on 2021/12/15.
//

#ifndef SHARDKV_HTTP_SESSION_H
#define SHARDKV_HTTP_SESSION_H
#include <memory>
#include <string>
#include "shardkv/net/socket_stream.h"
#include "http.h"

namespace shardkv::http {
/**
 * @brief 服务端的一条 HTTP 连接
 */
class HttpSession : public SocketStream {
public:
    using ptr = std::shared_ptr<HttpSession>;

    HttpSession(Socket::ptr socket, bool owner = true);

    /**
     * @brief 接收一个完整请求，对端关闭、超时或格式错误时返回 nullptr
     * @details 请求之后多读到的字节留给下一次调用，支持 keep-alive 上的流水线请求
     */
    HttpRequest::ptr recvRequest();

    ssize_t sendResponse(HttpResponse::ptr response);
private:
    // 已经读到但还没有解析的字节
    std::string m_pending;
};
}

#endif //SHARDKV_HTTP_SESSION_H

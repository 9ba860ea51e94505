//
// Created by zavier on 2021/12/15.
//

#include <algorithm>
#include "shardkv/http/http_session.h"
#include "shardkv/http/parse.h"

namespace shardkv::http {
static auto g_logger = GetLogInstance();

HttpSession::HttpSession(Socket::ptr socket, bool owner)
    : SocketStream(socket, owner) {
}

HttpRequest::ptr HttpSession::recvRequest() {
    HttpRequestParser parser;
    std::string data = std::move(m_pending);
    m_pending.clear();
    std::string buffer(HttpRequestParser::GetHttpRequestBufferSize(), '\0');
    while (true) {
        if (!data.empty()) {
            // 未消费的字节被移动到开头
            size_t used = parser.execute(&data[0], data.size());
            data.resize(data.size() - used);
        }
        if (parser.isFinished() != 0) {
            break;
        }
        ssize_t n = read(&buffer[0], buffer.size());
        if (n <= 0) {
            close();
            return nullptr;
        }
        data.append(buffer.data(), n);
    }
    if (parser.hasError()) {
        SPDLOG_LOGGER_DEBUG(g_logger, "parse http request fail, error={}", parser.hasError());
        close();
        return nullptr;
    }
    uint64_t length = parser.getContentLength();
    if (length > HttpRequestParser::GetHttpRequestMaxBodySize()) {
        SPDLOG_LOGGER_WARN(g_logger, "http request body too large, length={}", length);
        close();
        return nullptr;
    }
    HttpRequest::ptr request = parser.getData();
    if (length > 0) {
        size_t have = std::min<uint64_t>(length, data.size());
        std::string body = data.substr(0, have);
        data.erase(0, have);
        body.resize(length);
        if (have < length && readFixSize(&body[have], length - have) <= 0) {
            close();
            return nullptr;
        }
        request->setBody(std::move(body));
    }
    m_pending = std::move(data);
    request->initParams();
    return request;
}

ssize_t HttpSession::sendResponse(HttpResponse::ptr response) {
    std::string str = response->toString();
    return writeFixSize(str.c_str(), str.size());
}

}

//
// Created by zavier on 2021/12/15.
//

#include "shardkv/net/socket_stream.h"

namespace shardkv {

SocketStream::SocketStream(Socket::ptr socket, bool owner)
    : m_socket(std::move(socket))
    , m_isOwner(owner){
}

SocketStream::~SocketStream() {
    if(m_socket && m_isOwner) {
        m_socket->close();
    }
}

ssize_t SocketStream::read(void *buffer, size_t length) {
    if (!isConnected()) {
        return -1;
    }
    return m_socket->recv(buffer, length);
}

ssize_t SocketStream::write(const void *buffer, size_t length) {
    if (!isConnected()) {
        return -1;
    }
    return m_socket->send(buffer, length);
}

void SocketStream::close() {
    if (m_socket) {
        m_socket->close();
    }
}

}

//
// Created by zavier on 2021/12/14.
//
#include <cstring>
#include "shardkv/common/config.h"
#include "shardkv/net/tcp_server.h"

namespace shardkv {
static auto g_logger = GetLogInstance();

static ConfigVar<uint64_t>::ptr g_tcp_server_recv_timeout =
        Config::Lookup<uint64_t>("tcp_server.recv_timeout",
                                 (uint64_t)(60 * 1000 * 2), "tcp server recv timeout");

TcpServer::TcpServer(co::Scheduler* worker)
    : m_worker(worker)
    , m_recvTimeout(g_tcp_server_recv_timeout->getValue()) {
}

TcpServer::~TcpServer() {
    stop();
}

bool TcpServer::bind(Address::ptr addr) {
    Socket::ptr sock = Socket::CreateTCP(addr);
    if (!sock->bind(addr) || !sock->listen()) {
        SPDLOG_LOGGER_ERROR(g_logger, "server {} bind {} fail", m_name, addr->toString());
        return false;
    }
    m_listen = sock;
    SPDLOG_LOGGER_INFO(g_logger, "server {} bind {} success", m_name, sock->toString());
    return true;
}

void TcpServer::start() {
    if (!m_listen || !m_stop) {
        return;
    }
    m_stop = false;
    go co_scheduler(m_worker) [this] {
        acceptLoop();
    };
}

void TcpServer::stop() {
    if (m_stop.exchange(true)) {
        return;
    }
    // 关闭监听 socket 让 accept 返回
    if (m_listen) {
        m_listen->close();
    }
}

Address::ptr TcpServer::getLocalAddress() const {
    return m_listen ? m_listen->getLocalAddress() : nullptr;
}

void TcpServer::acceptLoop() {
    Socket::ptr listen = m_listen;
    while (!isStop()) {
        Socket::ptr client = listen->accept();
        if (!client) {
            if (!isStop()) {
                SPDLOG_LOGGER_ERROR(g_logger, "accept fail, errno={} errstr={}", errno, strerror(errno));
            }
            continue;
        }
        client->setRecvTimeout(m_recvTimeout);
        go co_scheduler(m_worker) [client, this] {
            handleClient(client);
        };
    }
}

}

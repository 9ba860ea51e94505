//
// Created by zavier on 2021/12/6.
//
#include <cstring>
#include <netinet/tcp.h>
#include <libgo/netio/unix/hook.h>
#include <libgo/netio/unix/hook_helper.h>
#include "shardkv/net/socket.h"

namespace shardkv {
static auto g_logger = GetLogInstance();

Socket::ptr Socket::CreateTCP(Address::ptr address) {
    return std::make_shared<Socket>(address->getFamily());
}

Socket::Socket(int family)
        : m_family(family) {
}

Socket::~Socket() {
    close();
}

bool Socket::setOption(int level, int option, const void* value, socklen_t len) {
    if (setsockopt(m_fd, level, option, value, len)) {
        SPDLOG_LOGGER_ERROR(g_logger, "setsockopt fd={} level={} option={} errno={} errstr={}",
                            m_fd, level, option, errno, strerror(errno));
        return false;
    }
    return true;
}

void Socket::setRecvTimeout(uint64_t timeout_ms) {
    timeval tv{(time_t)(timeout_ms / 1000), (suseconds_t)(timeout_ms % 1000 * 1000)};
    setOption(SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void Socket::setSendTimeout(uint64_t timeout_ms) {
    timeval tv{(time_t)(timeout_ms / 1000), (suseconds_t)(timeout_ms % 1000 * 1000)};
    setOption(SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool Socket::ensureFd() {
    if (isValid()) {
        return true;
    }
    m_fd = ::socket(m_family, SOCK_STREAM, 0);
    if (m_fd == -1) [[unlikely]] {
        SPDLOG_LOGGER_ERROR(g_logger, "socket(family={}) errno={} errstr={}", m_family, errno, strerror(errno));
        return false;
    }
    int val = 1;
    setOption(SOL_SOCKET, SO_REUSEADDR, &val, sizeof(val));
    setOption(IPPROTO_TCP, TCP_NODELAY, &val, sizeof(val));
    return true;
}

bool Socket::attach(int fd) {
    // 必须是被 libgo hook 管理的 socket
    co::FdContextPtr ctx = co::HookHelper::getInstance().GetFdContext(fd);
    if (!ctx || !ctx->IsSocket()) {
        return false;
    }
    m_fd = fd;
    m_connected = true;
    int val = 1;
    setOption(IPPROTO_TCP, TCP_NODELAY, &val, sizeof(val));
    getLocalAddress();
    getRemoteAddress();
    return true;
}

Socket::ptr Socket::accept() {
    int fd = ::accept(m_fd, nullptr, nullptr);
    if (fd < 0) {
        return nullptr;
    }
    auto client = std::make_shared<Socket>(m_family);
    if (client->attach(fd)) {
        return client;
    }
    ::close(fd);
    return nullptr;
}

bool Socket::bind(Address::ptr address) {
    if (m_family != address->getFamily()) [[unlikely]] {
        SPDLOG_LOGGER_ERROR(g_logger, "bind family mismatch, socket family={}, address={}",
                            m_family, address->toString());
        return false;
    }
    if (!ensureFd()) {
        return false;
    }
    if (::bind(m_fd, address->getAddr(), address->getAddrLen())) {
        SPDLOG_LOGGER_ERROR(g_logger, "bind {} fail, errno={} errstr={}", address->toString(), errno, strerror(errno));
        return false;
    }
    getLocalAddress();
    return true;
}

bool Socket::connect(Address::ptr address, uint64_t timeout_ms) {
    if (m_family != address->getFamily() || !ensureFd()) [[unlikely]] {
        return false;
    }
    if (timeout_ms != (uint64_t)-1 && !co::setTcpConnectTimeout(m_fd, timeout_ms)) {
        close();
        return false;
    }
    if (::connect(m_fd, address->getAddr(), address->getAddrLen())) {
        SPDLOG_LOGGER_TRACE(g_logger, "connect {} fail, errno={} errstr={}", address->toString(), errno, strerror(errno));
        close();
        return false;
    }
    m_connected = true;
    m_remoteAddress = address;
    getLocalAddress();
    return true;
}

bool Socket::listen(int backlog) {
    if (!isValid()) [[unlikely]] {
        SPDLOG_LOGGER_ERROR(g_logger, "listen on an unbound socket");
        return false;
    }
    if (::listen(m_fd, backlog)) {
        SPDLOG_LOGGER_ERROR(g_logger, "listen fail, errno={} errstr={}", errno, strerror(errno));
        return false;
    }
    return true;
}

void Socket::close() {
    m_connected = false;
    if (m_fd != -1) {
        ::close(m_fd);
        m_fd = -1;
    }
}

ssize_t Socket::send(const void* buffer, size_t length) {
    if (!m_connected) {
        return -1;
    }
    return ::send(m_fd, buffer, length, MSG_NOSIGNAL);
}

ssize_t Socket::recv(void* buffer, size_t length) {
    if (!m_connected) {
        return -1;
    }
    return ::recv(m_fd, buffer, length, 0);
}

Address::ptr Socket::queryAddress(bool peer) {
    sockaddr_storage storage{};
    socklen_t len = sizeof(storage);
    auto addr = reinterpret_cast<sockaddr*>(&storage);
    int rt = peer ? getpeername(m_fd, addr, &len) : getsockname(m_fd, addr, &len);
    if (rt) {
        return nullptr;
    }
    return Address::Create(addr, len);
}

Address::ptr Socket::getLocalAddress() {
    if (!m_localAddress) {
        m_localAddress = queryAddress(false);
    }
    return m_localAddress;
}

Address::ptr Socket::getRemoteAddress() {
    if (!m_remoteAddress) {
        m_remoteAddress = queryAddress(true);
    }
    return m_remoteAddress;
}

std::string Socket::toString() const {
    return fmt::format("[socket fd={} connected={} local={} remote={}]", m_fd, m_connected,
                       m_localAddress ? m_localAddress->toString() : "-",
                       m_remoteAddress ? m_remoteAddress->toString() : "-");
}

}

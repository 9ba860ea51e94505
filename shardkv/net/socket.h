//
// Created by zavier on 2021/12/6.
//

#ifndef SHARDKV_SOCKET_H
#define SHARDKV_SOCKET_H
#include <memory>
#include <sys/socket.h>
#include "shardkv/common/noncopyable.h"
#include "address.h"
namespace shardkv {
/**
 * @brief TCP 套接字，读写都走 libgo 的 hook，在协程里调用时不会阻塞线程
 */
class Socket : public std::enable_shared_from_this<Socket>, Noncopyable {
public:
    using ptr = std::shared_ptr<Socket>;

    /**
     * @brief 创建和 address 同一协议族的 TCP 套接字，fd 在 bind 或 connect 时才分配
     */
    static Socket::ptr CreateTCP(Address::ptr address);

    explicit Socket(int family);
    ~Socket();

    /// 超时时间单位为毫秒
    void setRecvTimeout(uint64_t timeout_ms);
    void setSendTimeout(uint64_t timeout_ms);

    Socket::ptr accept();
    bool bind(Address::ptr address);
    bool connect(Address::ptr address, uint64_t timeout_ms = -1);
    bool listen(int backlog = SOMAXCONN);
    void close();

    /**
     * @return >0 发送的字节数，=0 对端关闭，<0 出错
     */
    ssize_t send(const void* buffer, size_t length);
    /**
     * @return >0 接收的字节数，=0 对端关闭，<0 出错
     */
    ssize_t recv(void* buffer, size_t length);

    Address::ptr getLocalAddress();
    Address::ptr getRemoteAddress();

    bool isConnected() const { return m_connected;}
    bool isValid() const { return m_fd != -1;}
    int getFd() const { return m_fd;}

    std::string toString() const;

private:
    bool attach(int fd);
    bool ensureFd();
    bool setOption(int level, int option, const void* value, socklen_t len);
    Address::ptr queryAddress(bool peer);
private:
    int m_fd = -1;
    int m_family;
    bool m_connected = false;
    Address::ptr m_localAddress;
    Address::ptr m_remoteAddress;
};

}
#endif //SHARDKV_SOCKET_H

//
// Created by zavier on 2021/12/14.
//

#ifndef SHARDKV_TCP_SERVER_H
#define SHARDKV_TCP_SERVER_H

#include <atomic>
#include <libgo/libgo.h>
#include "socket.h"

namespace shardkv {

/**
 * @brief TCP 服务器，一个 accept 协程，每个连接一个处理协程
 */
class TcpServer {
public:
    explicit TcpServer(co::Scheduler* worker = &co_sched);
    virtual ~TcpServer();

    bool bind(Address::ptr addr);
    // 不阻塞，调度器由调用方启动
    void start();
    void stop();

    void setRecvTimeout(uint64_t timeout) { m_recvTimeout = timeout;}

    const std::string& getName() const { return m_name;}
    virtual void setName(const std::string& name) { m_name = name;}

    bool isStop() const { return m_stop;}
    Address::ptr getLocalAddress() const;

protected:
    virtual void handleClient(Socket::ptr client) = 0;
private:
    void acceptLoop();
private:
    co::Scheduler* m_worker;
    Socket::ptr m_listen;
    uint64_t m_recvTimeout;
    std::string m_name = "shardkv/1.0.0";
    std::atomic_bool m_stop{true};
};

}
#endif //SHARDKV_TCP_SERVER_H

//
// Created by zavier on 2021/12/6.
//

#ifndef SHARDKV_ADDRESS_H
#define SHARDKV_ADDRESS_H
#include <memory>
#include <string>
#include <sys/socket.h>
#include <netinet/in.h>
#include "shardkv/common/util.h"
namespace shardkv {

/**
 * @brief IPv4 或 IPv6 的套接字地址，节点之间只走 TCP
 */
class Address {
public:
    using ptr = std::shared_ptr<Address>;

    /**
     * @brief 解析 host[:port]，支持 [ipv6]:port 形式，host 可以是域名
     * @param host 举例: 127.0.0.1:8011、localhost:3000、[::1]:8011
     * @param defaultPort host 里没有端口时使用
     * @param family 没有方括号时使用的协议族
     * @return 解析失败返回 nullptr
     */
    static Address::ptr Resolve(const std::string& host, uint16_t defaultPort = 0, int family = AF_INET);
    static Address::ptr Create(const sockaddr* addr, socklen_t addrlen);

    explicit Address(int family = AF_INET);

    int getFamily() const { return m_addr.ss_family;}
    const sockaddr* getAddr() const { return reinterpret_cast<const sockaddr*>(&m_addr);}
    sockaddr* getAddr() { return reinterpret_cast<sockaddr*>(&m_addr);}
    socklen_t getAddrLen() const;

    uint16_t getPort() const;
    void setPort(uint16_t port);

    std::string toString() const;

    bool operator==(const Address& rhs) const;
    bool operator!=(const Address& rhs) const { return !(*this == rhs);}
private:
    sockaddr_storage m_addr{};
};

}
#endif //SHARDKV_ADDRESS_H

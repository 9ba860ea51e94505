//
// Created by zavier on 2023/1/12.
//

#ifndef SHARDKV_NODE_CLIENT_H
#define SHARDKV_NODE_CLIENT_H

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "shardkv/http/http_connection.h"

namespace shardkv::router {
using Json = nlohmann::json;

/**
 * @brief 节点对一次请求的回复
 */
struct NodeReply {
    enum Status {
        // 收到了节点的 http 响应
        OK,
        // 连接失败、超时等传输错误
        UNREACHABLE,
    };
    Status status = OK;
    uint32_t httpStatus = 0;
    Json body;
    std::string error;

    bool reachable() const { return status == OK;}
    bool success() const;
    /**
     * @brief 节点回复 "This node is not the leader"
     */
    bool notLeader() const;
    std::string toString() const;
};

/**
 * @brief 访问单个节点的客户端
 */
class NodeClient {
public:
    using ptr = std::shared_ptr<NodeClient>;
    explicit NodeClient(const std::string& address) : m_address(address) {}
    virtual ~NodeClient() = default;

    virtual NodeReply put(const std::string& key, const std::string& value, uint64_t timeout_ms) = 0;
    virtual NodeReply get(const std::string& key, uint64_t timeout_ms) = 0;
    virtual NodeReply del(const std::string& key, uint64_t timeout_ms) = 0;
    /**
     * @brief GET /raft/status
     */
    virtual NodeReply status(uint64_t timeout_ms) = 0;

    const std::string& getAddress() const { return m_address;}
protected:
    std::string m_address;
};

using NodeClientFactory = std::function<NodeClient::ptr(const std::string& address)>;

/**
 * @brief 基于 http 连接池的节点客户端
 */
class HttpNodeClient : public NodeClient {
public:
    using ptr = std::shared_ptr<HttpNodeClient>;
    explicit HttpNodeClient(const std::string& address);

    NodeReply put(const std::string& key, const std::string& value, uint64_t timeout_ms) override;
    NodeReply get(const std::string& key, uint64_t timeout_ms) override;
    NodeReply del(const std::string& key, uint64_t timeout_ms) override;
    NodeReply status(uint64_t timeout_ms) override;

    static NodeClient::ptr Create(const std::string& address) {
        return std::make_shared<HttpNodeClient>(address);
    }
private:
    NodeReply toReply(const http::HttpResult::ptr& result);
    NodeReply request(http::HttpMethod method, const std::string& path, uint64_t timeout_ms, const Json& body);
private:
    http::HttpConnectionPool::ptr m_pool;
};

}
#endif //SHARDKV_NODE_CLIENT_H

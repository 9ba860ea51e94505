//
// Created by zavier on 2023/1/12.
//

#ifndef SHARDKV_ROUTER_H
#define SHARDKV_ROUTER_H

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <vector>
#include <libgo/libgo.h>
#include "node_client.h"

namespace shardkv::router {

enum class RouterError {
    OK,
    // 重试后仍然没有节点报告自己是 leader
    NO_LEADER,
    // 所有尝试的节点都无法连接
    UNREACHABLE,
};

std::string RouterErrorToString(RouterError err);

struct RouterResult {
    RouterError error = RouterError::OK;
    // error 为 OK 时为节点的原始回复，节点的错误原样透传
    NodeReply reply;
    // 处理请求的节点
    std::string node;
    std::string toString() const;
};

/**
 * @brief 找到 leader 并转发写请求，读请求在节点间轮询
 */
class Router {
public:
    using ptr = std::shared_ptr<Router>;
    using MutexType = co::co_mutex;
    using Operation = std::function<NodeReply(NodeClient::ptr client, uint64_t timeout_ms)>;

    explicit Router(const std::vector<std::string>& nodes, NodeClientFactory factory = HttpNodeClient::Create);

    RouterResult put(const std::string& key, const std::string& value);
    RouterResult get(const std::string& key);
    RouterResult del(const std::string& key);
    /**
     * @brief 节点列表、缓存的 leader 和 shard 数量
     */
    Json status();
    /**
     * @brief 查询所有节点的 /raft/status，返回第一个报告自己是 Leader 的节点，并更新缓存
     */
    std::optional<std::string> discoverLeader();

    std::string getCachedLeader();
    /**
     * @brief 只接受节点列表里的地址
     */
    bool setCachedLeader(const std::string& leader);
    const std::vector<std::string>& getNodes() const { return m_nodes;}
    /**
     * @brief 发起过的 leader 发现次数
     */
    uint64_t getDiscoveryRounds() const { return m_discoveryRounds;}
private:
    /**
     * @brief 先尝试缓存的 leader，失败后重新发现 leader，最多 router.discovery.retries 轮
     */
    RouterResult write(const Operation& op);
    RouterResult read(const Operation& op);
    NodeClient::ptr getClient(const std::string& address);
    /**
     * @brief 缓存仍然是 leader 时才清除，避免覆盖其它协程发现的新 leader
     */
    void invalidateLeader(const std::string& leader);
private:
    MutexType m_mutex;
    std::vector<std::string> m_nodes;
    std::map<std::string, NodeClient::ptr> m_clients;
    std::string m_leader;
    // leader 所在成员配置的大小
    int64_t m_shardCount = 0;
    std::atomic<uint64_t> m_next{0};
    std::atomic<uint64_t> m_discoveryRounds{0};
};

}
#endif //SHARDKV_ROUTER_H

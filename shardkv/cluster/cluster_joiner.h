//
// Created by zavier on 2023/1/10.
//

#ifndef SHARDKV_CLUSTER_JOINER_H
#define SHARDKV_CLUSTER_JOINER_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shardkv::cluster {

/**
 * @brief 非 bootstrap 节点启动后，向已有集群请求把自己加入为投票者，直到自己出现在成员配置里
 */
struct JoinReply {
    bool success = false;
    // 对方不是 leader 时返回的 leader 地址
    std::string leader;
};

class ClusterJoiner : public std::enable_shared_from_this<ClusterJoiner> {
public:
    using ptr = std::shared_ptr<ClusterJoiner>;
    /**
     * @brief 向 target 发送一次加入请求
     */
    using Requester = std::function<JoinReply(const std::string& target, int64_t id, const std::string& address, uint64_t timeout_ms)>;
    /**
     * @brief 返回自己是否已经在提交的成员配置里
     */
    using MembershipProbe = std::function<bool()>;

    ClusterJoiner(int64_t id, const std::string& address, std::vector<std::string> targets,
                  MembershipProbe joined, Requester requester = HttpJoin);
    /**
     * @brief 在协程里重试加入，间隔为 cluster.join.interval
     */
    void start();
    void stop();
    bool isJoined() const { return m_joined;}
    /**
     * @brief 尝试一轮所有的 target，跳过自己，每个 target 最多跟随一次 leader 提示
     */
    bool tryOnce();

    /**
     * @brief POST /raft/join
     */
    static JoinReply HttpJoin(const std::string& target, int64_t id, const std::string& address, uint64_t timeout_ms);
private:
    bool request(const std::string& target);
private:
    int64_t m_id;
    std::string m_address;
    std::vector<std::string> m_targets;
    MembershipProbe m_probe;
    Requester m_requester;
    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_joined{false};
};

}
#endif //SHARDKV_CLUSTER_JOINER_H

//
// Created by zavier on 2023/1/8.
//

#ifndef SHARDKV_LEADER_BROADCASTER_H
#define SHARDKV_LEADER_BROADCASTER_H

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "shardkv/common/util.h"
#include "shardkv/raft/raft_node.h"
#include "known_peers.h"

namespace shardkv::cluster {

/**
 * @brief 广播的 leader 信息，即 /newleader 的请求体
 */
struct LeaderInfo {
    int64_t shardId = 0;
    std::string address;
    std::optional<int64_t> term;
    std::string toString() const;
};

/**
 * @brief leader 变化时把自己的地址推送给所有已知的 shard
 * @details 推送是单向的，失败只记录日志。收到的信息只有在 KnownPeers 发生变化时才会继续转发，
 * 以此限制传播的范围
 */
class LeaderBroadcaster : public std::enable_shared_from_this<LeaderBroadcaster> {
public:
    using ptr = std::shared_ptr<LeaderBroadcaster>;
    /**
     * @brief 把 info 推送给 peer，返回是否成功
     */
    using Pusher = std::function<bool(const std::string& peer, const LeaderInfo& info, uint64_t timeout_ms)>;
    using StateProbe = std::function<std::pair<raft::RaftState, int64_t>()>;

    LeaderBroadcaster(int64_t shardId, const std::string& address, KnownPeers::ptr peers, Pusher pusher = HttpPush);
    ~LeaderBroadcaster();
    /**
     * @brief 订阅 raft 的状态变更
     */
    void attach(const raft::RaftNode::ptr& raft);
    /**
     * @brief 引擎不提供订阅时，按 cluster.observer.interval 轮询状态
     */
    void poll(StateProbe probe);
    void stop();
    /**
     * @brief 向除了自己以外的所有已知 shard 推送 info，不阻塞
     */
    void broadcast(const LeaderInfo& info);
    /**
     * @brief 处理 /addshard 和 /newleader，KnownPeers 变化时转发
     */
    MergeResult receive(const LeaderInfo& info);
    /**
     * @brief 状态变为 Leader 时广播自己
     */
    void onStateChange(raft::RaftState state, int64_t term);

    KnownPeers::ptr getKnownPeers() const { return m_peers;}
    static uint64_t GetBroadcastTimeout();
    /**
     * @brief 以 json 格式 POST 到 peer 的 /newleader
     */
    static bool HttpPush(const std::string& peer, const LeaderInfo& info, uint64_t timeout_ms);
private:
    int64_t m_shardId;
    std::string m_address;
    KnownPeers::ptr m_peers;
    Pusher m_pusher;
    CycleTimerTocken m_pollTimer;
    // 轮询时上一次观察到的状态
    raft::RaftState m_lastState = raft::Follower;
    int64_t m_lastTerm = -1;
    std::atomic<bool> m_stop{false};
};

}
#endif //SHARDKV_LEADER_BROADCASTER_H

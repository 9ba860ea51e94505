//
// Created by zavier on 2022/6/13.
//

#ifndef SHARDKV_RAFT_NODE_H
#define SHARDKV_RAFT_NODE_H

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <vector>
#include <libgo/libgo.h>
#include "shardkv/common/util.h"
#include "configuration.h"
#include "raft_log.h"
#include "raft_peer.h"
#include "snapshot.h"
#include "state_machine.h"

namespace shardkv::raft {
/**
 * @brief Raft 的状态
 */
enum RaftState {
    Follower,   // 追随者
    Candidate,  // 候选人
    Leader      // 领导者
};

std::string RaftStateToString(RaftState state);

enum class RaftError {
    OK,
    NOT_LEADER,
    TIMEOUT,
    // 提交前失去了领导权，日志可能已经或者将会被提交
    LEADERSHIP_LOST,
    SHUTDOWN,
    // 还有未提交的成员变更
    CONFIG_IN_PROGRESS,
    UNKNOWN_SERVER,
    ALREADY_MEMBER,
};

std::string RaftErrorToString(RaftError err);

struct ApplyResult {
    RaftError error = RaftError::OK;
    // 状态机 apply 的返回值
    std::string response;
    // 日志的索引，未追加时为 0
    int64_t index = 0;
};

struct RaftStats {
    RaftState state = Follower;
    int64_t term = 0;
    int64_t leaderId = -1;
    std::string leaderAddress;
    int64_t commitIndex = 0;
    int64_t appliedIndex = 0;
    int64_t lastLogIndex = 0;
    int64_t lastLogTerm = 0;
    int64_t lastSnapshotIndex = 0;
    // 除自己外的成员数量
    int64_t numPeers = 0;
    Configuration configuration;
};

/**
 * @brief Raft 节点，处理 rpc 请求，并改变状态，通过 RaftPeer 调用远端 Raft 节点，
 * 已提交的日志由 applier 协程按顺序交给 StateMachine
 * @note 必须通过 std::make_shared 创建
 */
class RaftNode : public std::enable_shared_from_this<RaftNode> {
public:
    using ptr = std::shared_ptr<RaftNode>;
    using MutexType = co::co_mutex;
    using LeadershipObserver = std::function<void(RaftState state, int64_t term)>;

    /**
     * Create a Raft server
     * @param id 当前 raft 节点在集群内的唯一标识
     * @param address 当前节点对外的地址，写入成员配置
     * @param persister raft 保存其持久状态的地方，并且从保存的状态初始化当前节点
     * @param fsm 状态机
     * @param factory 用于创建远端节点
     */
    RaftNode(int64_t id, std::string address, Persister::ptr persister,
             StateMachine::ptr fsm, PeerFactory factory = HttpRaftPeer::Create);

    ~RaftNode();
    /**
     * @brief 启动 raft，从持久化状态和快照恢复
     */
    void start();
    void stop();
    bool isStop();
    /**
     * @brief 没有任何状态时把 configuration 写为第一条日志并直接提交
     * @return 已有状态时返回 false
     */
    bool bootstrap(const Configuration& configuration);
    /**
     * @brief 提交一条命令，阻塞到日志被 apply 或超时
     */
    ApplyResult apply(const std::string& data, uint64_t timeout_ms);
    /**
     * @brief 增加投票者，阻塞到变更被 apply 或超时
     */
    RaftError addVoter(int64_t id, const std::string& address, uint64_t timeout_ms);
    /**
     * @brief 删除成员，leader 删除自己时在变更提交后退位
     */
    RaftError removeServer(int64_t id, uint64_t timeout_ms);
    /**
     * @brief 状态变更时回调，在锁外调用
     */
    void addLeadershipObserver(LeadershipObserver cb);
    /**
     * @brief 处理远端 raft 节点的投票请求
     */
    RequestVoteReply handleRequestVote(RequestVoteArgs request);
    /**
     * @brief 处理远端 raft 节点的日志追加请求
     */
    AppendEntriesReply handleAppendEntries(AppendEntriesArgs request);
    /**
     * @brief 处理远端 raft 节点的快照安装请求
     */
    InstallSnapshotReply handleInstallSnapshot(InstallSnapshotArgs request);

    bool isLeader();
    RaftState state();
    int64_t term();
    /**
     * @brief 当前 leader 的地址，选举期间为空
     */
    std::string leader();
    int64_t leaderId();
    /**
     * @brief 最新的成员配置，可能还未提交
     */
    Configuration getConfiguration();
    /**
     * @brief 已经提交的最新成员配置
     */
    Configuration committedConfiguration();
    RaftStats stats();

    int64_t getNodeId() const { return m_id;}
    const std::string& getAddress() const { return m_address;}
    /**
     * @brief 输出 Raft 节点状态
     */
    std::string toString();
    /**
     * @brief 获取心跳超时时间
     */
    static uint64_t GetStableHeartbeatTimeout();
    /**
     * @brief 获取随机选举时间
     */
    static uint64_t GetRandomizedElectionTimeout();
private:
    struct Waiter {
        int64_t term;
        co::co_chan<ApplyResult> chan;
    };
    /**
     * @brief 转化为 Follower
     * @param[in] term 任期
     * @param[in] leaderId 任期领导人id，如果还未选举出来默认为-1
     */
    void becomeFollower(int64_t term, int64_t leaderId = -1);
    void becomeCandidate();
    void becomeLeader();
    /**
     * @brief 重置选举定时器
     */
    void rescheduleElection();
    /**
     * @brief 重置心跳定时器
     */
    void resetHeartbeatTimer();
    /**
     * @brief 对一个节点发起复制请求
     */
    void replicateOneRound(int64_t peer);
    /**
     * @brief 发送快照或者日志，调用前后都持有锁，rpc 期间释放
     */
    void sendSnapshot(std::unique_lock<MutexType>& lock, int64_t peerId);
    void sendEntries(std::unique_lock<MutexType>& lock, int64_t peerId);
    /**
     * @brief 检查复制请求的响应是否还有效，发现更大的任期时退位
     */
    bool acceptReply(int64_t requestTerm, int64_t replyTerm, int64_t replyLeader, int64_t peerId);
    /**
     * @brief 对方已经拥有 match 及之前的日志
     */
    void updateProgress(int64_t peerId, int64_t match);
    /**
     * @brief 收到 leader 的 AppendEntries/InstallSnapshot 时更新任期和 leader，请求过期时返回 false
     */
    bool acceptLeader(int64_t term, int64_t leaderId, const std::string& leaderAddress);
    /**
     * @brief 把提交的日志交给状态机，并唤醒等待的调用者
     */
    void applier();
    /**
     * @brief 按顺序在锁外通知状态变更
     */
    void notifier();
    /**
     * @brief 开始选举，发起异步投票
     */
    void startElection();
    /**
     * @brief 广播心跳
     */
    void broadcastHeartbeat();
    /**
     * @brief 持久化，内部调用，不加锁，状态没有变化时不写盘
     */
    void persist(Snapshot::ptr snap = nullptr);
    /**
     * @brief 追加一条日志，不加锁
     */
    Entry Propose(EntryType type, const std::string& data);
    /**
     * @brief 根据 matchIndex 计算多数派已复制的位置并推进 commit
     */
    void maybeAdvanceCommit();
    /**
     * @brief commit 推进后的检查，leader 被移出集群时退位
     */
    void onCommitted();
    /**
     * @brief 从日志或快照中重新加载最新的成员配置，并同步远端节点
     */
    void reloadConfiguration();
    void syncPeers();
    /**
     * @brief 日志过大时创建快照并压缩日志
     */
    void maybeSnapshot(std::unique_lock<MutexType>& lock);
    /**
     * @brief 等待日志被 apply
     */
    ApplyResult waitApplied(int64_t index, co::co_chan<ApplyResult> chan, uint64_t timeout_ms);
    /**
     * @brief 唤醒所有等待者，只保留 index 不超过 keepIndex 的
     */
    void failWaiters(RaftError err, int64_t keepIndex);
    /**
     * @brief 追加成员变更日志，调用前持有锁，返回前释放锁
     */
    RaftError proposeConfiguration(std::unique_lock<MutexType>& lock, const Configuration& conf, uint64_t timeout_ms);

private:
    MutexType m_mutex;
    bool m_stop = false;
    bool m_started = false;
    // 节点状态，初始为 Follower
    RaftState m_state = Follower;
    // 该 raft 节点的唯一id
    const int64_t m_id;
    const std::string m_address;
    // 任期内的 leader id，用于 follower 返回给客户端让客户端重定向请求到leader，-1表示无leader
    int64_t m_leaderId = -1;
    std::string m_leaderAddress;
    // 服务器已知最新的任期（在服务器首次启动时初始化为0，单调递增）
    int64_t m_currentTerm = 0;
    // 当前任期内收到选票的 candidateId，如果没有投给任何候选人 则为-1
    int64_t m_votedFor = -1;
    // 日志条目，每个条目包含了用于状态机的命令，以及领导人接收到该条目时的任期（初始索引为1）
    RaftLog m_logs;
    // 最新的成员配置以及它所在的日志索引
    Configuration m_configuration;
    int64_t m_configIndex = 0;
    // 最近一次快照里的成员配置
    Configuration m_snapshotConfiguration;
    // 远端的 raft 节点，id 到节点的映射
    std::map<int64_t, RaftPeer::ptr> m_peers;
    PeerFactory m_peerFactory;
    // 对于每一台服务器，发送到该服务器的下一个日志条目的索引（初始值为领导人最后的日志条目的索引+1）
    std::map<int64_t, int64_t> m_nextIndex;
    // 对于每一台服务器，已知的已经复制到该服务器的最高日志条目的索引（初始值为0，单调递增）
    std::map<int64_t, int64_t> m_matchIndex;
    // 选举定时器，超时后节点将转换为候选人发起投票
    CycleTimerTocken m_electionTimer;
    // 心跳定时器，领导者定时发送日志维持心跳，和同步日志
    CycleTimerTocken m_heartbeatTimer;
    // 持久化
    Persister::ptr m_persister;
    HardState m_persistedState;
    StateMachine::ptr m_fsm;
    co::co_condition_variable m_applyCond;
    // 等待 install 的快照
    Snapshot::ptr m_pendingSnapshot;
    // 日志索引到等待者
    std::map<int64_t, Waiter> m_waiters;
    std::vector<LeadershipObserver> m_observers;
    std::deque<std::pair<RaftState, int64_t>> m_transitions;
    co::co_condition_variable m_notifyCond;
};

}
#endif //SHARDKV_RAFT_NODE_H

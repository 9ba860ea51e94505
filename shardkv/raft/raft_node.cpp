//
// Created by zavier on 2022/6/20.
//

#include <algorithm>
#include <cstdlib>
#include <random>
#include <utility>
#include "shardkv/common/config.h"
#include "raft_node.h"

namespace shardkv::raft {
static auto g_logger = GetLogInstance();

static ConfigVar<uint64_t>::ptr g_timer_election_base =
        Config::Lookup<uint64_t>("raft.timer.election.base", 1500, "raft election timeout(ms) base");
static ConfigVar<uint64_t>::ptr g_timer_election_top =
        Config::Lookup<uint64_t>("raft.timer.election.top", 3000, "raft election timeout(ms) top");
static ConfigVar<uint64_t>::ptr g_timer_heartbeat =
        Config::Lookup<uint64_t>("raft.timer.heartbeat", 300, "raft heartbeat timeout(ms)");
static ConfigVar<uint64_t>::ptr g_snapshot_threshold =
        Config::Lookup<uint64_t>("raft.snapshot.threshold", 64 * 1024,
                                 "raft state size(bytes) that triggers a snapshot, 0 means never");

// 一次 AppendEntries 最多携带的日志数量
static constexpr int64_t MAX_ENTRIES_PER_APPEND = 1000;

std::string RaftStateToString(RaftState state) {
    switch (state) {
        case Follower: return "Follower";
        case Candidate: return "Candidate";
        case Leader: return "Leader";
    }
    return "Unknown";
}

std::string RaftErrorToString(RaftError err) {
    switch (err) {
        case RaftError::OK: return "OK";
        case RaftError::NOT_LEADER: return "Not Leader";
        case RaftError::TIMEOUT: return "Timeout";
        case RaftError::LEADERSHIP_LOST: return "Leadership Lost";
        case RaftError::SHUTDOWN: return "Shutdown";
        case RaftError::CONFIG_IN_PROGRESS: return "Configuration Change In Progress";
        case RaftError::UNKNOWN_SERVER: return "Unknown Server";
        case RaftError::ALREADY_MEMBER: return "Already Member";
    }
    return "Unexpect Error";
}

RaftNode::RaftNode(int64_t id, std::string address, Persister::ptr persister,
                   StateMachine::ptr fsm, PeerFactory factory)
        : m_id(id)
        , m_address(TrimScheme(address))
        , m_logs(persister, MAX_ENTRIES_PER_APPEND)
        , m_peerFactory(std::move(factory))
        , m_persister(std::move(persister))
        , m_fsm(std::move(fsm)) {
}

RaftNode::~RaftNode() {
    stop();
}

void RaftNode::start() {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_started || m_stop) {
        return;
    }
    m_started = true;

    auto hs = m_persister->loadHardState();
    if (hs) {
        // 恢复崩溃前的状态
        m_currentTerm = hs->term;
        m_votedFor = hs->vote;
        m_persistedState = *hs;
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] initialize from state persisted before a crash, term {}, vote {}, commit {}",
                           m_id, hs->term, hs->vote, hs->commit);
    }

    auto snap = m_persister->loadSnapshot();
    if (snap && !snap->empty()) {
        const int64_t snap_index = snap->metadata.index;
        const int64_t snap_term = snap->metadata.term;
        // 快照先于状态落盘，崩溃后快照可能比日志更新
        if (snap_index > m_logs.lastSnapshotIndex()) {
            if (m_logs.matchLog(snap_index, snap_term)) {
                m_logs.compact(snap_index);
            } else {
                m_logs.clearEntries(snap_index, snap_term);
            }
            m_logs.commitTo(snap_index);
        } else if (snap_index < m_logs.lastSnapshotIndex()) {
            // 日志已经压缩到快照之后，恢复快照会让状态机落后于 applied
            SPDLOG_LOGGER_CRITICAL(g_logger, "Node[{}] snapshot index {} is older than log offset {}",
                                   m_id, snap_index, m_logs.lastSnapshotIndex());
            exit(EXIT_FAILURE);
        }
        m_snapshotConfiguration = snap->metadata.configuration;
        if (!m_fsm->restore(snap->data)) {
            SPDLOG_LOGGER_CRITICAL(g_logger, "Node[{}] restore snapshot [index: {}, term: {}] fail",
                                   m_id, snap_index, snap_term);
        }
        if (snap_index > m_logs.applied()) {
            m_logs.appliedTo(snap_index);
        }
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] restored snapshot [index: {}, term: {}]", m_id, snap_index, snap_term);
    }

    reloadConfiguration();
    persist();
    rescheduleElection();

    auto self = shared_from_this();
    go [self] {
        self->applier();
    };
    go [self] {
        self->notifier();
    };
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] started, state is {}, configuration is {}",
                       m_id, toString(), m_configuration.toString());
}

void RaftNode::stop() {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_stop) {
        return;
    }
    m_stop = true;
    m_heartbeatTimer.stop();
    m_electionTimer.stop();
    failWaiters(RaftError::SHUTDOWN, 0);
    m_applyCond.notify_all();
    m_notifyCond.notify_all();
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] stopped", m_id);
}

bool RaftNode::isStop() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_stop;
}

bool RaftNode::bootstrap(const Configuration& configuration) {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_logs.lastIndex() != 0 || m_currentTerm != 0) {
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] already has state, skip bootstrap", m_id);
        return false;
    }
    if (configuration.empty()) {
        SPDLOG_LOGGER_ERROR(g_logger, "Node[{}] can not bootstrap with an empty configuration", m_id);
        return false;
    }
    Entry ent{.index = 1, .term = 1, .type = EntryType::CONFIGURATION, .data = configuration.encode()};
    m_logs.append(ent);
    m_currentTerm = 1;
    m_logs.commitTo(1);
    reloadConfiguration();
    persist();
    m_applyCond.notify_one();
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] bootstrapped with configuration {}", m_id, configuration.toString());
    return true;
}

ApplyResult RaftNode::apply(const std::string& data, uint64_t timeout_ms) {
    co::co_chan<ApplyResult> chan(1);
    int64_t index;
    {
        std::unique_lock<MutexType> lock(m_mutex);
        if (m_stop) {
            return {.error = RaftError::SHUTDOWN};
        }
        if (m_state != Leader) {
            return {.error = RaftError::NOT_LEADER};
        }
        Entry ent = Propose(EntryType::NORMAL, data);
        index = ent.index;
        m_waiters.emplace(index, Waiter{ent.term, chan});
    }
    return waitApplied(index, chan, timeout_ms);
}

RaftError RaftNode::addVoter(int64_t id, const std::string& address, uint64_t timeout_ms) {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_stop) {
        return RaftError::SHUTDOWN;
    }
    if (m_state != Leader) {
        return RaftError::NOT_LEADER;
    }
    if (m_configIndex > m_logs.committed()) {
        return RaftError::CONFIG_IN_PROGRESS;
    }
    Configuration conf = m_configuration;
    if (!conf.addVoter(id, TrimScheme(address))) {
        return RaftError::ALREADY_MEMBER;
    }
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] adds voter Node[{}] at {} in term {}", m_id, id, address, m_currentTerm);
    return proposeConfiguration(lock, conf, timeout_ms);
}

RaftError RaftNode::removeServer(int64_t id, uint64_t timeout_ms) {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_stop) {
        return RaftError::SHUTDOWN;
    }
    if (m_state != Leader) {
        return RaftError::NOT_LEADER;
    }
    if (m_configIndex > m_logs.committed()) {
        return RaftError::CONFIG_IN_PROGRESS;
    }
    Configuration conf = m_configuration;
    if (!conf.removeServer(id)) {
        return RaftError::UNKNOWN_SERVER;
    }
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] removes Node[{}] in term {}", m_id, id, m_currentTerm);
    return proposeConfiguration(lock, conf, timeout_ms);
}

RaftError RaftNode::proposeConfiguration(std::unique_lock<MutexType>& lock, const Configuration& conf, uint64_t timeout_ms) {
    co::co_chan<ApplyResult> chan(1);
    Entry ent = Propose(EntryType::CONFIGURATION, conf.encode());
    m_waiters.emplace(ent.index, Waiter{ent.term, chan});
    lock.unlock();
    return waitApplied(ent.index, chan, timeout_ms).error;
}

ApplyResult RaftNode::waitApplied(int64_t index, co::co_chan<ApplyResult> chan, uint64_t timeout_ms) {
    ApplyResult result;
    if (chan.TimedPop(result, std::chrono::milliseconds(timeout_ms))) {
        return result;
    }
    std::unique_lock<MutexType> lock(m_mutex);
    m_waiters.erase(index);
    lock.unlock();
    // 超时和 apply 可能同时发生
    if (chan.TryPop(result)) {
        return result;
    }
    return {.error = RaftError::TIMEOUT, .index = index};
}

void RaftNode::failWaiters(RaftError err, int64_t keepIndex) {
    for (auto it = m_waiters.begin(); it != m_waiters.end();) {
        if (it->first <= keepIndex) {
            ++it;
            continue;
        }
        it->second.chan << ApplyResult{.error = err, .index = it->first};
        it = m_waiters.erase(it);
    }
}

void RaftNode::addLeadershipObserver(LeadershipObserver cb) {
    std::unique_lock<MutexType> lock(m_mutex);
    m_observers.push_back(std::move(cb));
}

void RaftNode::startElection() {
    RequestVoteArgs request{};
    request.term = m_currentTerm;
    request.candidateId = m_id;
    request.lastLogIndex = m_logs.lastIndex();
    request.lastLogTerm = m_logs.lastTerm();

    SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] starts election with RequestVoteArgs {}", m_id, request.toString());
    // 统计投票结果，自己开始有一票
    std::shared_ptr<int64_t> grantedVotes = std::make_shared<int64_t>(1);
    if (*grantedVotes >= (int64_t)m_configuration.quorumSize()) {
        becomeLeader();
        return;
    }

    auto self = shared_from_this();
    for (auto& peer: m_peers) {
        if (!m_configuration.hasVoter(peer.first)) {
            continue;
        }
        // 使用协程发起异步投票，不阻塞选举定时器，才能在选举超时后发起新的选举
        go [self, grantedVotes, request, peer = peer.second] {
            auto reply = peer->requestVote(request);
            if (!reply) {
                return;
            }
            std::unique_lock<MutexType> lock(self->m_mutex);
            SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] receives RequestVoteReply {} from Node[{}] after sending RequestVoteArgs {} in term {}",
                                self->m_id, reply->toString(), peer->getId(), request.toString(), self->m_currentTerm);
            if (self->m_stop) {
                return;
            }
            // 检查自己状态是否改变
            if (self->m_currentTerm != request.term || self->m_state != Candidate) {
                return;
            }
            if (reply->voteGranted) {
                ++(*grantedVotes);
                // 赢得选举
                if (*grantedVotes == (int64_t)self->m_configuration.quorumSize()) {
                    SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] receives majority votes in term {}",
                                        self->m_id, self->m_currentTerm);
                    self->becomeLeader();
                }
            } else if (reply->term > self->m_currentTerm) {
                SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] finds a new leader Node[{}] with term {} and steps down in term {}",
                                    self->m_id, reply->leaderId, reply->term, self->m_currentTerm);
                self->becomeFollower(reply->term, reply->leaderId);
                self->rescheduleElection();
            }
        };
    }
}

void RaftNode::applier() {
    std::unique_lock<MutexType> lock(m_mutex);
    while (true) {
        // 如果没有需要apply的日志则等待
        while (!m_stop && !m_pendingSnapshot && !m_logs.hasNextEntries()) {
            m_applyCond.wait(lock);
        }
        if (m_stop) {
            break;
        }

        if (m_pendingSnapshot) {
            Snapshot::ptr snap = std::move(m_pendingSnapshot);
            m_pendingSnapshot = nullptr;
            lock.unlock();
            bool ok = m_fsm->restore(snap->data);
            lock.lock();
            if (!ok) {
                SPDLOG_LOGGER_CRITICAL(g_logger, "Node[{}] restore snapshot [index: {}, term: {}] fail",
                                       m_id, snap->metadata.index, snap->metadata.term);
            }
            if (snap->metadata.index > m_logs.applied()) {
                m_logs.appliedTo(snap->metadata.index);
            }
            // 被快照覆盖的日志没有返回值可以给等待者
            std::vector<std::pair<co::co_chan<ApplyResult>, ApplyResult>> covered;
            for (auto it = m_waiters.begin(); it != m_waiters.end() && it->first <= snap->metadata.index;) {
                covered.emplace_back(it->second.chan, ApplyResult{.error = RaftError::LEADERSHIP_LOST, .index = it->first});
                it = m_waiters.erase(it);
            }
            lock.unlock();
            for (auto& item: covered) {
                item.first << item.second;
            }
            lock.lock();
            SPDLOG_LOGGER_INFO(g_logger, "Node[{}] installed snapshot [index: {}, term: {}]",
                               m_id, snap->metadata.index, snap->metadata.term);
            continue;
        }

        std::vector<Entry> ents = m_logs.nextEntries();
        if (ents.empty()) {
            SPDLOG_LOGGER_CRITICAL(g_logger, "Node[{}] can not read committed entries, log [{}]", m_id, m_logs.toString());
            break;
        }

        lock.unlock();
        std::vector<std::string> responses(ents.size());
        for (size_t i = 0; i < ents.size(); ++i) {
            if (ents[i].type == EntryType::NORMAL) {
                responses[i] = m_fsm->apply(ents[i].data);
            }
        }
        lock.lock();

        // 期间可能安装了快照，防止 applied 回退
        const int64_t last = ents.back().index;
        if (last > m_logs.applied()) {
            m_logs.appliedTo(last);
        }
        SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] applies entries {}-{} in term {}",
                            m_id, ents.front().index, last, m_currentTerm);

        std::vector<std::pair<co::co_chan<ApplyResult>, ApplyResult>> notifies;
        for (size_t i = 0; i < ents.size(); ++i) {
            auto it = m_waiters.find(ents[i].index);
            if (it == m_waiters.end()) {
                continue;
            }
            ApplyResult result;
            result.index = ents[i].index;
            // 同一个 index 上被提交的是别的 leader 的日志
            if (it->second.term != ents[i].term) {
                result.error = RaftError::LEADERSHIP_LOST;
            } else {
                result.response = std::move(responses[i]);
            }
            notifies.emplace_back(it->second.chan, std::move(result));
            m_waiters.erase(it);
        }

        maybeSnapshot(lock);

        lock.unlock();
        for (auto& item: notifies) {
            item.first << item.second;
        }
        lock.lock();
    }
    SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] applier exit", m_id);
}

void RaftNode::notifier() {
    std::unique_lock<MutexType> lock(m_mutex);
    while (true) {
        while (!m_stop && m_transitions.empty()) {
            m_notifyCond.wait(lock);
        }
        if (m_stop) {
            break;
        }
        auto transitions = std::move(m_transitions);
        m_transitions.clear();
        auto observers = m_observers;
        lock.unlock();
        for (auto& item: transitions) {
            for (auto& cb: observers) {
                cb(item.first, item.second);
            }
        }
        lock.lock();
    }
}

void RaftNode::maybeSnapshot(std::unique_lock<MutexType>& lock) {
    const uint64_t threshold = g_snapshot_threshold->getValue();
    if (!threshold) {
        return;
    }
    if (m_persister->getRaftStateSize() < (int64_t)threshold) {
        return;
    }
    const int64_t index = m_logs.applied();
    if (index <= m_logs.lastSnapshotIndex()) {
        return;
    }
    // 只有 applier 会修改状态机，释放锁期间状态机仍然停留在 index
    lock.unlock();
    std::string data = m_fsm->snapshot();
    lock.lock();
    if (m_pendingSnapshot || index <= m_logs.lastSnapshotIndex()) {
        return;
    }

    Configuration conf = m_snapshotConfiguration;
    auto ent = m_logs.lastConfigEntry(index);
    if (ent) {
        auto decoded = Configuration::Decode(ent->data);
        if (decoded) {
            conf = std::move(*decoded);
        }
    }
    auto snapshot = m_logs.createSnapshot(index, data, conf);
    if (!snapshot) {
        return;
    }
    // 压缩日志
    m_logs.compact(index);
    m_snapshotConfiguration = conf;
    persist(snapshot);
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] created snapshot [index: {}, term: {}], log [{}]",
                       m_id, snapshot->metadata.index, snapshot->metadata.term, m_logs.toString());
}

void RaftNode::broadcastHeartbeat() {
    auto self = shared_from_this();
    for (auto& [id, peer]: m_peers) {
        go [self, id = id] {
            self->replicateOneRound(id);
        };
    }
}

void RaftNode::replicateOneRound(int64_t peerId) {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_stop || m_state != Leader || !m_peers.count(peerId)) {
        return;
    }
    // 需要的日志已经被压缩，只能发快照
    if (m_nextIndex[peerId] <= m_logs.lastSnapshotIndex()) {
        sendSnapshot(lock, peerId);
    } else {
        sendEntries(lock, peerId);
    }
}

void RaftNode::sendSnapshot(std::unique_lock<MutexType>& lock, int64_t peerId) {
    Snapshot::ptr snapshot = m_persister->loadSnapshot();
    if (!snapshot || snapshot->empty()) {
        SPDLOG_LOGGER_ERROR(g_logger, "Node[{}] log is compacted but no snapshot is persisted", m_id);
        return;
    }
    InstallSnapshotArgs request{};
    request.term = m_currentTerm;
    request.leaderId = m_id;
    request.leaderAddress = m_address;
    request.snapshot = std::move(*snapshot);
    const int64_t snap_index = request.snapshot.metadata.index;
    SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] sends snapshot [index: {}, term: {}] to Node[{}], log [{}]",
                        m_id, snap_index, request.snapshot.metadata.term, peerId, m_logs.toString());

    RaftPeer::ptr peer = m_peers[peerId];
    // rpc 期间不能持锁
    lock.unlock();
    auto reply = peer->installSnapshot(request);
    lock.lock();
    if (!reply || !acceptReply(request.term, reply->term, reply->leaderId, peerId)) {
        return;
    }
    updateProgress(peerId, snap_index);
}

void RaftNode::sendEntries(std::unique_lock<MutexType>& lock, int64_t peerId) {
    const int64_t next = m_nextIndex[peerId];
    AppendEntriesArgs request{};
    request.term = m_currentTerm;
    request.leaderId = m_id;
    request.leaderAddress = m_address;
    request.leaderCommit = m_logs.committed();
    request.prevLogIndex = next - 1;
    request.prevLogTerm = m_logs.term(next - 1);
    request.entries = m_logs.entries(next);

    RaftPeer::ptr peer = m_peers[peerId];
    lock.unlock();
    auto reply = peer->appendEntries(request);
    lock.lock();
    if (!reply) {
        return;
    }
    SPDLOG_LOGGER_TRACE(g_logger, "Node[{}] sent {} to Node[{}], got {}",
                        m_id, request.toString(), peerId, reply->toString());
    if (!acceptReply(request.term, reply->term, reply->leaderId, peerId)) {
        return;
    }
    if (reply->success) {
        updateProgress(peerId, request.prevLogIndex + (int64_t)request.entries.size());
        return;
    }
    // follower 给出的回退位置，不超过自己的日志
    if (reply->nextIndex > 0) {
        int64_t& next_index = m_nextIndex[peerId];
        next_index = std::min(reply->nextIndex, m_logs.lastIndex() + 1);
        m_matchIndex[peerId] = std::min(m_matchIndex[peerId], next_index - 1);
    }
}

bool RaftNode::acceptReply(int64_t requestTerm, int64_t replyTerm, int64_t replyLeader, int64_t peerId) {
    if (m_stop || m_state != Leader) {
        return false;
    }
    if (replyTerm > m_currentTerm) {
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] sees term {} from Node[{}], steps down from term {}",
                           m_id, replyTerm, peerId, m_currentTerm);
        becomeFollower(replyTerm, replyLeader);
        return false;
    }
    // 旧任期发出的请求，或者对方在此期间被移出集群
    return requestTerm == m_currentTerm && replyTerm == m_currentTerm && m_peers.count(peerId);
}

void RaftNode::updateProgress(int64_t peerId, int64_t match) {
    int64_t& match_index = m_matchIndex[peerId];
    match_index = std::max(match_index, match);
    int64_t& next_index = m_nextIndex[peerId];
    next_index = std::max(next_index, match + 1);
    maybeAdvanceCommit();
}

void RaftNode::maybeAdvanceCommit() {
    if (m_state != Leader) {
        return;
    }
    size_t quorum = m_configuration.quorumSize();
    if (!quorum) {
        return;
    }
    std::vector<int64_t> matches;
    for (auto& server: m_configuration.servers) {
        if (server.suffrage != Suffrage::Voter) {
            continue;
        }
        if (server.id == m_id) {
            matches.push_back(m_logs.lastIndex());
        } else {
            auto it = m_matchIndex.find(server.id);
            matches.push_back(it == m_matchIndex.end() ? 0 : it->second);
        }
    }
    std::sort(matches.begin(), matches.end(), std::greater<>());
    // 假设存在 N 满足N > commitIndex，使得大多数的 matchIndex[i] ≥ N以及log[N].term == currentTerm 成立，
    // 则令 commitIndex = N（5.3 和 5.4 节）
    int64_t n = matches[quorum - 1];
    if (m_logs.maybeCommit(n, m_currentTerm)) {
        SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] advances commit to {} in term {}", m_id, n, m_currentTerm);
        persist();
        m_applyCond.notify_one();
        onCommitted();
    }
}

void RaftNode::onCommitted() {
    // 删除自己的成员变更已经提交，leader 退位
    if (m_state == Leader && m_configIndex <= m_logs.committed() && !m_configuration.hasVoter(m_id)) {
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] is no longer a voter, steps down in term {}", m_id, m_currentTerm);
        becomeFollower(m_currentTerm);
    }
}

RequestVoteReply RaftNode::handleRequestVote(RequestVoteArgs request) {
    std::unique_lock<MutexType> lock(m_mutex);
    RequestVoteReply reply{};
    co_defer_scope {
        persist();
        SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] after processing RequestVoteArgs {} and reply RequestVoteReply {}, state is {}",
                            m_id, request.toString(), reply.toString(), toString());
    };
    reply.term = m_currentTerm;
    reply.leaderId = m_leaderId;
    reply.voteGranted = false;
    if (m_stop) {
        return reply;
    }
    // 不在成员配置里的节点（例如已经被移除的节点）不能打断集群
    if (!m_configuration.empty() && !m_configuration.hasVoter(request.candidateId)) {
        return reply;
    }
    // 拒绝给任期小于自己的候选人投票
    if (request.term < m_currentTerm ||
            // 多个候选人发起选举的情况
            (request.term == m_currentTerm && m_votedFor != -1 && m_votedFor != request.candidateId)) {
        return reply;
    }

    // 任期比自己大，变成追随者
    if (request.term > m_currentTerm) {
        becomeFollower(request.term);
    }
    reply.term = m_currentTerm;
    reply.leaderId = m_leaderId;

    // 拒绝掉那些日志没有自己新的投票请求
    if (!m_logs.isUpToDate(request.lastLogIndex, request.lastLogTerm)) {
        return reply;
    }

    // 投票给候选人
    m_votedFor = request.candidateId;
    // 成功投票后才重置选举定时器，这样有助于网络不稳定条件下选主的 liveness 问题
    rescheduleElection();
    reply.voteGranted = true;
    return reply;
}

bool RaftNode::acceptLeader(int64_t term, int64_t leaderId, const std::string& leaderAddress) {
    if (m_stop || term < m_currentTerm) {
        return false;
    }
    // 更大的任期，或者同一任期里落选的候选人
    if (term > m_currentTerm || m_state != Follower) {
        becomeFollower(term, leaderId);
    }
    m_leaderId = leaderId;
    if (!leaderAddress.empty()) {
        m_leaderAddress = leaderAddress;
    }
    rescheduleElection();
    return true;
}

AppendEntriesReply RaftNode::handleAppendEntries(AppendEntriesArgs request) {
    std::unique_lock<MutexType> lock(m_mutex);
    AppendEntriesReply reply{};
    co_defer_scope {
        persist();
        SPDLOG_LOGGER_TRACE(g_logger, "Node[{}] handled AppendEntries {}, reply {}, state is {}",
                            m_id, request.toString(), reply.toString(), toString());
    };
    const bool accepted = acceptLeader(request.term, request.leaderId, request.leaderAddress);
    reply.term = m_currentTerm;
    reply.leaderId = m_leaderId;
    if (!accepted) {
        return reply;
    }

    // prev 已经在快照里，从 commit 之后重新对齐
    if (request.prevLogIndex < m_logs.lastSnapshotIndex()) {
        reply.nextIndex = m_logs.committed() + 1;
        return reply;
    }
    const int64_t last_new = m_logs.maybeAppend(request.prevLogIndex, request.prevLogTerm, request.entries);
    if (last_new < 0) {
        reply.nextIndex = m_logs.findConflict(request.prevLogIndex, request.prevLogTerm);
        return reply;
    }
    if (!request.entries.empty()) {
        reloadConfiguration();
    }
    // 超过 last_new 的部分还没有确认和 leader 一致
    const int64_t commit = std::min(request.leaderCommit, last_new);
    if (commit > m_logs.committed()) {
        m_logs.commitTo(commit);
        m_applyCond.notify_one();
    }
    reply.success = true;
    reply.nextIndex = last_new + 1;
    return reply;
}

InstallSnapshotReply RaftNode::handleInstallSnapshot(InstallSnapshotArgs request) {
    std::unique_lock<MutexType> lock(m_mutex);
    InstallSnapshotReply reply{};
    const bool accepted = acceptLeader(request.term, request.leaderId, request.leaderAddress);
    reply.term = m_currentTerm;
    reply.leaderId = m_leaderId;
    if (!accepted) {
        return reply;
    }

    const SnapshotMetadata& meta = request.snapshot.metadata;
    if (meta.index <= m_logs.committed()) {
        SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] ignored stale snapshot [index: {}, term: {}], committed {}",
                            m_id, meta.index, meta.term, m_logs.committed());
        return reply;
    }
    if (m_logs.matchLog(meta.index, meta.term)) {
        // 快照点之前的日志本地都有，只需推进 commit
        m_logs.commitTo(meta.index);
        m_applyCond.notify_one();
        persist();
        return reply;
    }

    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] installs snapshot [index: {}, term: {}] from Node[{}]",
                       m_id, meta.index, meta.term, request.leaderId);
    m_logs.clearEntries(meta.index, meta.term);
    m_logs.commitTo(meta.index);
    m_snapshotConfiguration = meta.configuration;
    reloadConfiguration();
    m_pendingSnapshot = std::make_shared<Snapshot>(std::move(request.snapshot));
    persist(m_pendingSnapshot);
    m_applyCond.notify_one();
    return reply;
}

void RaftNode::reloadConfiguration() {
    auto ent = m_logs.lastConfigEntry();
    if (ent) {
        auto conf = Configuration::Decode(ent->data);
        if (!conf) {
            SPDLOG_LOGGER_ERROR(g_logger, "Node[{}] invalid configuration entry at index {}", m_id, ent->index);
            return;
        }
        m_configuration = std::move(*conf);
        m_configIndex = ent->index;
    } else {
        m_configuration = m_snapshotConfiguration;
        m_configIndex = m_logs.lastSnapshotIndex();
    }
    syncPeers();
}

void RaftNode::syncPeers() {
    for (auto& server: m_configuration.servers) {
        if (server.id == m_id) {
            continue;
        }
        auto it = m_peers.find(server.id);
        if (it != m_peers.end() && TrimScheme(it->second->getAddress()) == TrimScheme(server.address)) {
            continue;
        }
        m_peers[server.id] = m_peerFactory(server.id, server.address);
        m_nextIndex[server.id] = m_logs.lastIndex() + 1;
        m_matchIndex[server.id] = 0;
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] add peer[{}], address is {}", m_id, server.id, server.address);
    }
    for (auto it = m_peers.begin(); it != m_peers.end();) {
        if (m_configuration.contains(it->first)) {
            ++it;
            continue;
        }
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] remove peer[{}], address is {}", m_id, it->first, it->second->getAddress());
        m_nextIndex.erase(it->first);
        m_matchIndex.erase(it->first);
        it = m_peers.erase(it);
    }
}

bool RaftNode::isLeader() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_state == Leader;
}

RaftState RaftNode::state() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_state;
}

int64_t RaftNode::term() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_currentTerm;
}

std::string RaftNode::leader() {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_state == Leader) {
        return m_address;
    }
    if (m_leaderId < 0) {
        return "";
    }
    if (!m_leaderAddress.empty()) {
        return m_leaderAddress;
    }
    return m_configuration.getAddress(m_leaderId).value_or("");
}

int64_t RaftNode::leaderId() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_leaderId;
}

Configuration RaftNode::getConfiguration() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_configuration;
}

Configuration RaftNode::committedConfiguration() {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_configIndex <= m_logs.committed()) {
        return m_configuration;
    }
    auto ent = m_logs.lastConfigEntry(m_logs.committed());
    if (ent) {
        auto conf = Configuration::Decode(ent->data);
        if (conf) {
            return std::move(*conf);
        }
    }
    return m_snapshotConfiguration;
}

RaftStats RaftNode::stats() {
    std::unique_lock<MutexType> lock(m_mutex);
    RaftStats stats;
    stats.state = m_state;
    stats.term = m_currentTerm;
    stats.leaderId = m_leaderId;
    if (m_state == Leader) {
        stats.leaderAddress = m_address;
    } else if (m_leaderId >= 0) {
        stats.leaderAddress = m_leaderAddress.empty()
                ? m_configuration.getAddress(m_leaderId).value_or("") : m_leaderAddress;
    }
    stats.commitIndex = m_logs.committed();
    stats.appliedIndex = m_logs.applied();
    stats.lastLogIndex = m_logs.lastIndex();
    stats.lastLogTerm = m_logs.lastTerm();
    stats.lastSnapshotIndex = m_logs.lastSnapshotIndex();
    stats.numPeers = (int64_t)m_peers.size();
    stats.configuration = m_configuration;
    return stats;
}

std::string RaftNode::toString() {
    std::string str = fmt::format("Id: {}, State: {}, LeaderId: {}, CurrentTerm: {}, VotedFor: {}, CommitIndex: {}, LastApplied: {}",
                                  m_id, RaftStateToString(m_state), m_leaderId, m_currentTerm, m_votedFor,
                                  m_logs.committed(), m_logs.applied());
    return "{" + str + "}";
}

void RaftNode::becomeFollower(int64_t term, int64_t leaderId) {
    RaftState old = m_state;
    if (m_state == Leader) {
        // 成为follower停止心跳定时器
        m_heartbeatTimer.stop();
        // 已经提交的日志仍然会被 apply，其余的结果未知
        failWaiters(RaftError::LEADERSHIP_LOST, m_logs.committed());
    }
    m_state = Follower;
    if (term > m_currentTerm) {
        m_currentTerm = term;
        m_votedFor = -1;
    }
    m_leaderId = leaderId;
    m_leaderAddress.clear();
    persist();
    if (old == Leader) {
        rescheduleElection();
    }
    if (old != Follower) {
        m_transitions.emplace_back(Follower, m_currentTerm);
        m_notifyCond.notify_one();
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] became Follower at term {}, state is {}", m_id, m_currentTerm, toString());
    } else {
        SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] became Follower at term {}, state is {}", m_id, m_currentTerm, toString());
    }
}

void RaftNode::becomeCandidate() {
    RaftState old = m_state;
    m_state = Candidate;
    ++m_currentTerm;
    m_votedFor = m_id;
    m_leaderId = -1;
    m_leaderAddress.clear();
    persist();
    if (old != Candidate) {
        m_transitions.emplace_back(Candidate, m_currentTerm);
        m_notifyCond.notify_one();
    }
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] became Candidate at term {}, state is {}", m_id, m_currentTerm, toString());
}

void RaftNode::becomeLeader() {
    // 成为leader停止选举定时器
    m_electionTimer.stop();
    m_state = Leader;
    m_leaderId = m_id;
    m_leaderAddress = m_address;
    // 领导者并不知道其它节点的日志情况，nextIndex 初始化为最后一条日志的下一条来试探，matchIndex 初始化为 0
    for (auto& peer: m_peers) {
        m_nextIndex[peer.first] = m_logs.lastIndex() + 1;
        m_matchIndex[peer.first] = 0;
    }
    m_transitions.emplace_back(Leader, m_currentTerm);
    m_notifyCond.notify_one();
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] became Leader at term {}, state is {}", m_id, m_currentTerm, toString());

    // note: 即使日志已经被同步到了大多数个节点上，依然不能认为是已经提交了
    // 所以 leader 上任后应该提交一条空日志来提交之前的日志
    Propose(EntryType::NOOP, "");
    // 开启心跳定时器
    resetHeartbeatTimer();
}

void RaftNode::rescheduleElection() {
    m_electionTimer.stop();
    if (!m_started || m_stop) {
        return;
    }
    std::weak_ptr<RaftNode> weak = weak_from_this();
    m_electionTimer = CycleTimer(GetRandomizedElectionTimeout(), [weak] {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        std::unique_lock<MutexType> lock(self->m_mutex);
        if (self->m_stop || self->m_state == Leader) {
            return;
        }
        // 只有最新配置里的投票者才能发起选举，等待加入集群的节点不会发起选举
        if (!self->m_configuration.hasVoter(self->m_id)) {
            return;
        }
        self->becomeCandidate();
        // 异步投票，不阻塞选举定时器
        self->startElection();
    });
}

void RaftNode::resetHeartbeatTimer() {
    m_heartbeatTimer.stop();
    if (m_stop) {
        return;
    }
    std::weak_ptr<RaftNode> weak = weak_from_this();
    m_heartbeatTimer = CycleTimer(GetStableHeartbeatTimeout(), [weak] {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        std::unique_lock<MutexType> lock(self->m_mutex);
        if (!self->m_stop && self->m_state == Leader) {
            self->broadcastHeartbeat();
        }
    });
}

uint64_t RaftNode::GetStableHeartbeatTimeout() {
    return g_timer_heartbeat->getValue();
}

uint64_t RaftNode::GetRandomizedElectionTimeout() {
    static thread_local std::default_random_engine engine(std::random_device{}());
    // 在 [base, top] 里随机，避免同时发起选举
    uint64_t base = g_timer_election_base->getValue();
    uint64_t top = std::max(g_timer_election_top->getValue(), base);
    std::uniform_int_distribution<uint64_t> dist(base, top);
    return dist(engine);
}

void RaftNode::persist(Snapshot::ptr snap) {
    HardState hs{.term = m_currentTerm, .vote = m_votedFor, .commit = m_logs.committed()};
    if (!snap && hs == m_persistedState && !m_logs.hasUnstable()) {
        return;
    }
    if (!m_persister->persist(hs, m_logs.allEntries(), snap)) {
        SPDLOG_LOGGER_ERROR(g_logger, "Node[{}] persist raft state fail", m_id);
        return;
    }
    m_persistedState = hs;
    m_logs.markStable();
}

Entry RaftNode::Propose(EntryType type, const std::string& data) {
    Entry ent;
    ent.index = m_logs.lastIndex() + 1;
    ent.term = m_currentTerm;
    ent.type = type;
    ent.data = data;

    m_logs.append(ent);
    // 成员变更在追加后立即生效
    if (type == EntryType::CONFIGURATION) {
        reloadConfiguration();
    }
    // 先持久化，再计入多数派
    persist();
    maybeAdvanceCommit();
    broadcastHeartbeat();
    SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] receives a new log entry[index: {}, term: {}, type: {}] to replicate in term {}",
                        m_id, ent.index, ent.term, EntryTypeToString(ent.type), m_currentTerm);
    return ent;
}

}

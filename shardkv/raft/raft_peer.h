//
// Created by zavier on 2022/7/19.
//

#ifndef SHARDKV_RAFT_PEER_H
#define SHARDKV_RAFT_PEER_H

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "shardkv/common/util.h"
#include "shardkv/http/http_connection.h"
#include "entry.h"
#include "snapshot.h"

namespace shardkv::raft {

// raft rpc 的 http 路径
inline const std::string REQUEST_VOTE = "/raft/rpc/request_vote";
inline const std::string APPEND_ENTRIES = "/raft/rpc/append_entries";
inline const std::string INSTALL_SNAPSHOT = "/raft/rpc/install_snapshot";

/**
 * @brief RequestVote rpc 调用的参数
 */
struct RequestVoteArgs {
    int64_t term = 0;          // 候选人的任期
    int64_t candidateId = 0;   // 请求选票的候选人的 ID
    int64_t lastLogIndex = 0;  // 候选人的最后日志条目的索引值
    int64_t lastLogTerm = 0;   // 候选人的最后日志条目的任期号
    std::string toString() const {
        std::string str = fmt::format("Term: {}, CandidateId: {}, LastLogIndex: {}, LastLogTerm: {}",
                                      term, candidateId, lastLogIndex, lastLogTerm);
        return "{" + str + "}";
    }
};

/**
 * @brief RequestVote rpc 调用的返回值
 */
struct RequestVoteReply {
    int64_t term = 0;           // 当前任期号大于候选人时，候选人更新自己的任期号，并切换为追随者
    int64_t leaderId = -1;      // 当前任期的leader
    bool voteGranted = false;   // true表示候选人赢得了此张选票
    std::string toString() const {
        std::string str = fmt::format("Term: {}, LeaderId: {}, VoteGranted: {}", term, leaderId, voteGranted);
        return "{" + str + "}";
    }
};

/**
 * @brief AppendEntries rpc 调用的参数
 */
struct AppendEntriesArgs {
    int64_t term = 0;               // 领导人的任期
    int64_t leaderId = -1;          // 领导id
    std::string leaderAddress;      // 领导地址，追随者用来重定向客户端
    int64_t prevLogIndex = 0;       // 紧邻新日志条目之前的那个日志条目的索引
    int64_t prevLogTerm = 0;        // 紧邻新日志条目之前的那个日志条目的任期
    std::vector<Entry> entries;     // 需要被保存的日志条目（被当做心跳使用时，则日志条目内容为空）
    int64_t leaderCommit = 0;       // 领导人的已知已提交的最高的日志条目的索引
    std::string toString() const {
        std::string str = fmt::format("Term: {}, LeaderId: {}, PrevLogIndex: {}, PrevLogTerm: {}, LeaderCommit: {}, Entries: [",
                                      term, leaderId, prevLogIndex, prevLogTerm, leaderCommit);
        for (int i = 0; i < (int)entries.size(); ++i) {
            if (i) {
                str.push_back(',');
            }
            str += entries[i].toString();
        }
        return "{" + str + "]}";
    }
};

/**
 * @brief AppendEntries rpc 调用的返回值
 */
struct AppendEntriesReply {
    bool success = false;          // 如果跟随者所含有的条目和 prevLogIndex 以及 prevLogTerm 匹配上了，则为 true
    int64_t term = 0;              // 当前任期，如果大于领导人的任期则切换为追随者
    int64_t leaderId = -1;         // 当前任期的leader
    int64_t nextIndex = 0;         // 下一个期望接收的日志
    std::string toString() const {
        std::string str = fmt::format("Success: {}, Term: {}, LeaderId: {}, NextIndex: {}",
                                      success, term, leaderId, nextIndex);
        return "{" + str + "}";
    }
};

struct InstallSnapshotArgs {
    int64_t term = 0;           // 领导人的任期号
    int64_t leaderId = -1;      // 领导人的 ID，以便于跟随者重定向请求
    std::string leaderAddress;
    Snapshot snapshot;          // 快照
    std::string toString() const {
        std::string str = fmt::format("Term: {}, LeaderId: {}, Snapshot.Metadata.Index: {}, Snapshot.Metadata.Term: {}",
                                      term, leaderId, snapshot.metadata.index, snapshot.metadata.term);
        return "{" + str + "}";
    }
};

struct InstallSnapshotReply {
    int64_t term = 0;           // 当前任期号，便于领导人更新自己
    int64_t leaderId = -1;      // 当前任期领导人
    std::string toString() const {
        std::string str = fmt::format("Term: {}, LeaderId: {}", term, leaderId);
        return "{" + str + "}";
    }
};

void to_json(Json& j, const RequestVoteArgs& v);
void from_json(const Json& j, RequestVoteArgs& v);
void to_json(Json& j, const RequestVoteReply& v);
void from_json(const Json& j, RequestVoteReply& v);
void to_json(Json& j, const AppendEntriesArgs& v);
void from_json(const Json& j, AppendEntriesArgs& v);
void to_json(Json& j, const AppendEntriesReply& v);
void from_json(const Json& j, AppendEntriesReply& v);
void to_json(Json& j, const InstallSnapshotArgs& v);
void from_json(const Json& j, InstallSnapshotArgs& v);
void to_json(Json& j, const InstallSnapshotReply& v);
void from_json(const Json& j, InstallSnapshotReply& v);

/**
 * @brief rpc 消息的 msgpack 编解码
 */
template<class T>
std::string EncodeMessage(const T& msg) {
    std::vector<uint8_t> buff = Json::to_msgpack(Json(msg));
    return std::string(buff.begin(), buff.end());
}

template<class T>
std::optional<T> DecodeMessage(const std::string& data) {
    try {
        return Json::from_msgpack(data).get<T>();
    } catch (Json::exception& e) {
        SPDLOG_LOGGER_DEBUG(GetLogInstance(), "decode raft message fail: {}", e.what());
    }
    return std::nullopt;
}

/**
 * @brief RaftNode 通过 RaftPeer 调用远端 Raft 节点，调用失败返回 std::nullopt
 */
class RaftPeer {
public:
    using ptr = std::shared_ptr<RaftPeer>;
    RaftPeer(int64_t id, std::string address) : m_id(id), m_address(std::move(address)) {}
    virtual ~RaftPeer() = default;

    virtual std::optional<RequestVoteReply> requestVote(const RequestVoteArgs& arg) = 0;

    virtual std::optional<AppendEntriesReply> appendEntries(const AppendEntriesArgs& arg) = 0;

    virtual std::optional<InstallSnapshotReply> installSnapshot(const InstallSnapshotArgs& arg) = 0;

    int64_t getId() const { return m_id;}
    const std::string& getAddress() const { return m_address;}
protected:
    int64_t m_id;
    std::string m_address;
};

/**
 * @brief 创建远端节点，RaftNode 在成员变更时调用
 */
using PeerFactory = std::function<RaftPeer::ptr(int64_t id, const std::string& address)>;

/**
 * @brief 通过 http 长连接池发送 msgpack 编码的 rpc
 */
class HttpRaftPeer : public RaftPeer {
public:
    using ptr = std::shared_ptr<HttpRaftPeer>;
    HttpRaftPeer(int64_t id, const std::string& address);

    std::optional<RequestVoteReply> requestVote(const RequestVoteArgs& arg) override;

    std::optional<AppendEntriesReply> appendEntries(const AppendEntriesArgs& arg) override;

    std::optional<InstallSnapshotReply> installSnapshot(const InstallSnapshotArgs& arg) override;

    static RaftPeer::ptr Create(int64_t id, const std::string& address) {
        return std::make_shared<HttpRaftPeer>(id, address);
    }
private:
    /**
     * @brief 发送请求，连接失败时按 raft.rpc.connect_retry 重试
     */
    std::optional<std::string> call(const std::string& path, const std::string& body);
private:
    http::HttpConnectionPool::ptr m_pool;
};

}
#endif //SHARDKV_RAFT_PEER_H

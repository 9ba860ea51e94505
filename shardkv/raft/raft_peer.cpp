//
// Created by zavier on 2022/7/19.
//

#include "shardkv/common/config.h"
#include "raft_peer.h"

namespace shardkv::raft {
static auto g_logger = GetLogInstance();
// rpc 超时时间
static ConfigVar<uint64_t>::ptr g_rpc_timeout =
        Config::Lookup<uint64_t>("raft.rpc.timeout", 3000, "raft rpc timeout(ms)");
// rpc 连接重试次数
static ConfigVar<uint32_t>::ptr g_connect_retry =
        Config::Lookup<uint32_t>("raft.rpc.connect_retry", 3, "raft rpc connect retry times");
// 每个节点的最大空闲连接数
static ConfigVar<uint32_t>::ptr g_pool_size =
        Config::Lookup<uint32_t>("raft.rpc.pool_size", 8, "raft rpc max idle connections per peer");

static uint64_t s_rpc_timeout;
static uint32_t s_connect_retry;
static uint32_t s_pool_size;

namespace {
struct RaftPeerIniter{
    RaftPeerIniter(){
        s_rpc_timeout = g_rpc_timeout->getValue();
        g_rpc_timeout->addListener([](const uint64_t& old_val, const uint64_t& new_val){
            SPDLOG_LOGGER_INFO(g_logger, "raft rpc timeout changed from {} to {}", old_val, new_val);
            s_rpc_timeout = new_val;
        });
        s_connect_retry = g_connect_retry->getValue();
        g_connect_retry->addListener([](const uint32_t& old_val, const uint32_t& new_val){
            SPDLOG_LOGGER_INFO(g_logger, "raft rpc connect retry changed from {} to {}", old_val, new_val);
            s_connect_retry = new_val;
        });
        s_pool_size = g_pool_size->getValue();
        g_pool_size->addListener([](const uint32_t& old_val, const uint32_t& new_val){
            s_pool_size = new_val;
        });
    }
};

// 初始化配置
[[maybe_unused]]
static RaftPeerIniter s_initer;
}

void to_json(Json& j, const RequestVoteArgs& v) {
    j = Json{{"term", v.term},
             {"candidate_id", v.candidateId},
             {"last_log_index", v.lastLogIndex},
             {"last_log_term", v.lastLogTerm}};
}

void from_json(const Json& j, RequestVoteArgs& v) {
    j.at("term").get_to(v.term);
    j.at("candidate_id").get_to(v.candidateId);
    j.at("last_log_index").get_to(v.lastLogIndex);
    j.at("last_log_term").get_to(v.lastLogTerm);
}

void to_json(Json& j, const RequestVoteReply& v) {
    j = Json{{"term", v.term}, {"leader_id", v.leaderId}, {"vote_granted", v.voteGranted}};
}

void from_json(const Json& j, RequestVoteReply& v) {
    j.at("term").get_to(v.term);
    j.at("leader_id").get_to(v.leaderId);
    j.at("vote_granted").get_to(v.voteGranted);
}

void to_json(Json& j, const AppendEntriesArgs& v) {
    j = Json{{"term", v.term},
             {"leader_id", v.leaderId},
             {"leader_address", v.leaderAddress},
             {"prev_log_index", v.prevLogIndex},
             {"prev_log_term", v.prevLogTerm},
             {"entries", v.entries},
             {"leader_commit", v.leaderCommit}};
}

void from_json(const Json& j, AppendEntriesArgs& v) {
    j.at("term").get_to(v.term);
    j.at("leader_id").get_to(v.leaderId);
    v.leaderAddress = j.value("leader_address", "");
    j.at("prev_log_index").get_to(v.prevLogIndex);
    j.at("prev_log_term").get_to(v.prevLogTerm);
    j.at("entries").get_to(v.entries);
    j.at("leader_commit").get_to(v.leaderCommit);
}

void to_json(Json& j, const AppendEntriesReply& v) {
    j = Json{{"success", v.success},
             {"term", v.term},
             {"leader_id", v.leaderId},
             {"next_index", v.nextIndex}};
}

void from_json(const Json& j, AppendEntriesReply& v) {
    j.at("success").get_to(v.success);
    j.at("term").get_to(v.term);
    j.at("leader_id").get_to(v.leaderId);
    j.at("next_index").get_to(v.nextIndex);
}

void to_json(Json& j, const InstallSnapshotArgs& v) {
    j = Json{{"term", v.term},
             {"leader_id", v.leaderId},
             {"leader_address", v.leaderAddress},
             {"snapshot", v.snapshot}};
}

void from_json(const Json& j, InstallSnapshotArgs& v) {
    j.at("term").get_to(v.term);
    j.at("leader_id").get_to(v.leaderId);
    v.leaderAddress = j.value("leader_address", "");
    j.at("snapshot").get_to(v.snapshot);
}

void to_json(Json& j, const InstallSnapshotReply& v) {
    j = Json{{"term", v.term}, {"leader_id", v.leaderId}};
}

void from_json(const Json& j, InstallSnapshotReply& v) {
    j.at("term").get_to(v.term);
    j.at("leader_id").get_to(v.leaderId);
}

HttpRaftPeer::HttpRaftPeer(int64_t id, const std::string& address)
        : RaftPeer(id, TrimScheme(address)) {
    // 空闲连接最多存活一分钟，不限制单条连接的请求数
    m_pool = http::HttpConnectionPool::Create(m_address, s_pool_size, 60 * 1000, UINT32_MAX);
    if (!m_pool) {
        SPDLOG_LOGGER_ERROR(g_logger, "Node[{}] invalid address {}", m_id, m_address);
    }
}

std::optional<std::string> HttpRaftPeer::call(const std::string& path, const std::string& body) {
    if (!m_pool) {
        return std::nullopt;
    }
    std::map<std::string, std::string> headers{
            {"Content-Type", http::HttpContentTypeToString(http::HttpContentType::APPLICATION_MSGPACK)}};
    http::HttpResult::ptr result;
    for (int i = 0; i <= (int)s_connect_retry; ++i) {
        if (i) {
            co_sleep(10 * i);
        }
        result = m_pool->doPost(path, s_rpc_timeout, headers, body);
        // 超时说明对方可能已经收到了请求，不再重试
        if (result->result == http::HttpResult::OK || result->result == http::HttpResult::TIMEOUT) {
            break;
        }
    }
    if (result->result != http::HttpResult::OK) {
        SPDLOG_LOGGER_TRACE(g_logger, "Rpc call Node[{}] path [ {} ] failed, {}", m_id, path, result->msg);
        return std::nullopt;
    }
    if (result->response->getStatus() != http::HttpStatus::OK) {
        SPDLOG_LOGGER_DEBUG(g_logger, "Rpc call Node[{}] path [ {} ] failed, status {}", m_id, path,
                            (int)result->response->getStatus());
        return std::nullopt;
    }
    return result->response->getBody();
}

std::optional<RequestVoteReply> HttpRaftPeer::requestVote(const RequestVoteArgs& arg) {
    auto body = call(REQUEST_VOTE, EncodeMessage(arg));
    if (!body) {
        return std::nullopt;
    }
    return DecodeMessage<RequestVoteReply>(*body);
}

std::optional<AppendEntriesReply> HttpRaftPeer::appendEntries(const AppendEntriesArgs& arg) {
    auto body = call(APPEND_ENTRIES, EncodeMessage(arg));
    if (!body) {
        return std::nullopt;
    }
    return DecodeMessage<AppendEntriesReply>(*body);
}

std::optional<InstallSnapshotReply> HttpRaftPeer::installSnapshot(const InstallSnapshotArgs& arg) {
    auto body = call(INSTALL_SNAPSHOT, EncodeMessage(arg));
    if (!body) {
        return std::nullopt;
    }
    return DecodeMessage<InstallSnapshotReply>(*body);
}

}

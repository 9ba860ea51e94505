//
// Created by zavier on 2023/1/8.
//

#include "shardkv/common/config.h"
#include "shardkv/http/http_connection.h"
#include "leader_broadcaster.h"

namespace shardkv::cluster {
static auto g_logger = GetLogInstance();

static ConfigVar<uint64_t>::ptr g_observer_interval =
        Config::Lookup<uint64_t>("cluster.observer.interval", 1000, "leadership polling interval(ms)");

static ConfigVar<uint64_t>::ptr g_broadcast_timeout =
        Config::Lookup<uint64_t>("cluster.broadcast.timeout", 1000, "timeout(ms) of one leader broadcast push");

static uint64_t s_broadcast_timeout = 1000;

namespace {
struct BroadcasterIniter{
    BroadcasterIniter(){
        s_broadcast_timeout = g_broadcast_timeout->getValue();
        g_broadcast_timeout->addListener([](const uint64_t& old_val, const uint64_t& new_val){
            SPDLOG_LOGGER_INFO(g_logger, "cluster broadcast timeout changed from {} to {}", old_val, new_val);
            s_broadcast_timeout = new_val;
        });
    }
};

[[maybe_unused]]
static BroadcasterIniter s_initer;
}

std::string LeaderInfo::toString() const {
    std::string str = fmt::format("shardID: {}, shardAddress: {}, term: {}",
                                  shardId, address, term ? std::to_string(*term) : "none");
    return "{" + str + "}";
}

uint64_t LeaderBroadcaster::GetBroadcastTimeout() {
    return s_broadcast_timeout;
}

LeaderBroadcaster::LeaderBroadcaster(int64_t shardId, const std::string& address, KnownPeers::ptr peers, Pusher pusher)
    : m_shardId(shardId)
    , m_address(TrimScheme(address))
    , m_peers(std::move(peers))
    , m_pusher(std::move(pusher)) {
}

LeaderBroadcaster::~LeaderBroadcaster() {
    stop();
}

void LeaderBroadcaster::attach(const raft::RaftNode::ptr& raft) {
    std::weak_ptr<LeaderBroadcaster> weak = weak_from_this();
    raft->addLeadershipObserver([weak](raft::RaftState state, int64_t term) {
        auto self = weak.lock();
        if (self) {
            self->onStateChange(state, term);
        }
    });
}

void LeaderBroadcaster::poll(StateProbe probe) {
    m_pollTimer.stop();
    std::weak_ptr<LeaderBroadcaster> weak = weak_from_this();
    m_pollTimer = CycleTimer(g_observer_interval->getValue(), [weak, probe] {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        auto [state, term] = probe();
        bool changed = state != self->m_lastState || term != self->m_lastTerm;
        self->m_lastState = state;
        self->m_lastTerm = term;
        if (changed) {
            self->onStateChange(state, term);
        }
    });
}

void LeaderBroadcaster::stop() {
    m_stop = true;
    m_pollTimer.stop();
}

void LeaderBroadcaster::onStateChange(raft::RaftState state, int64_t term) {
    if (m_stop || state != raft::Leader) {
        return;
    }
    SPDLOG_LOGGER_INFO(g_logger, "Became leader for shard {} in term {}, broadcasting to peers", m_shardId, term);
    m_peers->merge(m_shardId, m_address, term);
    broadcast(LeaderInfo{m_shardId, m_address, term});
}

void LeaderBroadcaster::broadcast(const LeaderInfo& info) {
    if (m_stop) {
        return;
    }
    const uint64_t timeout = s_broadcast_timeout;
    for (auto& [id, peer]: m_peers->snapshot()) {
        // 不发给自己，也不发给被广播的 shard
        if (id == m_shardId || id == info.shardId || peer.address == m_address) {
            continue;
        }
        go [pusher = m_pusher, address = peer.address, info, timeout] {
            if (!pusher(address, info, timeout)) {
                SPDLOG_LOGGER_WARN(g_logger, "Failed to broadcast {} to {}", info.toString(), address);
            } else {
                SPDLOG_LOGGER_DEBUG(g_logger, "Broadcast {} to {}", info.toString(), address);
            }
        };
    }
}

MergeResult LeaderBroadcaster::receive(const LeaderInfo& info) {
    MergeResult result = m_peers->merge(info.shardId, info.address, info.term);
    SPDLOG_LOGGER_INFO(g_logger, "Shard {} at {} merged into known peers: {}",
                       info.shardId, info.address, MergeResultToString(result));
    if (result == MergeResult::ADDED || result == MergeResult::UPDATED) {
        broadcast(info);
    }
    return result;
}

bool LeaderBroadcaster::HttpPush(const std::string& peer, const LeaderInfo& info, uint64_t timeout_ms) {
    http::Json body{{"shardID", info.shardId}, {"shardAddress", info.address}};
    if (info.term) {
        body["term"] = *info.term;
    }
    auto result = http::HttpConnection::DoPost("http://" + TrimScheme(peer) + "/newleader", timeout_ms,
                                               {{"Content-Type", "application/json"}}, body.dump());
    if (result->result != http::HttpResult::OK) {
        SPDLOG_LOGGER_DEBUG(g_logger, "push to {} fail, {}", peer, result->toString());
        return false;
    }
    return result->response && result->response->getStatus() == http::HttpStatus::OK;
}

}

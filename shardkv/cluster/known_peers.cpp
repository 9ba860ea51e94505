//
// Created by zavier on 2023/1/8.
//

#include "shardkv/common/config.h"
#include "known_peers.h"

namespace shardkv::cluster {
static auto g_logger = GetLogInstance();

static ConfigVar<uint64_t>::ptr g_known_peers_capacity =
        Config::Lookup<uint64_t>("cluster.known_peers.capacity", 1024, "max number of known shards");

std::string MergeResultToString(MergeResult result) {
    switch (result) {
        case MergeResult::ADDED: return "ADDED";
        case MergeResult::UPDATED: return "UPDATED";
        case MergeResult::UNCHANGED: return "UNCHANGED";
        case MergeResult::STALE: return "STALE";
        case MergeResult::FULL: return "FULL";
    }
    return "UNKNOWN";
}

KnownPeers::KnownPeers(size_t capacity)
    : m_capacity(capacity ? capacity : g_known_peers_capacity->getValue()) {
}

MergeResult KnownPeers::merge(int64_t shardId, const std::string& address, std::optional<int64_t> term) {
    std::string addr = TrimScheme(address);
    std::unique_lock<co_wmutex> lock(m_mutex.Writer());
    auto it = m_peers.find(shardId);
    if (it == m_peers.end()) {
        if (m_peers.size() >= m_capacity) {
            SPDLOG_LOGGER_WARN(g_logger, "known peers is full, drop shard {} at {}", shardId, addr);
            return MergeResult::FULL;
        }
        m_peers.emplace(shardId, PeerInfo{addr, term.value_or(0)});
        return MergeResult::ADDED;
    }

    PeerInfo& info = it->second;
    if (term) {
        if (*term < info.term) {
            return MergeResult::STALE;
        }
        if (*term == info.term && info.address == addr) {
            return MergeResult::UNCHANGED;
        }
        info.term = *term;
        info.address = addr;
        return MergeResult::UPDATED;
    }
    if (info.address == addr) {
        return MergeResult::UNCHANGED;
    }
    info.address = addr;
    return MergeResult::UPDATED;
}

std::optional<PeerInfo> KnownPeers::get(int64_t shardId) {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    auto it = m_peers.find(shardId);
    if (it == m_peers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<int64_t, PeerInfo> KnownPeers::snapshot() {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    return m_peers;
}

std::map<int64_t, std::string> KnownPeers::addresses() {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    std::map<int64_t, std::string> res;
    for (auto& [id, info]: m_peers) {
        res[id] = info.address;
    }
    return res;
}

size_t KnownPeers::size() {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    return m_peers.size();
}

}

//
// Created by zavier on 2023/1/12.
//

#include <fmt/ranges.h>
#include "shardkv/common/config.h"
#include "router.h"

namespace shardkv::router {
static auto g_logger = GetLogInstance();

static ConfigVar<uint32_t>::ptr g_discovery_retries =
        Config::Lookup<uint32_t>("router.discovery.retries", 5, "max leader discovery rounds of one write");

static ConfigVar<uint64_t>::ptr g_discovery_backoff =
        Config::Lookup<uint64_t>("router.discovery.backoff", 200, "backoff(ms) between two discovery rounds");

static ConfigVar<uint32_t>::ptr g_read_retries =
        Config::Lookup<uint32_t>("router.read.retries", 0, "max nodes tried by one read, 0 means the node count");

static ConfigVar<uint64_t>::ptr g_forward_timeout =
        Config::Lookup<uint64_t>("router.forward.timeout", 10000, "timeout(ms) of one forwarded request");

std::string RouterErrorToString(RouterError err) {
    switch (err) {
        case RouterError::OK: return "OK";
        case RouterError::NO_LEADER: return "no leader available";
        case RouterError::UNREACHABLE: return "no node reachable";
    }
    return "Unexpect Error";
}

std::string RouterResult::toString() const {
    std::string str = fmt::format("error: {}, node: {}, reply: {}", RouterErrorToString(error), node, reply.toString());
    return "{" + str + "}";
}

Router::Router(const std::vector<std::string>& nodes, NodeClientFactory factory) {
    for (auto& node: nodes) {
        std::string address = TrimScheme(node);
        if (address.empty() || m_clients.count(address)) {
            continue;
        }
        m_nodes.push_back(address);
        m_clients[address] = factory(address);
    }
    SPDLOG_LOGGER_INFO(g_logger, "router with {} nodes: [{}]", m_nodes.size(), fmt::join(m_nodes, ", "));
}

RouterResult Router::put(const std::string& key, const std::string& value) {
    return write([&key, &value](NodeClient::ptr client, uint64_t timeout_ms) {
        return client->put(key, value, timeout_ms);
    });
}

RouterResult Router::del(const std::string& key) {
    return write([&key](NodeClient::ptr client, uint64_t timeout_ms) {
        return client->del(key, timeout_ms);
    });
}

RouterResult Router::get(const std::string& key) {
    return read([&key](NodeClient::ptr client, uint64_t timeout_ms) {
        return client->get(key, timeout_ms);
    });
}

RouterResult Router::write(const Operation& op) {
    const uint64_t timeout = g_forward_timeout->getValue();
    std::string leader = getCachedLeader();
    if (!leader.empty()) {
        NodeReply reply = op(getClient(leader), timeout);
        if (reply.reachable() && !reply.notLeader()) {
            return {.reply = std::move(reply), .node = leader};
        }
        SPDLOG_LOGGER_DEBUG(g_logger, "cached leader {} fails, {}", leader, reply.toString());
        invalidateLeader(leader);
    }

    const uint32_t retries = g_discovery_retries->getValue();
    for (uint32_t i = 0; i < retries; ++i) {
        auto found = discoverLeader();
        if (found) {
            NodeReply reply = op(getClient(*found), timeout);
            if (reply.reachable() && !reply.notLeader()) {
                return {.reply = std::move(reply), .node = *found};
            }
            SPDLOG_LOGGER_DEBUG(g_logger, "discovered leader {} fails, {}", *found, reply.toString());
            invalidateLeader(*found);
        }
        // 选举中，等一会再试
        if (i + 1 < retries) {
            uint64_t backoff = g_discovery_backoff->getValue();
            if (backoff) {
                co_sleep(backoff);
            }
        }
    }
    SPDLOG_LOGGER_WARN(g_logger, "no leader available after {} discovery rounds", retries);
    return {.error = RouterError::NO_LEADER};
}

RouterResult Router::read(const Operation& op) {
    if (m_nodes.empty()) {
        return {.error = RouterError::UNREACHABLE};
    }
    const uint64_t timeout = g_forward_timeout->getValue();
    uint32_t attempts = g_read_retries->getValue();
    // 每次尝试一个不同的节点
    if (!attempts || attempts > m_nodes.size()) {
        attempts = m_nodes.size();
    }
    uint64_t start = m_next.fetch_add(1);
    for (uint32_t i = 0; i < attempts; ++i) {
        const std::string& node = m_nodes[(start + i) % m_nodes.size()];
        NodeReply reply = op(getClient(node), timeout);
        if (!reply.reachable()) {
            SPDLOG_LOGGER_DEBUG(g_logger, "read from {} fails, {}", node, reply.toString());
            continue;
        }
        // 节点只在 leader 上执行读，转给 leader
        if (reply.notLeader()) {
            return write(op);
        }
        return {.reply = std::move(reply), .node = node};
    }
    return {.error = RouterError::UNREACHABLE};
}

std::optional<std::string> Router::discoverLeader() {
    ++m_discoveryRounds;
    const uint64_t timeout = g_forward_timeout->getValue();
    for (auto& node: m_nodes) {
        NodeReply reply = getClient(node)->status(timeout);
        if (!reply.success()) {
            continue;
        }
        auto data = reply.body.find("data");
        if (data == reply.body.end() || !data->is_object()) {
            continue;
        }
        auto state = data->find("state");
        if (state == data->end() || !state->is_string() || state->get<std::string>() != "Leader") {
            continue;
        }
        int64_t shards = 0;
        auto conf = data->find("latest_configuration");
        if (conf != data->end() && conf->is_array()) {
            shards = conf->size();
        }
        std::unique_lock<MutexType> lock(m_mutex);
        m_leader = node;
        m_shardCount = shards;
        lock.unlock();
        SPDLOG_LOGGER_INFO(g_logger, "discovered leader {}", node);
        return node;
    }
    return std::nullopt;
}

Json Router::status() {
    std::string leader = getCachedLeader();
    if (leader.empty()) {
        auto found = discoverLeader();
        if (found) {
            leader = *found;
        }
    }
    std::unique_lock<MutexType> lock(m_mutex);
    Json json{{"nodes", m_nodes}, {"leader", leader}, {"shardCount", m_shardCount}};
    return json;
}

std::string Router::getCachedLeader() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_leader;
}

bool Router::setCachedLeader(const std::string& leader) {
    std::string address = TrimScheme(leader);
    if (!m_clients.count(address)) {
        return false;
    }
    std::unique_lock<MutexType> lock(m_mutex);
    m_leader = address;
    return true;
}

void Router::invalidateLeader(const std::string& leader) {
    std::unique_lock<MutexType> lock(m_mutex);
    if (m_leader == leader) {
        m_leader.clear();
    }
}

NodeClient::ptr Router::getClient(const std::string& address) {
    // m_clients 构造后不再修改，缓存的 leader 一定来自节点列表
    return m_clients.at(address);
}

}

//
// Created by zavier on 2023/1/10.
//

#include "shardkv/common/config.h"
#include "shardkv/http/http_connection.h"
#include "cluster_joiner.h"

namespace shardkv::cluster {
static auto g_logger = GetLogInstance();

static ConfigVar<uint64_t>::ptr g_join_interval =
        Config::Lookup<uint64_t>("cluster.join.interval", 2000, "interval(ms) between two join attempts");

static ConfigVar<uint64_t>::ptr g_join_timeout =
        Config::Lookup<uint64_t>("cluster.join.timeout", 3000, "timeout(ms) of one join request");

ClusterJoiner::ClusterJoiner(int64_t id, const std::string& address, std::vector<std::string> targets,
                             MembershipProbe joined, Requester requester)
    : m_id(id)
    , m_address(TrimScheme(address))
    , m_targets(std::move(targets))
    , m_probe(std::move(joined))
    , m_requester(std::move(requester)) {
}

void ClusterJoiner::start() {
    auto self = shared_from_this();
    go [self] {
        while (!self->m_stop) {
            if (self->m_probe()) {
                self->m_joined = true;
                SPDLOG_LOGGER_INFO(g_logger, "Node[{}] is a member of the cluster", self->m_id);
                return;
            }
            self->tryOnce();
            co_sleep(g_join_interval->getValue());
        }
    };
}

void ClusterJoiner::stop() {
    m_stop = true;
}

bool ClusterJoiner::tryOnce() {
    for (auto& target: m_targets) {
        if (TrimScheme(target) == m_address) {
            continue;
        }
        if (request(target)) {
            return true;
        }
    }
    return false;
}

bool ClusterJoiner::request(const std::string& target) {
    JoinReply reply = m_requester(target, m_id, m_address, g_join_timeout->getValue());
    if (reply.success) {
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] joined the cluster through {}", m_id, target);
        return true;
    }
    std::string leader = TrimScheme(reply.leader);
    if (leader.empty() || leader == TrimScheme(target) || leader == m_address) {
        SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] join through {} fail", m_id, target);
        return false;
    }
    reply = m_requester(leader, m_id, m_address, g_join_timeout->getValue());
    if (reply.success) {
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] joined the cluster through leader {}", m_id, leader);
        return true;
    }
    SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] join through {} and its leader {} fail", m_id, target, leader);
    return false;
}

JoinReply ClusterJoiner::HttpJoin(const std::string& target, int64_t id, const std::string& address, uint64_t timeout_ms) {
    http::Json body{{"nodeid", std::to_string(id)}, {"addr", address}};
    std::string url = "http://" + TrimScheme(target) + "/raft/join";
    auto result = http::HttpConnection::DoPost(url, timeout_ms, {{"Content-Type", "application/json"}}, body.dump());
    if (result->result != http::HttpResult::OK || !result->response) {
        return {};
    }
    http::Json resp = result->response->getJson();
    if (!resp.is_object()) {
        return {};
    }
    JoinReply reply;
    auto success = resp.find("success");
    reply.success = success != resp.end() && success->is_boolean() && success->get<bool>();
    auto hint = resp.find("leader");
    if (hint != resp.end() && hint->is_string()) {
        reply.leader = hint->get<std::string>();
    }
    return reply;
}

}

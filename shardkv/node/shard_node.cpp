//
// Created by zavier on 2023/1/16.
//

#include "shardkv/common/config.h"
#include "shardkv/http/servlets/cluster_servlet.h"
#include "shardkv/http/servlets/kv_servlet.h"
#include "shardkv/http/servlets/raft_servlet.h"
#include "shard_node.h"

namespace shardkv {
static auto g_logger = GetLogInstance();

static ConfigVar<int64_t>::ptr g_node_id =
        Config::Lookup<int64_t>("node.id", 1, "node id, also the shard id");

static ConfigVar<std::string>::ptr g_node_address =
        Config::Lookup<std::string>("node.address", "127.0.0.1:8011", "node http address");

static ConfigVar<std::string>::ptr g_node_data_dir =
        Config::Lookup<std::string>("node.data_dir", "", "raft state directory, default shardkv-node-{id}");

static ConfigVar<std::map<int64_t, std::string>>::ptr g_node_peers =
        Config::Lookup<std::map<int64_t, std::string>>("node.peers", {}, "known shards, shard id to address");

static ConfigVar<std::vector<std::string>>::ptr g_node_join =
        Config::Lookup<std::vector<std::string>>("node.join", {}, "addresses asked to add this node");

static ConfigVar<int64_t>::ptr g_bootstrap_id =
        Config::Lookup<int64_t>("cluster.bootstrap_id", 1, "the only node that bootstraps the cluster");

ShardNodeOptions ShardNodeOptions::FromConfig() {
    ShardNodeOptions options;
    options.id = g_node_id->getValue();
    options.address = TrimScheme(g_node_address->getValue());
    options.dataDir = g_node_data_dir->getValue();
    if (options.dataDir.empty()) {
        options.dataDir = fmt::format("shardkv-node-{}", options.id);
    }
    options.peers = g_node_peers->getValue();
    options.join = g_node_join->getValue();
    options.bootstrapId = g_bootstrap_id->getValue();
    return options;
}

ShardNode::ShardNode(ShardNodeOptions options)
    : m_options(std::move(options)) {
    m_kv = std::make_shared<kv::KVServer>(m_options.id, m_options.address, m_options.dataDir);
    m_peers = std::make_shared<cluster::KnownPeers>();
    for (auto& [id, address]: m_options.peers) {
        if (id == m_options.id) {
            continue;
        }
        m_peers->merge(id, address);
        SPDLOG_LOGGER_INFO(g_logger, "Added peer shard {} at {}", id, address);
    }
    m_broadcaster = std::make_shared<cluster::LeaderBroadcaster>(m_options.id, m_options.address, m_peers);
    m_server = std::make_shared<http::HttpServer>(true);
    m_server->setName("shardkv-node-" + std::to_string(m_options.id));
    registerServlets();
}

ShardNode::~ShardNode() {
    stop();
}

void ShardNode::registerServlets() {
    auto dispatch = m_server->getServletDispatch();
    auto kv_servlet = std::make_shared<http::KVServlet>(m_kv);
    dispatch->addServlet("/put", kv_servlet);
    dispatch->addServlet("/get", kv_servlet);
    dispatch->addServlet("/delete", kv_servlet);

    auto cluster_servlet = std::make_shared<http::ClusterServlet>(m_kv, m_broadcaster);
    dispatch->addServlet("/config", cluster_servlet);
    dispatch->addServlet("/addshard", cluster_servlet);
    dispatch->addServlet("/newleader", cluster_servlet);

    auto raft_servlet = std::make_shared<http::RaftServlet>(m_kv);
    dispatch->addServlet("/raft/join", raft_servlet);
    dispatch->addServlet("/raft/leave", raft_servlet);
    dispatch->addServlet("/raft/status", raft_servlet);

    dispatch->addGlobServlet("/raft/rpc/*", std::make_shared<http::RaftRpcServlet>(m_kv->getRaft()));
}

bool ShardNode::start() {
    Address::ptr address = Address::Resolve(m_options.address);
    if (!address) {
        SPDLOG_LOGGER_ERROR(g_logger, "invalid node address {}", m_options.address);
        return false;
    }
    if (!m_server->bind(address)) {
        SPDLOG_LOGGER_ERROR(g_logger, "Node[{}] bind {} fail", m_options.id, m_options.address);
        return false;
    }
    m_server->start();

    // 先订阅再启动，不会错过第一次当选
    m_broadcaster->attach(m_kv->getRaft());
    if (m_options.id == m_options.bootstrapId) {
        if (m_kv->bootstrap()) {
            SPDLOG_LOGGER_INFO(g_logger, "Node[{}] bootstrapped a single member cluster", m_options.id);
        }
    }
    m_kv->start();

    if (m_options.id != m_options.bootstrapId && !m_options.join.empty()) {
        auto raft = m_kv->getRaft();
        int64_t id = m_options.id;
        m_joiner = std::make_shared<cluster::ClusterJoiner>(m_options.id, m_options.address, m_options.join,
                                                            [raft, id] {
            return raft->committedConfiguration().contains(id);
        });
        m_joiner->start();
    } else if (m_options.id != m_options.bootstrapId) {
        SPDLOG_LOGGER_INFO(g_logger, "Node[{}] is waiting to be joined", m_options.id);
    }
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] serving on {}", m_options.id, m_options.address);
    return true;
}

void ShardNode::stop() {
    if (m_joiner) {
        m_joiner->stop();
    }
    m_broadcaster->stop();
    m_server->stop();
    m_kv->stop();
}

}

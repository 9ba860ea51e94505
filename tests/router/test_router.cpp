//
// Created by zavier on 2023/1/13.
//

#define BOOST_TEST_MODULE test_router

#include <map>
#include <set>
#include <boost/test/unit_test.hpp>
#include "shardkv/common/config.h"
#include "shardkv/router/router.h"

using namespace shardkv;
using namespace shardkv::router;

namespace {
/**
 * 内存里的三节点集群，节点行为和真实节点的 http 接口一致：
 * 只有 leader 执行读写，follower 回复 "This node is not the leader"
 */
struct FakeCluster {
    std::string leader;
    std::set<std::string> down;
    std::map<std::string, std::string> data;
    std::map<std::string, int> calls;
    std::vector<std::string> members;
};

class FakeNodeClient : public NodeClient {
public:
    FakeNodeClient(const std::string& address, std::shared_ptr<FakeCluster> cluster)
        : NodeClient(address), m_cluster(std::move(cluster)) {}

    NodeReply put(const std::string& key, const std::string& value, uint64_t timeout_ms) override {
        if (auto reply = check()) {
            return *reply;
        }
        m_cluster->data[key] = value;
        return {.httpStatus = 200, .body = Json{{"success", true}, {"message", "Key-value pair stored successfully"}}};
    }
    NodeReply get(const std::string& key, uint64_t timeout_ms) override {
        if (auto reply = check()) {
            return *reply;
        }
        auto it = m_cluster->data.find(key);
        if (it == m_cluster->data.end()) {
            return {.httpStatus = 404, .body = Json{{"success", false}, {"key", key}, {"error", "Key not found"}}};
        }
        return {.httpStatus = 200, .body = Json{{"success", true}, {"key", key}, {"value", it->second}}};
    }
    NodeReply del(const std::string& key, uint64_t timeout_ms) override {
        if (auto reply = check()) {
            return *reply;
        }
        m_cluster->data.erase(key);
        return {.httpStatus = 200, .body = Json{{"success", true}}};
    }
    NodeReply status(uint64_t timeout_ms) override {
        if (m_cluster->down.count(m_address)) {
            return {.status = NodeReply::UNREACHABLE, .error = "connect fail"};
        }
        Json conf = Json::array();
        for (auto& member: m_cluster->members) {
            conf.push_back(Json{{"id", conf.size() + 1}, {"address", member}});
        }
        Json data{{"state", m_cluster->leader == m_address ? "Leader" : "Follower"},
                  {"leader", m_cluster->leader},
                  {"latest_configuration", conf}};
        return {.httpStatus = 200, .body = Json{{"success", true}, {"data", data}}};
    }
private:
    std::optional<NodeReply> check() {
        ++m_cluster->calls[m_address];
        if (m_cluster->down.count(m_address)) {
            return NodeReply{.status = NodeReply::UNREACHABLE, .error = "connect fail"};
        }
        if (m_cluster->leader != m_address) {
            return NodeReply{.httpStatus = 400, .body = Json{{"success", false},
                                                           {"error", "This node is not the leader"},
                                                           {"leader", m_cluster->leader}}};
        }
        return std::nullopt;
    }
private:
    std::shared_ptr<FakeCluster> m_cluster;
};

const std::vector<std::string> kNodes = {"127.0.0.1:8011", "127.0.0.1:8021", "127.0.0.1:8031"};

struct RouterFixture {
    RouterFixture() : cluster(std::make_shared<FakeCluster>()) {
        Config::Lookup<uint64_t>("router.discovery.backoff")->setValue(0);
        Config::Lookup<uint32_t>("router.discovery.retries")->setValue(5);
        Config::Lookup<uint32_t>("router.read.retries")->setValue(0);
        cluster->members = kNodes;
        cluster->leader = kNodes[0];
        auto c = cluster;
        router = std::make_shared<Router>(kNodes, [c](const std::string& address) -> NodeClient::ptr {
            return std::make_shared<FakeNodeClient>(address, c);
        });
    }
    std::shared_ptr<FakeCluster> cluster;
    Router::ptr router;
};
}

BOOST_FIXTURE_TEST_SUITE(router_tests, RouterFixture)

BOOST_AUTO_TEST_CASE(nodes_are_deduplicated) {
    Router r({"http://127.0.0.1:8011/", "127.0.0.1:8011", "", "127.0.0.1:8021"}, [](const std::string& address) {
        return std::make_shared<FakeNodeClient>(address, std::make_shared<FakeCluster>());
    });
    BOOST_REQUIRE_EQUAL(r.getNodes().size(), 2);
    BOOST_CHECK_EQUAL(r.getNodes()[0], "127.0.0.1:8011");
}

BOOST_AUTO_TEST_CASE(first_write_discovers_leader) {
    auto res = router->put("k", "v");
    BOOST_CHECK(res.error == RouterError::OK);
    BOOST_CHECK_EQUAL(res.node, kNodes[0]);
    BOOST_CHECK(res.reply.success());
    BOOST_CHECK_EQUAL(router->getDiscoveryRounds(), 1);
    BOOST_CHECK_EQUAL(router->getCachedLeader(), kNodes[0]);
    BOOST_CHECK_EQUAL(cluster->data["k"], "v");
}

BOOST_AUTO_TEST_CASE(cached_leader_skips_discovery) {
    router->put("a", "1");
    router->put("b", "2");
    router->del("a");
    BOOST_CHECK_EQUAL(router->getDiscoveryRounds(), 1);
    BOOST_CHECK_EQUAL(cluster->calls[kNodes[0]], 3);
    BOOST_CHECK(!cluster->data.count("a"));
}

BOOST_AUTO_TEST_CASE(failover_after_not_leader) {
    router->put("a", "1");
    cluster->leader = kNodes[2];
    auto res = router->put("a", "2");
    BOOST_CHECK(res.error == RouterError::OK);
    BOOST_CHECK_EQUAL(res.node, kNodes[2]);
    // 缓存失效后只需要一轮发现
    BOOST_CHECK_EQUAL(router->getDiscoveryRounds(), 2);
    BOOST_CHECK_EQUAL(router->getCachedLeader(), kNodes[2]);
    BOOST_CHECK_EQUAL(cluster->data["a"], "2");
}

BOOST_AUTO_TEST_CASE(failover_after_leader_crash) {
    router->put("a", "1");
    cluster->down.insert(kNodes[0]);
    cluster->leader = kNodes[1];
    auto res = router->put("a", "2");
    BOOST_CHECK(res.error == RouterError::OK);
    BOOST_CHECK_EQUAL(res.node, kNodes[1]);
    BOOST_CHECK_EQUAL(router->getDiscoveryRounds(), 2);
}

BOOST_AUTO_TEST_CASE(no_leader_after_retries) {
    Config::Lookup<uint32_t>("router.discovery.retries")->setValue(3);
    cluster->leader.clear();
    auto res = router->put("a", "1");
    BOOST_CHECK(res.error == RouterError::NO_LEADER);
    BOOST_CHECK_EQUAL(RouterErrorToString(res.error), "no leader available");
    BOOST_CHECK_EQUAL(router->getDiscoveryRounds(), 3);
    BOOST_CHECK(router->getCachedLeader().empty());
    BOOST_CHECK(cluster->data.empty());
}

BOOST_AUTO_TEST_CASE(read_falls_back_to_leader) {
    cluster->data["k"] = "v";
    // 轮询的每个起点最终都读到 leader 上的值
    for (int i = 0; i < 3; ++i) {
        auto res = router->get("k");
        BOOST_CHECK(res.error == RouterError::OK);
        BOOST_CHECK_EQUAL(res.node, kNodes[0]);
        BOOST_CHECK_EQUAL(res.reply.body["value"], "v");
    }
    auto res = router->get("absent");
    BOOST_CHECK(res.error == RouterError::OK);
    BOOST_CHECK_EQUAL(res.reply.httpStatus, 404);
}

BOOST_AUTO_TEST_CASE(read_skips_unreachable_nodes) {
    cluster->data["k"] = "v";
    cluster->down.insert(kNodes[1]);
    cluster->down.insert(kNodes[2]);
    for (int i = 0; i < 3; ++i) {
        auto res = router->get("k");
        BOOST_CHECK(res.error == RouterError::OK);
        BOOST_CHECK_EQUAL(res.reply.body["value"], "v");
    }
    cluster->down.insert(kNodes[0]);
    BOOST_CHECK(router->get("k").error == RouterError::UNREACHABLE);
}

BOOST_AUTO_TEST_CASE(read_tries_each_node_once) {
    Config::Lookup<uint32_t>("router.read.retries")->setValue(10);
    for (auto& node: kNodes) {
        cluster->down.insert(node);
    }
    BOOST_CHECK(router->get("k").error == RouterError::UNREACHABLE);
    for (auto& node: kNodes) {
        BOOST_CHECK_EQUAL(cluster->calls[node], 1);
    }

    Config::Lookup<uint32_t>("router.read.retries")->setValue(2);
    cluster->calls.clear();
    BOOST_CHECK(router->get("k").error == RouterError::UNREACHABLE);
    int total = 0;
    for (auto& [node, calls]: cluster->calls) {
        BOOST_CHECK_EQUAL(calls, 1);
        total += calls;
    }
    BOOST_CHECK_EQUAL(total, 2);
}

BOOST_AUTO_TEST_CASE(status_reports_leader_and_shards) {
    Json status = router->status();
    BOOST_CHECK_EQUAL(status["leader"], kNodes[0]);
    BOOST_CHECK_EQUAL(status["shardCount"], 3);
    BOOST_CHECK_EQUAL(status["nodes"].size(), 3);
}

BOOST_AUTO_TEST_CASE(cached_leader_only_from_node_list) {
    BOOST_CHECK(!router->setCachedLeader("10.0.0.1:8011"));
    BOOST_CHECK(router->setCachedLeader("http://127.0.0.1:8021"));
    BOOST_CHECK_EQUAL(router->getCachedLeader(), kNodes[1]);
    // 错误的缓存会被纠正
    auto res = router->put("a", "1");
    BOOST_CHECK_EQUAL(res.node, kNodes[0]);
}

BOOST_AUTO_TEST_SUITE_END()

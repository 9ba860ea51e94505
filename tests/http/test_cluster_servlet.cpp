//
// Created by zavier on 2023/1/14.
//

#define BOOST_TEST_MODULE test_cluster_servlet

#include <unistd.h>
#include <filesystem>
#include <thread>
#include <boost/test/unit_test.hpp>
#include <libgo/libgo.h>
#include "shardkv/cluster/leader_broadcaster.h"
#include "shardkv/http/servlets/api_response.h"
#include "shardkv/http/servlets/cluster_servlet.h"
#include "shardkv/kv/kv_server.h"

using namespace shardkv;
using namespace shardkv::http;

namespace {
// 转发在协程里执行
struct SchedulerFixture {
    SchedulerFixture() {
        m_thread = std::thread([] {
            co_sched.Start(2);
        });
    }
    ~SchedulerFixture() {
        co_sched.Stop();
        m_thread.join();
    }
    std::thread m_thread;
};

/**
 * 未启动的 shard 2，最多记住两个 shard
 */
struct ServletFixture {
    ServletFixture() {
        dir = std::filesystem::temp_directory_path() /
                fmt::format("shardkv-cluster-servlet-{}-{}", getpid(), GetCurrentUS());
        store = std::make_shared<kv::KVServer>(2, "127.0.0.1:8021", dir.string(),
                [](int64_t, const std::string&) -> raft::RaftPeer::ptr {
                    return nullptr;
                });
        peers = std::make_shared<cluster::KnownPeers>(2);
        broadcaster = std::make_shared<cluster::LeaderBroadcaster>(2, "127.0.0.1:8021", peers,
                [](const std::string&, const cluster::LeaderInfo&, uint64_t) {
                    return true;
                });
        servlet = std::make_shared<ClusterServlet>(store, broadcaster);
    }
    ~ServletFixture() {
        broadcaster->stop();
        store.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    HttpResponse::ptr call(const std::string& path, const std::string& body = "") {
        HttpRequest::ptr request = std::make_shared<HttpRequest>();
        request->setMethod(body.empty() ? HttpMethod::GET : HttpMethod::POST);
        request->setPath(path);
        if (!body.empty()) {
            request->setHeader("Content-Type", "application/json");
            request->setBody(body);
        }
        request->initParams();
        HttpResponse::ptr response = std::make_shared<HttpResponse>();
        BOOST_CHECK_EQUAL(servlet->handle(request, response, nullptr), 0);
        return response;
    }

    std::filesystem::path dir;
    kv::KVServer::ptr store;
    cluster::KnownPeers::ptr peers;
    cluster::LeaderBroadcaster::ptr broadcaster;
    ClusterServlet::ptr servlet;
};
}

BOOST_TEST_GLOBAL_FIXTURE(SchedulerFixture);

BOOST_FIXTURE_TEST_SUITE(cluster_servlet_tests, ServletFixture)

BOOST_AUTO_TEST_CASE(config_falls_back_to_known_peers) {
    peers->merge(1, "127.0.0.1:8011");
    auto response = call("/config");
    BOOST_CHECK(response->getStatus() == HttpStatus::OK);
    Json body = Json::parse(response->getBody());
    BOOST_CHECK_EQUAL(body["success"], true);
    BOOST_CHECK_EQUAL(body["data"]["shardCount"], 2);
    BOOST_CHECK_EQUAL(body["data"]["shards"]["1"], "127.0.0.1:8011");
    BOOST_CHECK_EQUAL(body["data"]["shards"]["2"], "127.0.0.1:8021");
}

BOOST_AUTO_TEST_CASE(config_follows_membership) {
    peers->merge(1, "127.0.0.1:8011");
    BOOST_REQUIRE(store->bootstrap());
    Json body = Json::parse(call("/config")->getBody());
    // 有成员配置时不再使用 KnownPeers
    BOOST_CHECK_EQUAL(body["data"]["shardCount"], 1);
    BOOST_CHECK_EQUAL(body["data"]["shards"]["2"], "127.0.0.1:8021");
    BOOST_CHECK(!body["data"]["shards"].contains("1"));
}

BOOST_AUTO_TEST_CASE(shard_requests_are_validated) {
    auto expect = [this](const std::string& body, const std::string& error) {
        auto response = call("/addshard", body);
        BOOST_CHECK(response->getStatus() == HttpStatus::BAD_REQUEST);
        BOOST_CHECK_EQUAL(Json::parse(response->getBody())["error"], error);
    };
    expect("{not json", "Invalid JSON format");
    expect(R"({"shardAddress":"127.0.0.1:8011"})", "ShardID and ShardAddress are required");
    expect(R"({"shardID":1,"shardAddress":""})", "ShardID and ShardAddress are required");
    expect(R"({"shardID":"one","shardAddress":"127.0.0.1:8011"})", "Invalid shard ID format");
    expect(R"({"shardID":1,"shardAddress":"127.0.0.1:8011","term":"x"})", "Invalid term format");
    BOOST_CHECK_EQUAL(peers->size(), 0);
}

BOOST_AUTO_TEST_CASE(new_leader_is_merged) {
    auto response = call("/newleader", R"({"shardID":"1","address":"127.0.0.1:8011","term":3})");
    BOOST_CHECK(response->getStatus() == HttpStatus::OK);
    Json body = Json::parse(response->getBody());
    BOOST_CHECK_EQUAL(body["message"], "Leader information updated successfully");
    BOOST_CHECK_EQUAL(body["data"]["result"], "ADDED");
    BOOST_REQUIRE(peers->get(1));
    BOOST_CHECK_EQUAL(peers->get(1)->term, 3);

    body = Json::parse(call("/newleader", R"({"shardID":1,"shardAddress":"127.0.0.1:9011","term":2})")->getBody());
    BOOST_CHECK_EQUAL(body["data"]["result"], "STALE");
    BOOST_CHECK_EQUAL(peers->get(1)->address, "127.0.0.1:8011");
}

BOOST_AUTO_TEST_CASE(full_known_peers_is_an_error) {
    BOOST_CHECK(call("/addshard", R"({"shardID":1,"shardAddress":"127.0.0.1:8011"})")->getStatus() == HttpStatus::OK);
    BOOST_CHECK(call("/addshard", R"({"shardID":3,"shardAddress":"127.0.0.1:8031"})")->getStatus() == HttpStatus::OK);
    auto response = call("/addshard", R"({"shardID":4,"shardAddress":"127.0.0.1:8041"})");
    BOOST_CHECK(response->getStatus() == HttpStatus::INTERNAL_SERVER_ERROR);
    BOOST_CHECK_EQUAL(Json::parse(response->getBody())["error"], "Known peers map is full");
    BOOST_CHECK_EQUAL(peers->size(), 2);
}

BOOST_AUTO_TEST_SUITE_END()

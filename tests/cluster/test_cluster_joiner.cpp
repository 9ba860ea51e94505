//
// Created by zavier on 2023/1/10.
//

#define BOOST_TEST_MODULE test_cluster_joiner

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <libgo/libgo.h>
#include "shardkv/common/config.h"
#include "shardkv/cluster/cluster_joiner.h"

using namespace shardkv;
using namespace shardkv::cluster;

namespace {
struct SchedulerFixture {
    SchedulerFixture() {
        Config::Lookup<uint64_t>("cluster.join.interval")->setValue(20);
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
 * 按地址返回预设的应答，并记录请求过的地址
 */
struct FakeCluster {
    std::mutex mutex;
    std::vector<std::string> requests;
    std::map<std::string, JoinReply> replies;

    ClusterJoiner::Requester requester() {
        return [this](const std::string& target, int64_t id, const std::string& address, uint64_t timeout_ms) {
            std::lock_guard<std::mutex> lock(mutex);
            requests.push_back(target);
            auto it = replies.find(target);
            return it == replies.end() ? JoinReply{} : it->second;
        };
    }
    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.size();
    }
};

bool WaitUntil(const std::function<bool()>& pred, int timeout_ms = 3000) {
    for (int i = 0; i < timeout_ms / 10; ++i) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

const std::vector<std::string> kTargets = {"127.0.0.1:8011", "http://127.0.0.1:8021", "127.0.0.1:8031"};
}

BOOST_TEST_GLOBAL_FIXTURE(SchedulerFixture);

BOOST_AUTO_TEST_SUITE(cluster_joiner_tests)

BOOST_AUTO_TEST_CASE(skips_own_address) {
    FakeCluster cluster;
    auto joiner = std::make_shared<ClusterJoiner>(2, "http://127.0.0.1:8021", kTargets,
                                                  [] { return false; }, cluster.requester());
    BOOST_CHECK(!joiner->tryOnce());
    BOOST_CHECK_EQUAL(cluster.requests.size(), 2);
    for (auto& target: cluster.requests) {
        BOOST_CHECK(target != "http://127.0.0.1:8021");
    }
}

BOOST_AUTO_TEST_CASE(follows_leader_hint_once) {
    FakeCluster cluster;
    cluster.replies["127.0.0.1:8011"] = {.success = false, .leader = "127.0.0.1:8031"};
    cluster.replies["127.0.0.1:8031"] = {.success = true};
    auto joiner = std::make_shared<ClusterJoiner>(2, "127.0.0.1:8021", kTargets,
                                                  [] { return false; }, cluster.requester());
    BOOST_CHECK(joiner->tryOnce());
    BOOST_REQUIRE_EQUAL(cluster.requests.size(), 2);
    BOOST_CHECK_EQUAL(cluster.requests[0], "127.0.0.1:8011");
    BOOST_CHECK_EQUAL(cluster.requests[1], "127.0.0.1:8031");

    // 提示指向另一个非 leader 时不再继续跟随
    FakeCluster chain;
    chain.replies["127.0.0.1:8011"] = {.success = false, .leader = "127.0.0.1:8041"};
    chain.replies["127.0.0.1:8041"] = {.success = false, .leader = "127.0.0.1:8051"};
    joiner = std::make_shared<ClusterJoiner>(2, "127.0.0.1:8021", std::vector<std::string>{"127.0.0.1:8011"},
                                             [] { return false; }, chain.requester());
    BOOST_CHECK(!joiner->tryOnce());
    BOOST_REQUIRE_EQUAL(chain.requests.size(), 2);
    BOOST_CHECK_EQUAL(chain.requests[1], "127.0.0.1:8041");

    // 提示指向自己或请求的地址时忽略
    FakeCluster self;
    self.replies["127.0.0.1:8011"] = {.success = false, .leader = "http://127.0.0.1:8021"};
    joiner = std::make_shared<ClusterJoiner>(2, "127.0.0.1:8021", std::vector<std::string>{"127.0.0.1:8011"},
                                             [] { return false; }, self.requester());
    BOOST_CHECK(!joiner->tryOnce());
    BOOST_CHECK_EQUAL(self.requests.size(), 1);
}

BOOST_AUTO_TEST_CASE(retries_until_member) {
    FakeCluster cluster;
    cluster.replies["127.0.0.1:8011"] = {.success = true};
    std::atomic<int> probes{0};
    // 加入请求成功之后，直到成员配置提交才算完成
    auto joiner = std::make_shared<ClusterJoiner>(2, "127.0.0.1:8021", kTargets,
                                                  [&probes] { return ++probes > 3; }, cluster.requester());
    BOOST_CHECK(!joiner->isJoined());
    joiner->start();
    BOOST_CHECK(WaitUntil([&joiner] { return joiner->isJoined(); }));
    BOOST_CHECK_EQUAL(cluster.count(), 3);
    joiner->stop();
}

BOOST_AUTO_TEST_CASE(stop_ends_retries) {
    FakeCluster cluster;
    auto joiner = std::make_shared<ClusterJoiner>(2, "127.0.0.1:8021", kTargets,
                                                  [] { return false; }, cluster.requester());
    joiner->start();
    BOOST_REQUIRE(WaitUntil([&cluster] { return cluster.count() >= 4; }));
    joiner->stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    size_t stopped = cluster.count();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    BOOST_CHECK_EQUAL(cluster.count(), stopped);
    BOOST_CHECK(!joiner->isJoined());
}

BOOST_AUTO_TEST_SUITE_END()

//
// Created by zavier on 2023/1/9.
//

#define BOOST_TEST_MODULE test_leader_broadcaster

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <boost/test/unit_test.hpp>
#include <libgo/libgo.h>
#include "shardkv/common/config.h"
#include "shardkv/cluster/leader_broadcaster.h"

using namespace shardkv;
using namespace shardkv::cluster;

namespace {
// 推送在协程里执行，调度器跑在后台线程
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

struct Recorder {
    std::mutex mutex;
    std::vector<std::pair<std::string, LeaderInfo>> pushes;

    LeaderBroadcaster::Pusher pusher(bool ok = true) {
        return [this, ok](const std::string& peer, const LeaderInfo& info, uint64_t timeout_ms) {
            std::lock_guard<std::mutex> lock(mutex);
            pushes.emplace_back(peer, info);
            return ok;
        };
    }
    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return pushes.size();
    }
    /**
     * 等待至少 n 次推送，超时返回 false
     */
    bool waitFor(size_t n, int timeout_ms = 3000) {
        for (int i = 0; i < timeout_ms / 10; ++i) {
            if (count() >= n) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return count() >= n;
    }
    std::set<std::string> peers() {
        std::lock_guard<std::mutex> lock(mutex);
        std::set<std::string> res;
        for (auto& push: pushes) {
            res.insert(push.first);
        }
        return res;
    }
};

struct BroadcasterFixture {
    BroadcasterFixture() : peers(std::make_shared<KnownPeers>(16)) {
        peers->merge(1, "127.0.0.1:8011");
        peers->merge(2, "127.0.0.1:8021");
        peers->merge(3, "127.0.0.1:8031");
        broadcaster = std::make_shared<LeaderBroadcaster>(1, "127.0.0.1:8011", peers, recorder.pusher());
    }
    ~BroadcasterFixture() {
        broadcaster->stop();
        // 等待残留的推送协程结束
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    Recorder recorder;
    KnownPeers::ptr peers;
    LeaderBroadcaster::ptr broadcaster;
};
}

BOOST_TEST_GLOBAL_FIXTURE(SchedulerFixture);

BOOST_FIXTURE_TEST_SUITE(leader_broadcaster_tests, BroadcasterFixture)

BOOST_AUTO_TEST_CASE(leader_announces_itself) {
    broadcaster->onStateChange(raft::Leader, 3);
    BOOST_REQUIRE(recorder.waitFor(2));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    BOOST_CHECK_EQUAL(recorder.count(), 2);
    BOOST_CHECK(recorder.peers() == (std::set<std::string>{"127.0.0.1:8021", "127.0.0.1:8031"}));
    std::lock_guard<std::mutex> lock(recorder.mutex);
    for (auto& [peer, info]: recorder.pushes) {
        BOOST_CHECK_EQUAL(info.shardId, 1);
        BOOST_CHECK_EQUAL(info.address, "127.0.0.1:8011");
        BOOST_CHECK_EQUAL(info.term.value_or(0), 3);
    }
    BOOST_CHECK_EQUAL(peers->get(1)->term, 3);
}

BOOST_AUTO_TEST_CASE(follower_stays_quiet) {
    broadcaster->onStateChange(raft::Follower, 4);
    broadcaster->onStateChange(raft::Candidate, 5);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    BOOST_CHECK_EQUAL(recorder.count(), 0);
}

BOOST_AUTO_TEST_CASE(new_shard_is_forwarded_once) {
    LeaderInfo info{.shardId = 4, .address = "127.0.0.1:8041", .term = 1};
    BOOST_CHECK(broadcaster->receive(info) == MergeResult::ADDED);
    BOOST_REQUIRE(recorder.waitFor(2));
    // 不转发给自己和被广播的 shard
    BOOST_CHECK(recorder.peers() == (std::set<std::string>{"127.0.0.1:8021", "127.0.0.1:8031"}));

    BOOST_CHECK(broadcaster->receive(info) == MergeResult::UNCHANGED);
    info.term = 0;
    BOOST_CHECK(broadcaster->receive(info) == MergeResult::STALE);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    BOOST_CHECK_EQUAL(recorder.count(), 2);
    BOOST_CHECK_EQUAL(peers->get(4)->address, "127.0.0.1:8041");
}

BOOST_AUTO_TEST_CASE(leader_change_is_forwarded) {
    BOOST_CHECK(broadcaster->receive({.shardId = 2, .address = "127.0.0.1:9021", .term = 2}) == MergeResult::UPDATED);
    BOOST_REQUIRE(recorder.waitFor(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    BOOST_CHECK(recorder.peers() == (std::set<std::string>{"127.0.0.1:8031"}));
    BOOST_CHECK_EQUAL(peers->get(2)->address, "127.0.0.1:9021");
}

BOOST_AUTO_TEST_CASE(failed_push_is_dropped) {
    auto failing = std::make_shared<LeaderBroadcaster>(1, "127.0.0.1:8011", peers, recorder.pusher(false));
    failing->onStateChange(raft::Leader, 7);
    BOOST_REQUIRE(recorder.waitFor(2));
    BOOST_CHECK_EQUAL(peers->get(1)->term, 7);
    failing->stop();
}

BOOST_AUTO_TEST_CASE(polling_detects_leadership) {
    Config::Lookup<uint64_t>("cluster.observer.interval")->setValue(20);
    std::atomic<int> probes{0};
    broadcaster->poll([&probes]() -> std::pair<raft::RaftState, int64_t> {
        ++probes;
        return {raft::Leader, 5};
    });
    BOOST_REQUIRE(recorder.waitFor(2));
    while (probes < 5) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    broadcaster->stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    // 状态不变时只广播一次
    BOOST_CHECK_EQUAL(recorder.count(), 2);
}

BOOST_AUTO_TEST_CASE(stop_from_another_thread) {
    // 状态变更在调度器的协程里到达，stop 在测试线程里调用
    std::atomic<bool> running{true};
    std::atomic<int> changes{0};
    go [this, &running, &changes] {
        int64_t term = 1;
        while (running) {
            broadcaster->onStateChange(raft::Leader, term++);
            ++changes;
            co_sleep(1);
        }
    };
    BOOST_REQUIRE(recorder.waitFor(2));
    broadcaster->stop();
    // 正在执行的一次变更可能已经越过检查
    int seen = changes;
    while (changes < seen + 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    size_t stopped = recorder.count();
    int before = changes;
    while (changes < before + 5) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    BOOST_CHECK_EQUAL(recorder.count(), stopped);
    BOOST_CHECK(broadcaster->receive({.shardId = 5, .address = "127.0.0.1:8051", .term = 1}) == MergeResult::ADDED);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    BOOST_CHECK_EQUAL(recorder.count(), stopped);
    running = false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
}

BOOST_AUTO_TEST_SUITE_END()

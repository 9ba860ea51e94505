//
// Created by zavier on 2022/11/28.
//

#define BOOST_TEST_MODULE test_persister

#include <sys/wait.h>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <boost/test/unit_test.hpp>
#include "shardkv/common/util.h"
#include "shardkv/kv/kv_fsm.h"
#include "shardkv/raft/persister.h"
#include "shardkv/raft/raft_log.h"
#include "shardkv/raft/raft_node.h"

using namespace shardkv;
using namespace shardkv::raft;

namespace {
struct TempDir {
    TempDir() {
        path = std::filesystem::temp_directory_path() /
                fmt::format("shardkv-persister-{}-{}", getpid(), GetCurrentUS());
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::filesystem::path path;
};

std::vector<Entry> MakeEntries() {
    std::vector<Entry> ents;
    // 第一条是虚拟日志
    ents.emplace_back();
    ents.push_back({.index = 1, .term = 2, .type = EntryType::NORMAL, .data = std::string("entry\0bin", 9)});
    ents.push_back({.index = 2, .term = 2, .type = EntryType::NOOP});
    return ents;
}
}

BOOST_FIXTURE_TEST_SUITE(persister_tests, TempDir)

BOOST_AUTO_TEST_CASE(nothing_persisted) {
    Persister persister(path);
    BOOST_CHECK(std::filesystem::is_directory(path));
    BOOST_CHECK(!persister.loadHardState());
    BOOST_CHECK(!persister.loadEntries());
    BOOST_CHECK(!persister.loadSnapshot());
    BOOST_CHECK_EQUAL(persister.getRaftStateSize(), -1);
}

BOOST_AUTO_TEST_CASE(state_survives_restart) {
    HardState hs{.term = 2, .vote = 3, .commit = 1};
    {
        Persister persister(path);
        BOOST_REQUIRE(persister.persist(hs, MakeEntries()));
        BOOST_CHECK_GT(persister.getRaftStateSize(), 0);
    }
    Persister persister(path);
    auto loaded = persister.loadHardState();
    BOOST_REQUIRE(loaded);
    BOOST_CHECK(*loaded == hs);
    auto ents = persister.loadEntries();
    BOOST_REQUIRE(ents);
    BOOST_REQUIRE_EQUAL(ents->size(), 3);
    BOOST_CHECK_EQUAL((*ents)[1].data, std::string("entry\0bin", 9));
    BOOST_CHECK((*ents)[2].type == EntryType::NOOP);
    BOOST_CHECK_GT(persister.getRaftStateSize(), 0);

    RaftLog log(std::make_shared<Persister>(path));
    BOOST_CHECK_EQUAL(log.lastIndex(), 2);
    BOOST_CHECK_EQUAL(log.committed(), 1);
    BOOST_CHECK_EQUAL(log.applied(), 0);
}

BOOST_AUTO_TEST_CASE(snapshot_survives_restart) {
    Snapshot::ptr snap = std::make_shared<Snapshot>();
    snap->metadata.index = 5;
    snap->metadata.term = 2;
    snap->metadata.configuration.addVoter(1, "127.0.0.1:8011");
    snap->data = "snap";
    {
        Persister persister(path);
        std::vector<Entry> ents{{.index = 5, .term = 2}};
        BOOST_REQUIRE(persister.persist({.term = 2, .vote = 1, .commit = 5}, ents, snap));
    }
    Persister persister(path);
    auto loaded = persister.loadSnapshot();
    BOOST_REQUIRE(loaded);
    BOOST_CHECK_EQUAL(loaded->metadata.index, 5);
    BOOST_CHECK_EQUAL(loaded->metadata.term, 2);
    BOOST_CHECK(loaded->metadata.configuration == snap->metadata.configuration);
    BOOST_CHECK_EQUAL(loaded->data, "snap");

    // 新快照替换旧快照
    snap->metadata.index = 9;
    snap->data = "newer";
    BOOST_REQUIRE(persister.persist({.term = 2, .vote = 1, .commit = 9}, {{.index = 9, .term = 2}}, snap));
    BOOST_CHECK_EQUAL(persister.loadSnapshot()->data, "newer");
}

BOOST_AUTO_TEST_CASE(snapshot_behind_log_offset_stops_node) {
    Snapshot::ptr snap = std::make_shared<Snapshot>();
    snap->metadata.index = 5;
    snap->metadata.term = 2;
    snap->data = "{}";
    {
        Persister persister(path);
        BOOST_REQUIRE(persister.persist({.term = 2, .vote = 1, .commit = 5}, {{.index = 5, .term = 2}}, snap));
        // 日志压缩到了 9，但 9 的快照没有落盘
        BOOST_REQUIRE(persister.persist({.term = 2, .vote = 1, .commit = 9}, {{.index = 9, .term = 2}}));
    }
    BOOST_REQUIRE_EQUAL(Persister(path).loadSnapshot()->metadata.index, 5);

    // 节点在启动时直接退出，放在子进程里运行
    pid_t pid = fork();
    BOOST_REQUIRE_GE(pid, 0);
    if (pid == 0) {
        auto node = std::make_shared<RaftNode>(1, "127.0.0.1:8011", std::make_shared<Persister>(path),
                                               std::make_shared<kv::KVStateMachine>());
        node->start();
        _exit(0);
    }
    int status = 0;
    BOOST_REQUIRE_EQUAL(waitpid(pid, &status, 0), pid);
    BOOST_REQUIRE(WIFEXITED(status));
    BOOST_CHECK_EQUAL(WEXITSTATUS(status), EXIT_FAILURE);
}

BOOST_AUTO_TEST_SUITE_END()

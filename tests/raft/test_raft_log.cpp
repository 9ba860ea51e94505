//
// Created by zavier on 2022/7/12.
//

#define BOOST_TEST_MODULE test_raft_log

#include <boost/test/unit_test.hpp>
#include "shardkv/raft/raft_log.h"

using namespace shardkv::raft;

namespace {
std::vector<Entry> MakeEntries(int64_t from, int64_t to, int64_t term) {
    std::vector<Entry> ents;
    for (int64_t i = from; i <= to; ++i) {
        ents.push_back({.index = i, .term = term, .data = "cmd" + std::to_string(i)});
    }
    return ents;
}
}

BOOST_AUTO_TEST_SUITE(raft_log_tests)

BOOST_AUTO_TEST_CASE(empty_log) {
    RaftLog log(nullptr);
    BOOST_CHECK_EQUAL(log.lastIndex(), 0);
    BOOST_CHECK_EQUAL(log.lastTerm(), 0);
    BOOST_CHECK_EQUAL(log.firstIndex(), 1);
    BOOST_CHECK_EQUAL(log.committed(), 0);
    BOOST_CHECK(!log.hasNextEntries());
    BOOST_CHECK(log.matchLog(0, 0));
}

BOOST_AUTO_TEST_CASE(append_and_commit) {
    RaftLog log(nullptr);
    BOOST_CHECK_EQUAL(log.append(MakeEntries(1, 3, 1)), 3);
    BOOST_CHECK_EQUAL(log.lastTerm(), 1);
    BOOST_CHECK(log.hasUnstable());
    log.commitTo(2);
    BOOST_CHECK_EQUAL(log.committed(), 2);
    auto next = log.nextEntries();
    BOOST_REQUIRE_EQUAL(next.size(), 2);
    BOOST_CHECK_EQUAL(next.back().data, "cmd2");
    log.appliedTo(2);
    BOOST_CHECK(!log.hasNextEntries());
    // commit 超出日志范围时不推进
    log.commitTo(10);
    BOOST_CHECK_EQUAL(log.committed(), 2);
}

BOOST_AUTO_TEST_CASE(maybe_append_overwrites_conflicts) {
    RaftLog log(nullptr);
    log.append(MakeEntries(1, 4, 1));
    log.commitTo(1);
    // prev 不匹配
    BOOST_CHECK_EQUAL(log.maybeAppend(4, 2, MakeEntries(5, 5, 2)), -1);
    // 从 3 开始冲突
    BOOST_CHECK_EQUAL(log.maybeAppend(2, 1, MakeEntries(3, 3, 2)), 3);
    BOOST_CHECK_EQUAL(log.term(3), 2);
    // 已有日志和新日志相同，不截断后面的日志
    log.append(MakeEntries(4, 5, 2));
    BOOST_CHECK_EQUAL(log.maybeAppend(2, 1, MakeEntries(3, 3, 2)), 3);
    BOOST_CHECK_EQUAL(log.lastIndex(), 5);
}

BOOST_AUTO_TEST_CASE(find_conflict_skips_term) {
    RaftLog log(nullptr);
    log.append(MakeEntries(1, 2, 1));
    log.append(MakeEntries(3, 6, 2));
    BOOST_CHECK_EQUAL(log.findConflict(10, 3), 7);
    BOOST_CHECK_EQUAL(log.findConflict(5, 3), 3);
    BOOST_CHECK_EQUAL(log.findConflict(2, 2), 1);
}

BOOST_AUTO_TEST_CASE(up_to_date) {
    RaftLog log(nullptr);
    log.append(MakeEntries(1, 3, 2));
    BOOST_CHECK(log.isUpToDate(3, 2));
    BOOST_CHECK(log.isUpToDate(1, 3));
    BOOST_CHECK(!log.isUpToDate(2, 2));
    BOOST_CHECK(!log.isUpToDate(10, 1));
}

BOOST_AUTO_TEST_CASE(leader_commits_only_current_term) {
    RaftLog log(nullptr);
    log.append(MakeEntries(1, 2, 1));
    log.append(MakeEntries(3, 3, 2));
    BOOST_CHECK(!log.maybeCommit(2, 2));
    BOOST_CHECK(log.maybeCommit(3, 2));
    BOOST_CHECK_EQUAL(log.committed(), 3);
}

BOOST_AUTO_TEST_CASE(compact_and_snapshot) {
    RaftLog log(nullptr);
    log.append(MakeEntries(1, 5, 1));
    log.commitTo(4);
    Configuration conf;
    conf.addVoter(1, "127.0.0.1:8011");
    BOOST_CHECK(!log.createSnapshot(5, "data", conf));
    auto snap = log.createSnapshot(3, "data", conf);
    BOOST_REQUIRE(snap);
    BOOST_CHECK_EQUAL(snap->metadata.index, 3);
    BOOST_CHECK_EQUAL(snap->metadata.term, 1);
    BOOST_CHECK(snap->metadata.configuration == conf);

    BOOST_CHECK(log.compact(3));
    BOOST_CHECK_EQUAL(log.lastSnapshotIndex(), 3);
    BOOST_CHECK_EQUAL(log.firstIndex(), 4);
    BOOST_CHECK_EQUAL(log.lastIndex(), 5);
    BOOST_CHECK_EQUAL(log.term(2), -1);
    BOOST_CHECK(log.matchLog(3, 1));
    BOOST_CHECK(!log.compact(2));
    BOOST_CHECK_EQUAL(log.entries(4).size(), 2);
}

BOOST_AUTO_TEST_CASE(clear_entries_to_snapshot) {
    RaftLog log(nullptr);
    log.append(MakeEntries(1, 3, 1));
    log.clearEntries(10, 4);
    BOOST_CHECK_EQUAL(log.lastIndex(), 10);
    BOOST_CHECK_EQUAL(log.lastTerm(), 4);
    BOOST_CHECK(log.entries(11).empty());
}

BOOST_AUTO_TEST_CASE(last_config_entry) {
    RaftLog log(nullptr);
    Configuration conf;
    conf.addVoter(1, "a");
    log.append({.index = 1, .term = 1, .type = EntryType::CONFIGURATION, .data = conf.encode()});
    log.append({.index = 2, .term = 1, .type = EntryType::NORMAL, .data = "x"});
    conf.addVoter(2, "b");
    log.append({.index = 3, .term = 1, .type = EntryType::CONFIGURATION, .data = conf.encode()});

    auto ent = log.lastConfigEntry();
    BOOST_REQUIRE(ent);
    BOOST_CHECK_EQUAL(ent->index, 3);
    ent = log.lastConfigEntry(2);
    BOOST_REQUIRE(ent);
    BOOST_CHECK_EQUAL(ent->index, 1);
    BOOST_CHECK_EQUAL(Configuration::Decode(ent->data)->servers.size(), 1);
}

BOOST_AUTO_TEST_CASE(slice_respects_limit) {
    RaftLog log(nullptr, 2);
    log.append(MakeEntries(1, 5, 1));
    BOOST_CHECK_EQUAL(log.entries(1).size(), 2);
    BOOST_CHECK(log.slice(0, 3, RaftLog::NO_LIMIT).empty());
    BOOST_CHECK(log.entries(6).empty());
}

BOOST_AUTO_TEST_SUITE_END()

//
// Created by zavier on 2022/12/5.
//

#define BOOST_TEST_MODULE test_kv_fsm

#include <boost/test/unit_test.hpp>
#include "shardkv/kv/kv_fsm.h"

using namespace shardkv::kv;

namespace {
CommandResult Apply(KVStateMachine& fsm, const Command& command) {
    std::string res = fsm.apply(EncodeCommand(command));
    return Json::parse(res).get<CommandResult>();
}
}

BOOST_AUTO_TEST_SUITE(kv_fsm_tests)

BOOST_AUTO_TEST_CASE(put_get_delete) {
    KVStateMachine fsm;
    auto res = Apply(fsm, {.operation = PUT, .key = "name", .value = "zavier"});
    BOOST_CHECK_EQUAL(res.error, OK);
    BOOST_CHECK_EQUAL(res.value, "zavier");

    res = Apply(fsm, {.operation = GET, .key = "name"});
    BOOST_CHECK_EQUAL(res.error, OK);
    BOOST_CHECK_EQUAL(res.value, "zavier");

    res = Apply(fsm, {.operation = PUT, .key = "name", .value = "shardkv"});
    BOOST_CHECK_EQUAL(fsm.localGet("name").value_or(""), "shardkv");

    res = Apply(fsm, {.operation = DEL, .key = "name"});
    BOOST_CHECK_EQUAL(res.error, OK);
    BOOST_CHECK(!fsm.localGet("name"));
    BOOST_CHECK_EQUAL(fsm.size(), 0);
}

BOOST_AUTO_TEST_CASE(missing_key) {
    KVStateMachine fsm;
    BOOST_CHECK_EQUAL(Apply(fsm, {.operation = GET, .key = "absent"}).error, NO_KEY);
    BOOST_CHECK_EQUAL(Apply(fsm, {.operation = DEL, .key = "absent"}).error, NO_KEY);
}

BOOST_AUTO_TEST_CASE(malformed_command_is_rejected) {
    KVStateMachine fsm;
    auto res = Json::parse(fsm.apply("not a command")).get<CommandResult>();
    BOOST_CHECK_EQUAL(res.error, INVALID_ARGUMENT);
    res = Json::parse(fsm.apply(R"({"op":"APPEND","key":"a"})")).get<CommandResult>();
    BOOST_CHECK_EQUAL(res.error, INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(fsm.size(), 0);
}

BOOST_AUTO_TEST_CASE(duplicate_write_is_applied_once) {
    KVStateMachine fsm;
    Command put{.operation = PUT, .key = "counter", .value = "1", .clientId = 7, .requestId = 1};
    BOOST_CHECK_EQUAL(Apply(fsm, put).error, OK);
    Apply(fsm, {.operation = PUT, .key = "counter", .value = "2"});
    // 重试同一个请求不会覆盖之后的写入
    auto res = Apply(fsm, put);
    BOOST_CHECK_EQUAL(res.error, OK);
    BOOST_CHECK_EQUAL(res.value, "1");
    BOOST_CHECK_EQUAL(fsm.localGet("counter").value_or(""), "2");

    Command del{.operation = DEL, .key = "counter", .clientId = 7, .requestId = 2};
    BOOST_CHECK_EQUAL(Apply(fsm, del).error, OK);
    // 重复的删除返回第一次的结果，而不是 NO_KEY
    BOOST_CHECK_EQUAL(Apply(fsm, del).error, OK);
}

BOOST_AUTO_TEST_CASE(writes_without_token_are_not_deduplicated) {
    KVStateMachine fsm;
    Command put{.operation = PUT, .key = "a", .value = "1"};
    Apply(fsm, put);
    Apply(fsm, {.operation = DEL, .key = "a"});
    Apply(fsm, put);
    BOOST_CHECK_EQUAL(fsm.localGet("a").value_or(""), "1");
}

BOOST_AUTO_TEST_CASE(snapshot_and_restore) {
    KVStateMachine fsm;
    Apply(fsm, {.operation = PUT, .key = "a", .value = "1"});
    Apply(fsm, {.operation = PUT, .key = "b", .value = "2", .clientId = 1, .requestId = 10});
    std::string snap = fsm.snapshot();

    KVStateMachine other;
    Apply(other, {.operation = PUT, .key = "stale", .value = "x"});
    BOOST_REQUIRE(other.restore(snap));
    BOOST_CHECK(other.getData() == fsm.getData());
    BOOST_CHECK(!other.localGet("stale"));
    // 去重表也随快照恢复
    Apply(other, {.operation = DEL, .key = "b"});
    Apply(other, {.operation = PUT, .key = "b", .value = "2", .clientId = 1, .requestId = 10});
    BOOST_CHECK(!other.localGet("b"));
}

BOOST_AUTO_TEST_CASE(restore_empty_and_corrupt) {
    KVStateMachine fsm;
    Apply(fsm, {.operation = PUT, .key = "a", .value = "1"});
    BOOST_CHECK(!fsm.restore("\xc1garbage"));
    BOOST_CHECK_EQUAL(fsm.size(), 1);
    BOOST_CHECK(fsm.restore(""));
    BOOST_CHECK_EQUAL(fsm.size(), 0);
}

BOOST_AUTO_TEST_CASE(command_codec) {
    Command cmd{.operation = DEL, .key = "k", .clientId = 3, .requestId = 4};
    auto decoded = DecodeCommand(EncodeCommand(cmd));
    BOOST_REQUIRE(decoded);
    BOOST_CHECK_EQUAL(decoded->operation, DEL);
    BOOST_CHECK_EQUAL(decoded->key, "k");
    BOOST_CHECK(decoded->hasToken());
    BOOST_CHECK(!DecodeCommand(R"({"key":"k"})"));
    BOOST_CHECK_EQUAL(toString(TIMEOUT), "Consensus timeout, outcome unknown");
}

BOOST_AUTO_TEST_SUITE_END()

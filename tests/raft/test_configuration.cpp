//
// Created by zavier on 2022/12/21.
//

#define BOOST_TEST_MODULE test_configuration

#include <boost/test/unit_test.hpp>
#include "shardkv/raft/configuration.h"

using namespace shardkv::raft;

BOOST_AUTO_TEST_SUITE(configuration_tests)

BOOST_AUTO_TEST_CASE(quorum_size) {
    Configuration conf;
    BOOST_CHECK(conf.empty());
    BOOST_CHECK_EQUAL(conf.quorumSize(), 0);
    conf.addVoter(1, "127.0.0.1:8011");
    BOOST_CHECK_EQUAL(conf.quorumSize(), 1);
    conf.addVoter(2, "127.0.0.1:8021");
    BOOST_CHECK_EQUAL(conf.quorumSize(), 2);
    conf.addVoter(3, "127.0.0.1:8031");
    BOOST_CHECK_EQUAL(conf.quorumSize(), 2);
    conf.servers.push_back({.id = 4, .address = "127.0.0.1:8041", .suffrage = Suffrage::Nonvoter});
    BOOST_CHECK_EQUAL(conf.voterCount(), 3);
    BOOST_CHECK_EQUAL(conf.quorumSize(), 2);
    BOOST_CHECK(conf.contains(4));
    BOOST_CHECK(!conf.hasVoter(4));
}

BOOST_AUTO_TEST_CASE(add_and_remove) {
    Configuration conf;
    BOOST_CHECK(conf.addVoter(1, "a"));
    BOOST_CHECK(!conf.addVoter(1, "a"));
    // 地址变化视为更新
    BOOST_CHECK(conf.addVoter(1, "b"));
    BOOST_CHECK_EQUAL(conf.getAddress(1).value_or(""), "b");
    BOOST_CHECK_EQUAL(conf.servers.size(), 1);

    BOOST_CHECK(conf.addVoter(2, "c"));
    BOOST_CHECK(conf.removeServer(1));
    BOOST_CHECK(!conf.removeServer(1));
    BOOST_CHECK(!conf.getAddress(1));
    BOOST_REQUIRE_EQUAL(conf.servers.size(), 1);
    BOOST_CHECK_EQUAL(conf.servers.front().id, 2);
}

BOOST_AUTO_TEST_CASE(order_is_join_order) {
    Configuration conf;
    conf.addVoter(3, "c");
    conf.addVoter(1, "a");
    conf.addVoter(2, "b");
    BOOST_CHECK_EQUAL(conf.servers[0].id, 3);
    BOOST_CHECK_EQUAL(conf.servers[2].id, 2);
    BOOST_CHECK_EQUAL(conf.toString(),
                      "[{Id: 3, Address: c, Suffrage: Voter},{Id: 1, Address: a, Suffrage: Voter},"
                      "{Id: 2, Address: b, Suffrage: Voter}]");
}

BOOST_AUTO_TEST_CASE(encode_decode) {
    Configuration conf;
    conf.addVoter(1, "127.0.0.1:8011");
    conf.servers.push_back({.id = 2, .address = "127.0.0.1:8021", .suffrage = Suffrage::Nonvoter});
    auto decoded = Configuration::Decode(conf.encode());
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == conf);
    BOOST_CHECK(!Configuration::Decode("garbage"));

    Json json = conf;
    BOOST_CHECK_EQUAL(json["servers"][1]["suffrage"], "Nonvoter");
}

BOOST_AUTO_TEST_SUITE_END()

//
// Created by zavier on 2023/1/9.
//

#define BOOST_TEST_MODULE test_known_peers

#include <boost/test/unit_test.hpp>
#include "shardkv/cluster/known_peers.h"

using namespace shardkv::cluster;

BOOST_AUTO_TEST_SUITE(known_peers_tests)

BOOST_AUTO_TEST_CASE(new_shard_is_added) {
    KnownPeers peers(4);
    BOOST_CHECK(MergeResult::ADDED == peers.merge(2, "http://127.0.0.1:8021/", 3));
    auto info = peers.get(2);
    BOOST_REQUIRE(info);
    BOOST_CHECK_EQUAL(info->address, "127.0.0.1:8021");
    BOOST_CHECK_EQUAL(info->term, 3);
    BOOST_CHECK_EQUAL(peers.size(), 1);
    BOOST_CHECK(!peers.get(3));
}

BOOST_AUTO_TEST_CASE(lower_term_is_stale) {
    KnownPeers peers(4);
    peers.merge(2, "127.0.0.1:8021", 5);
    BOOST_CHECK(MergeResult::STALE == peers.merge(2, "127.0.0.1:9999", 4));
    BOOST_CHECK_EQUAL(peers.get(2)->address, "127.0.0.1:8021");
    BOOST_CHECK_EQUAL(peers.get(2)->term, 5);
}

BOOST_AUTO_TEST_CASE(same_announcement_is_unchanged) {
    KnownPeers peers(4);
    peers.merge(2, "127.0.0.1:8021", 5);
    BOOST_CHECK(MergeResult::UNCHANGED == peers.merge(2, "127.0.0.1:8021", 5));
    BOOST_CHECK(MergeResult::UNCHANGED == peers.merge(2, "127.0.0.1:8021"));
}

BOOST_AUTO_TEST_CASE(newer_term_updates_address) {
    KnownPeers peers(4);
    peers.merge(2, "127.0.0.1:8021", 5);
    BOOST_CHECK(MergeResult::UPDATED == peers.merge(2, "127.0.0.1:8022", 6));
    BOOST_CHECK_EQUAL(peers.get(2)->address, "127.0.0.1:8022");
    BOOST_CHECK_EQUAL(peers.get(2)->term, 6);
    // 同一任期换了地址也更新
    BOOST_CHECK(MergeResult::UPDATED == peers.merge(2, "127.0.0.1:8023", 6));
    BOOST_CHECK_EQUAL(peers.get(2)->address, "127.0.0.1:8023");
}

BOOST_AUTO_TEST_CASE(manual_add_overwrites_and_keeps_term) {
    KnownPeers peers(4);
    peers.merge(2, "127.0.0.1:8021", 7);
    BOOST_CHECK(MergeResult::UPDATED == peers.merge(2, "127.0.0.1:9021"));
    auto info = peers.get(2);
    BOOST_CHECK_EQUAL(info->address, "127.0.0.1:9021");
    BOOST_CHECK_EQUAL(info->term, 7);
}

BOOST_AUTO_TEST_CASE(capacity_bounds_new_shards) {
    KnownPeers peers(2);
    BOOST_CHECK_EQUAL(peers.capacity(), 2);
    BOOST_CHECK(MergeResult::ADDED == peers.merge(1, "127.0.0.1:8011"));
    BOOST_CHECK(MergeResult::ADDED == peers.merge(2, "127.0.0.1:8021"));
    BOOST_CHECK(MergeResult::FULL == peers.merge(3, "127.0.0.1:8031"));
    // 已知的 shard 不受容量限制
    BOOST_CHECK(MergeResult::UPDATED == peers.merge(2, "127.0.0.1:8022", 1));
    BOOST_CHECK_EQUAL(peers.size(), 2);
}

BOOST_AUTO_TEST_CASE(default_capacity_from_config) {
    KnownPeers peers;
    BOOST_CHECK_EQUAL(peers.capacity(), 1024);
}

BOOST_AUTO_TEST_CASE(addresses_lists_every_shard) {
    KnownPeers peers(8);
    peers.merge(1, "127.0.0.1:8011");
    peers.merge(3, "127.0.0.1:8031", 2);
    auto addrs = peers.addresses();
    BOOST_REQUIRE_EQUAL(addrs.size(), 2);
    BOOST_CHECK_EQUAL(addrs[1], "127.0.0.1:8011");
    BOOST_CHECK_EQUAL(addrs[3], "127.0.0.1:8031");
    BOOST_CHECK_EQUAL(peers.snapshot().at(3).term, 2);
}

BOOST_AUTO_TEST_SUITE_END()

//
// Created by zavier on 2023/1/16.
//

#include <cstdlib>
#include "shardkv/common/config.h"
#include "shardkv/node/shard_node.h"

using namespace shardkv;

static auto g_logger = GetLogInstance();

ShardNode::ptr node;

void Main() {
    node = std::make_shared<ShardNode>(ShardNodeOptions::FromConfig());
    while (!node->start()) {
        sleep(1);
    }
}

// 启动方法
// ./shardkv_node conf/node1.yml
// ./shardkv_node conf/node2.yml
// ./shardkv_node conf/node3.yml

int main(int argc, char** argv) {
    if (argc <= 1) {
        SPDLOG_LOGGER_WARN(g_logger, "no config file given, using defaults");
    } else {
        try {
            Config::LoadFromFile(argv[1]);
        } catch (YAML::Exception& e) {
            SPDLOG_LOGGER_CRITICAL(g_logger, "load config file {} fail, {}", argv[1], e.what());
            return EXIT_FAILURE;
        }
    }
    go Main;
    co_sched.Start(0);
}

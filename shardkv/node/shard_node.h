//
// Created by zavier on 2023/1/16.
//

#ifndef SHARDKV_SHARD_NODE_H
#define SHARDKV_SHARD_NODE_H

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "shardkv/cluster/cluster_joiner.h"
#include "shardkv/cluster/known_peers.h"
#include "shardkv/cluster/leader_broadcaster.h"
#include "shardkv/http/http_server.h"
#include "shardkv/kv/kv_server.h"

namespace shardkv {

struct ShardNodeOptions {
    int64_t id = 1;
    // 对外的 http 地址，同时也是 raft rpc 的地址
    std::string address;
    std::string dataDir;
    // 静态配置的其它 shard
    std::map<int64_t, std::string> peers;
    // 加入集群时联系的节点
    std::vector<std::string> join;
    // 自己启动集群的节点 id
    int64_t bootstrapId = 1;

    /**
     * @brief 从 node.* 和 cluster.* 配置读取
     */
    static ShardNodeOptions FromConfig();
};

/**
 * @brief 一个 shard 进程：http 服务、键值服务、leader 广播和加入集群
 */
class ShardNode {
public:
    using ptr = std::shared_ptr<ShardNode>;
    explicit ShardNode(ShardNodeOptions options);
    ~ShardNode();
    /**
     * @brief 绑定地址并启动，bootstrap 节点在没有状态时以自己为唯一成员启动集群
     */
    bool start();
    void stop();

    kv::KVServer::ptr getKVServer() const { return m_kv;}
    cluster::KnownPeers::ptr getKnownPeers() const { return m_peers;}
    cluster::LeaderBroadcaster::ptr getBroadcaster() const { return m_broadcaster;}
    http::HttpServer::ptr getHttpServer() const { return m_server;}
private:
    void registerServlets();
private:
    ShardNodeOptions m_options;
    kv::KVServer::ptr m_kv;
    cluster::KnownPeers::ptr m_peers;
    cluster::LeaderBroadcaster::ptr m_broadcaster;
    cluster::ClusterJoiner::ptr m_joiner;
    http::HttpServer::ptr m_server;
};

}
#endif //SHARDKV_SHARD_NODE_H

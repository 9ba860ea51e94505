//
// Created by zavier on 2023/1/8.
//

#ifndef SHARDKV_KNOWN_PEERS_H
#define SHARDKV_KNOWN_PEERS_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <libgo/libgo.h>

namespace shardkv::cluster {

/**
 * @brief 其它 shard 的 leader 地址
 */
struct PeerInfo {
    std::string address;
    // 广播时 leader 的任期，手动添加时为 0
    int64_t term = 0;
};

enum class MergeResult {
    ADDED,
    UPDATED,
    UNCHANGED,
    // 任期比已知的旧
    STALE,
    // 超过容量
    FULL,
};

std::string MergeResultToString(MergeResult result);

/**
 * @brief 本地缓存的 shard id 到 leader 地址的映射，不复制，只作为提示使用
 */
class KnownPeers {
public:
    using ptr = std::shared_ptr<KnownPeers>;
    using RWMutexType = co::co_rwmutex;

    /**
     * @param capacity 最多保存的 shard 数量，0 表示使用配置 cluster.known_peers.capacity
     */
    explicit KnownPeers(size_t capacity = 0);
    /**
     * @brief 合并一条 shard 信息
     * @param term 为空时总是覆盖地址，并保留已知的任期
     */
    MergeResult merge(int64_t shardId, const std::string& address, std::optional<int64_t> term = std::nullopt);
    std::optional<PeerInfo> get(int64_t shardId);
    std::map<int64_t, PeerInfo> snapshot();
    /**
     * @brief shard id 到地址
     */
    std::map<int64_t, std::string> addresses();
    size_t size();
    size_t capacity() const { return m_capacity;}
private:
    RWMutexType m_mutex;
    size_t m_capacity;
    std::map<int64_t, PeerInfo> m_peers;
};

}
#endif //SHARDKV_KNOWN_PEERS_H

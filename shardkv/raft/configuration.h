//
// Created by zavier on 2022/12/20.
//

#ifndef SHARDKV_CONFIGURATION_H
#define SHARDKV_CONFIGURATION_H

#include <optional>
#include <string>
#include <vector>
#include "entry.h"

namespace shardkv::raft {

/**
 * @brief 是否拥有投票权
 */
enum class Suffrage {
    Voter,
    Nonvoter,
};

std::string SuffrageToString(Suffrage suffrage);

struct Server {
    int64_t id = 0;
    std::string address;
    Suffrage suffrage = Suffrage::Voter;
    bool operator==(const Server& rhs) const {
        return id == rhs.id && address == rhs.address && suffrage == rhs.suffrage;
    }
};

/**
 * @brief 集群成员配置，作为 CONFIGURATION 日志写入 raft log，
 * 日志被追加后即生效，同一时刻最多只有一个未提交的成员变更
 */
struct Configuration {
    // 按加入顺序排列
    std::vector<Server> servers;

    bool empty() const { return servers.empty();}
    bool contains(int64_t id) const;
    bool hasVoter(int64_t id) const;
    const Server* find(int64_t id) const;
    std::optional<std::string> getAddress(int64_t id) const;
    size_t voterCount() const;
    /**
     * @brief 达成多数派需要的票数，没有投票者时为 0
     */
    size_t quorumSize() const;
    /**
     * @brief 加入一个投票者，已存在则更新地址和投票权
     * @return 配置是否发生了变化
     */
    bool addVoter(int64_t id, const std::string& address);
    /**
     * @return 是否删除了该节点
     */
    bool removeServer(int64_t id);

    std::string encode() const;
    static std::optional<Configuration> Decode(const std::string& data);

    std::string toString() const;
    bool operator==(const Configuration& rhs) const { return servers == rhs.servers;}
};

void to_json(Json& j, const Server& server);
void from_json(const Json& j, Server& server);
void to_json(Json& j, const Configuration& conf);
void from_json(const Json& j, Configuration& conf);

}
#endif //SHARDKV_CONFIGURATION_H

//
// Created by zavier on 2022/12/3.
//

#ifndef SHARDKV_KV_SERVER_H
#define SHARDKV_KV_SERVER_H

#include <map>
#include <optional>
#include "shardkv/raft/raft_node.h"
#include "command.h"
#include "kv_fsm.h"

namespace shardkv::kv {
using namespace shardkv::raft;

struct CommandResponse {
    Error error = OK;
    std::string value;
    // WRONG_LEADER 时附带已知的 leader 地址
    std::string leader;
    // 错误的详细信息，为空时使用 toString(error)
    std::string message;

    bool ok() const { return error == OK;}
    std::string errorMessage() const { return message.empty() ? kv::toString(error) : message;}
    std::string toString() const {
        std::string str = fmt::format("error: {}, value: {}, leader: {}", errorMessage(), value, leader);
        return "{" + str + "}";
    }
};

/**
 * @brief 一个节点上的键值服务，所有读写都经过 raft
 */
class KVServer {
public:
    using ptr = std::shared_ptr<KVServer>;

    /**
     * @param id 节点 id，同时也是 shard id
     * @param address 节点对外的 http 地址
     * @param dataDir 持久化目录
     */
    KVServer(int64_t id, const std::string& address, const std::string& dataDir,
             PeerFactory factory = HttpRaftPeer::Create);
    ~KVServer();
    void start();
    void stop();
    /**
     * @brief 以只有自己的配置启动集群，已有状态时返回 false
     */
    bool bootstrap();

    CommandResponse Put(const std::string& key, const std::string& value,
                        std::optional<int64_t> clientId = std::nullopt,
                        std::optional<int64_t> requestId = std::nullopt);
    CommandResponse Get(const std::string& key);
    CommandResponse Delete(const std::string& key,
                           std::optional<int64_t> clientId = std::nullopt,
                           std::optional<int64_t> requestId = std::nullopt);
    /**
     * @brief 把节点加入集群，只能在 leader 上调用
     */
    CommandResponse Join(int64_t id, const std::string& address);
    CommandResponse Leave(int64_t id);
    RaftStats Status();
    /**
     * @brief 成员配置里 shard id 到地址的映射
     */
    std::map<int64_t, std::string> Config();

    int64_t getId() const { return m_id;}
    const std::string& getAddress() const { return m_address;}
    RaftNode::ptr getRaft() const { return m_raft;}
    KVStateMachine::ptr getStateMachine() const { return m_fsm;}

    static uint64_t GetApplyTimeout();
private:
    CommandResponse handleCommand(const Command& command);
    CommandResponse fromRaftError(RaftError err);
private:
    int64_t m_id;
    std::string m_address;
    Persister::ptr m_persister;
    KVStateMachine::ptr m_fsm;
    RaftNode::ptr m_raft;
};

}
#endif //SHARDKV_KV_SERVER_H

//
// Created by zavier on 2022/12/3.
//

#ifndef SHARDKV_KV_FSM_H
#define SHARDKV_KV_FSM_H

#include <map>
#include <optional>
#include <libgo/libgo.h>
#include "shardkv/raft/state_machine.h"
#include "command.h"

namespace shardkv::kv {
/**
 * @brief 键值对状态机，由 raft 按日志顺序调用
 */
class KVStateMachine : public raft::StateMachine {
public:
    using ptr = std::shared_ptr<KVStateMachine>;
    using RWMutexType = co::co_rwmutex;
    using KVMap = std::map<std::string, std::string>;

    KVStateMachine() = default;
    /**
     * @param data json 编码的 Command
     * @return json 编码的 CommandResult
     */
    std::string apply(const std::string& data) override;
    /**
     * @brief 序列化全部键值对和去重表
     */
    std::string snapshot() override;
    /**
     * @brief 用快照整体替换当前状态
     */
    bool restore(const std::string& data) override;

    CommandResult applyCommand(const Command& command);
    /**
     * @brief 读本地数据，不经过共识，可能是旧值
     */
    std::optional<std::string> localGet(const std::string& key);
    size_t size();
    KVMap getData();
private:
    bool isDuplicateRequest(const Command& command);

private:
    RWMutexType m_mutex;
    KVMap m_data;
    // 客户端id 到最后一次写请求的 requestId 和结果
    std::map<int64_t, std::pair<int64_t, CommandResult>> m_lastOperation;
};

}
#endif //SHARDKV_KV_FSM_H

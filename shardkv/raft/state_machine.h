//
// Created by zavier on 2022/12/20.
//

#ifndef SHARDKV_STATE_MACHINE_H
#define SHARDKV_STATE_MACHINE_H

#include <memory>
#include <string>

namespace shardkv::raft {

/**
 * @brief 由 RaftNode 驱动的状态机，三个函数只会在 RaftNode 的 applier 协程里串行调用
 */
class StateMachine {
public:
    using ptr = std::shared_ptr<StateMachine>;
    virtual ~StateMachine() = default;
    /**
     * @brief 应用一条已提交的日志，返回值交给发起 apply 的调用者
     */
    virtual std::string apply(const std::string& data) = 0;
    /**
     * @brief 序列化状态机的全部状态
     */
    virtual std::string snapshot() = 0;
    /**
     * @brief 用快照整体替换状态机的状态
     */
    virtual bool restore(const std::string& data) = 0;
};

}
#endif //SHARDKV_STATE_MACHINE_H

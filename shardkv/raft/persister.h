//
// Created by zavier on 2022/11/28.
//

#ifndef SHARDKV_PERSISTER_H
#define SHARDKV_PERSISTER_H

#include <filesystem>
#include <optional>
#include <vector>
#include <libgo/libgo.h>
#include "entry.h"
#include "snapshot.h"

namespace shardkv::raft {
// raft节点状态的持久化数据
struct HardState {
    // 当前任期
    int64_t term = 0;
    // 任期内给谁投过票，-1 表示没有投票
    int64_t vote = -1;
    // 已经commit的最大index
    int64_t commit = 0;
    bool operator==(const HardState& rhs) const {
        return term == rhs.term && vote == rhs.vote && commit == rhs.commit;
    }
    bool operator!=(const HardState& rhs) const { return !(*this == rhs);}
};

void to_json(Json& j, const HardState& hs);
void from_json(const Json& j, HardState& hs);

/**
 * @brief 持久化存储，raft-state 文件保存 HardState 和日志，快照交给 Snapshotter
 */
class Persister {
public:
    using ptr = std::shared_ptr<Persister>;
    using MutexType = co::co_mutex;

    explicit Persister(const std::filesystem::path& persist_path = ".");

    ~Persister() = default;

    /**
     * @brief 获取持久化的 raft 状态
     */
    std::optional<HardState> loadHardState();
    /**
     * @brief 获取持久化的 log，第一条为快照点上的虚拟日志
     */
    std::optional<std::vector<Entry>> loadEntries();
    /**
     * @brief 获取快照
     */
    Snapshot::ptr loadSnapshot();
    /**
     * @brief 获取 raft state 的长度，没有持久化过时为 -1
     */
    int64_t getRaftStateSize();
    /**
     * @brief 持久化，有快照时先写快照再写状态，崩溃时最多留下一个比状态更新的快照
     */
    bool persist(const HardState& hs, const std::vector<Entry>& ents, const Snapshot::ptr& snapshot = nullptr);

    std::string getFullPathName() const;
private:
    bool readState(HardState& hs, std::vector<Entry>& ents);
private:
    MutexType m_mutex;
    const std::filesystem::path m_path;
    Snapshotter m_shotter;
    const std::string m_name = "raft-state";
    int64_t m_raftStateSize = -1;
};
}
#endif //SHARDKV_PERSISTER_H

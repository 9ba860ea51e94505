//
// Created by zavier on 2022/7/5.
//

#ifndef SHARDKV_RAFT_LOG_H
#define SHARDKV_RAFT_LOG_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "entry.h"
#include "snapshot.h"
#include "persister.h"

namespace shardkv::raft {
/**
 * @brief 内存中的 raft 日志以及 commit/apply 进度
 * @details m_entries[0] 是哨兵，记录最后一次快照的 index 和 term，
 * 真实日志从 m_entries[1] 开始，所以 index 和下标之间差一个 offset()
 */
class RaftLog {
public:
    static constexpr int64_t NO_LIMIT = INT64_MAX;
    /**
     * @param persister 非空时从中恢复日志和 commit
     * @param maxNextEntsSize 一次取出日志的最大条数
     */
    explicit RaftLog(Persister::ptr persister, int64_t maxNextEntsSize = NO_LIMIT);

    int64_t firstIndex() const { return offset() + 1;}
    int64_t lastIndex() const { return offset() + (int64_t)m_entries.size() - 1;}
    int64_t lastTerm() const { return term(lastIndex());}
    int64_t lastSnapshotIndex() const { return m_entries.front().index;}
    int64_t lastSnapshotTerm() const { return m_entries.front().term;}
    int64_t committed() const { return m_committed;}
    int64_t applied() const { return m_applied;}
    /**
     * @brief index 处日志的 term，已被压缩或者不存在时返回 -1
     */
    int64_t term(int64_t index) const;
    bool matchLog(int64_t index, int64_t term) const;
    /**
     * @brief 候选人的日志是否至少和自己一样新：先比最后一条的 term，再比长度
     */
    bool isUpToDate(int64_t index, int64_t term) const;

    void append(const Entry& ent);
    /**
     * @brief 追加一批连续的日志，和已有日志重叠的部分被截断覆盖
     * @return 追加后的 lastIndex
     */
    int64_t append(const std::vector<Entry>& entries);
    /**
     * @brief follower 处理 AppendEntries 的日志部分
     * @return prev 不匹配时返回 -1，否则返回这批日志最后一条的 index
     */
    int64_t maybeAppend(int64_t prevLogIndex, int64_t prevLogTerm, const std::vector<Entry>& entries);
    /**
     * @brief entries 中第一条和本地不一致(包括本地没有)的日志的 index，全部一致时为 0
     */
    int64_t findConflict(const std::vector<Entry>& entries) const;
    /**
     * @brief prev 不匹配时给 leader 的 nextIndex 提示，一次跳过整个冲突任期
     */
    int64_t findConflict(int64_t prevLogIndex, int64_t prevLogTerm) const;

    void commitTo(int64_t commit);
    /**
     * @brief leader 推进 commit，只提交当前任期的日志
     */
    bool maybeCommit(int64_t maxIndex, int64_t term);
    void appliedTo(int64_t index);
    bool hasNextEntries() const;
    /**
     * @brief (applied, committed] 之间待 apply 的日志
     */
    std::vector<Entry> nextEntries() const;

    /**
     * @brief 从 index 开始到末尾的日志，受 maxNextEntsSize 限制
     */
    std::vector<Entry> entries(int64_t index) const;
    /**
     * @brief [low, high) 的日志，最多 maxSize 条，越界时返回空
     */
    std::vector<Entry> slice(int64_t low, int64_t high, int64_t maxSize) const;
    /**
     * @brief 包括哨兵在内的全部日志，用于持久化
     */
    const std::vector<Entry>& allEntries() const { return m_entries;}
    /**
     * @brief index 不超过 maxIndex 的最后一条 CONFIGURATION 日志
     */
    std::optional<Entry> lastConfigEntry(int64_t maxIndex = NO_LIMIT) const;

    /**
     * @brief 生成 index 处的快照，index 必须已经提交，日志本身不动
     */
    Snapshot::ptr createSnapshot(int64_t index, const std::string& data, const Configuration& conf) const;
    /**
     * @brief 丢弃 compactIndex 及之前的日志，compactIndex 成为新的哨兵
     */
    bool compact(int64_t compactIndex);
    /**
     * @brief 安装了更新的快照，整个日志只剩哨兵
     */
    void clearEntries(int64_t lastSnapshotIndex, int64_t lastSnapshotTerm);

    bool hasUnstable() const { return m_unstable;}
    void markStable() { m_unstable = false;}

    std::string toString() const {
        return fmt::format("committed: {}, applied: {}, offset: {}, length: {}",
                           m_committed, m_applied, offset(), m_entries.size());
    }

private:
    int64_t offset() const { return m_entries.front().index;}

private:
    std::vector<Entry> m_entries;
    int64_t m_committed = 0;
    int64_t m_applied = 0;
    int64_t m_maxNextEntriesSize;
    // 自上次持久化后日志是否有变化
    bool m_unstable = false;
};

}
#endif //SHARDKV_RAFT_LOG_H

//
// Created by zavier on 2022/7/11.
//

#include <algorithm>
#include <cstdlib>
#include "shardkv/common/util.h"
#include "raft_log.h"

namespace shardkv::raft {
static auto g_logger = GetLogInstance();

RaftLog::RaftLog(Persister::ptr persister, int64_t maxNextEntsSize)
        : m_maxNextEntriesSize(maxNextEntsSize) {
    if (persister) {
        auto ents = persister->loadEntries();
        auto hs = persister->loadHardState();
        if (ents && hs && !ents->empty()) {
            m_entries = std::move(*ents);
            // 快照之前的日志都已经 apply 过
            m_applied = lastSnapshotIndex();
            m_committed = std::max(hs->commit, m_applied);
            return;
        }
    }
    m_entries.emplace_back();
}

int64_t RaftLog::term(int64_t index) const {
    if (index < offset() || index > lastIndex()) {
        return -1;
    }
    return m_entries[index - offset()].term;
}

bool RaftLog::matchLog(int64_t index, int64_t term) const {
    int64_t t = this->term(index);
    return t >= 0 && t == term;
}

bool RaftLog::isUpToDate(int64_t index, int64_t term) const {
    int64_t last_term = lastTerm();
    if (term != last_term) {
        return term > last_term;
    }
    return index >= lastIndex();
}

void RaftLog::append(const Entry& ent) {
    m_entries.push_back(ent);
    m_unstable = true;
}

int64_t RaftLog::append(const std::vector<Entry>& entries) {
    if (entries.empty()) {
        return lastIndex();
    }
    int64_t from = entries.front().index;
    if (from <= m_committed) {
        SPDLOG_LOGGER_CRITICAL(g_logger, "append from {} overwrites committed entries [committed({})]", from, m_committed);
        exit(EXIT_FAILURE);
    }
    if (from > lastIndex() + 1) {
        SPDLOG_LOGGER_ERROR(g_logger, "append from {} leaves a gap after lastIndex({})", from, lastIndex());
        return lastIndex();
    }
    if (from <= lastIndex()) {
        SPDLOG_LOGGER_INFO(g_logger, "truncate the entries from index {}", from);
        m_entries.resize(from - offset());
    }
    m_entries.insert(m_entries.end(), entries.begin(), entries.end());
    m_unstable = true;
    return lastIndex();
}

int64_t RaftLog::maybeAppend(int64_t prevLogIndex, int64_t prevLogTerm, const std::vector<Entry>& entries) {
    if (!matchLog(prevLogIndex, prevLogTerm)) {
        return -1;
    }
    int64_t conflict = findConflict(entries);
    if (conflict) {
        if (conflict <= m_committed) {
            SPDLOG_LOGGER_CRITICAL(g_logger, "entry {} conflict with committed entry [committed({})]",
                                   conflict, m_committed);
            exit(EXIT_FAILURE);
        }
        // 冲突之前的日志本地已经有了
        auto first = entries.begin() + (conflict - prevLogIndex - 1);
        append(std::vector<Entry>(first, entries.end()));
    }
    return prevLogIndex + (int64_t)entries.size();
}

int64_t RaftLog::findConflict(const std::vector<Entry>& entries) const {
    auto it = std::find_if(entries.begin(), entries.end(), [this](const Entry& ent) {
        return !matchLog(ent.index, ent.term);
    });
    if (it == entries.end()) {
        return 0;
    }
    if (it->index <= lastIndex()) {
        SPDLOG_LOGGER_INFO(g_logger, "found conflict at index {} [existing term: {}, conflicting term: {}]",
                           it->index, term(it->index), it->term);
    }
    return it->index;
}

int64_t RaftLog::findConflict(int64_t prevLogIndex, int64_t prevLogTerm) const {
    if (prevLogIndex > lastIndex()) {
        return lastIndex() + 1;
    }
    int64_t conflict_term = term(prevLogIndex);
    int64_t index = prevLogIndex;
    while (index > firstIndex() && term(index - 1) == conflict_term) {
        --index;
    }
    return std::max(index, firstIndex());
}

void RaftLog::commitTo(int64_t commit) {
    if (commit <= m_committed) {
        return;
    }
    if (commit > lastIndex()) {
        SPDLOG_LOGGER_CRITICAL(g_logger, "commit({}) is out of range [lastIndex({})]", commit, lastIndex());
        return;
    }
    m_committed = commit;
}

bool RaftLog::maybeCommit(int64_t maxIndex, int64_t term) {
    if (maxIndex <= m_committed || this->term(maxIndex) != term) {
        return false;
    }
    commitTo(maxIndex);
    return true;
}

void RaftLog::appliedTo(int64_t index) {
    if (index == 0) {
        return;
    }
    if (index < m_applied || index > m_committed) {
        SPDLOG_LOGGER_CRITICAL(g_logger, "applied({}) is out of range [prevApplied({}), committed({})]",
                               index, m_applied, m_committed);
        return;
    }
    m_applied = index;
}

bool RaftLog::hasNextEntries() const {
    return m_committed >= std::max(m_applied + 1, firstIndex());
}

std::vector<Entry> RaftLog::nextEntries() const {
    if (!hasNextEntries()) {
        return {};
    }
    return slice(std::max(m_applied + 1, firstIndex()), m_committed + 1, m_maxNextEntriesSize);
}

std::vector<Entry> RaftLog::entries(int64_t index) const {
    // 对方已经有全部日志，只发心跳
    if (index > lastIndex()) {
        return {};
    }
    return slice(index, lastIndex() + 1, m_maxNextEntriesSize);
}

std::vector<Entry> RaftLog::slice(int64_t low, int64_t high, int64_t maxSize) const {
    if (low >= high || low < firstIndex() || high > lastIndex() + 1) {
        SPDLOG_LOGGER_ERROR(g_logger, "slice[{},{}) out of bound [{},{}]", low, high, firstIndex(), lastIndex());
        return {};
    }
    if (maxSize != NO_LIMIT && high - low > maxSize) {
        high = low + maxSize;
    }
    return std::vector<Entry>(m_entries.begin() + (low - offset()), m_entries.begin() + (high - offset()));
}

std::optional<Entry> RaftLog::lastConfigEntry(int64_t maxIndex) const {
    // 不看哨兵
    for (auto it = m_entries.rbegin(); it + 1 != m_entries.rend(); ++it) {
        if (it->index <= maxIndex && it->type == EntryType::CONFIGURATION) {
            return *it;
        }
    }
    return std::nullopt;
}

Snapshot::ptr RaftLog::createSnapshot(int64_t index, const std::string& data, const Configuration& conf) const {
    if (index <= offset()) {
        return nullptr;
    }
    if (index > m_committed) {
        SPDLOG_LOGGER_ERROR(g_logger, "snapshot {} is out of bound committed({})", index, m_committed);
        return nullptr;
    }
    auto snap = std::make_shared<Snapshot>();
    snap->metadata.index = index;
    snap->metadata.term = term(index);
    snap->metadata.configuration = conf;
    snap->data = data;
    SPDLOG_LOGGER_DEBUG(g_logger, "log [{}] creates snapshot [index: {}, term: {}]",
                        toString(), index, snap->metadata.term);
    return snap;
}

bool RaftLog::compact(int64_t compactIndex) {
    if (compactIndex <= offset()) {
        return false;
    }
    if (compactIndex > lastIndex()) {
        SPDLOG_LOGGER_ERROR(g_logger, "compact {} is out of bound last index({})", compactIndex, lastIndex());
        return false;
    }
    m_entries.erase(m_entries.begin(), m_entries.begin() + (compactIndex - offset()));
    Entry& sentinel = m_entries.front();
    sentinel.type = EntryType::NOOP;
    sentinel.data.clear();
    m_unstable = true;
    return true;
}

void RaftLog::clearEntries(int64_t lastSnapshotIndex, int64_t lastSnapshotTerm) {
    m_entries.assign(1, Entry{.index = lastSnapshotIndex, .term = lastSnapshotTerm});
    m_unstable = true;
}

}

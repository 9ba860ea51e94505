//
// Created by zavier on 2022/7/8.
//

#ifndef SHARDKV_SNAPSHOT_H
#define SHARDKV_SNAPSHOT_H

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "configuration.h"

namespace shardkv::raft {

/**
 * @brief 快照元数据
 */
struct SnapshotMetadata {
    // 快照中包含的最后日志条目的索引值
    int64_t index = 0;
    // 快照中包含的最后日志条目的任期号
    int64_t term = 0;
    // 快照点上生效的成员配置
    Configuration configuration;
};

/**
 * @brief 快照
 */
struct Snapshot {
    using ptr = std::shared_ptr<Snapshot>;
    SnapshotMetadata metadata;
    // 使用者某一时刻的全量序列化后的数据
    std::string data;
    bool empty() const {
        return metadata.index == 0;
    }
};

void to_json(Json& j, const SnapshotMetadata& meta);
void from_json(const Json& j, SnapshotMetadata& meta);
void to_json(Json& j, const Snapshot& snap);
void from_json(const Json& j, Snapshot& snap);

/**
 * @brief 快照管理器，负责快照的存储和加载
 */
class Snapshotter {
public:
    explicit Snapshotter(const std::filesystem::path& dir, const std::string& snap_suffix = ".snap");
    /**
    * @brief 存储并持久化一个 snapshot，成功后删除更旧的快照
    * @return bool 是否成功存储
    */
    bool saveSnap(const Snapshot::ptr& snapshot);
    /**
    * @brief 加载最新的一个快照
    * @return Snapshot::ptr 如果没有快照则返回nullptr
    */
    Snapshot::ptr loadSnap();
private:
    /**
    * @brief 按逻辑顺序（最新的快照到旧快照）返回快照列表
    */
    std::vector<std::string> snapNames();
    /**
    * @brief 对文件名后缀的合法性检查
    * @return 合法的快照名列表
    */
    std::vector<std::string> checkSuffix(const std::vector<std::string>& names);
    /**
    * @brief 将 snapshot 序列化后持久化到磁盘
    */
    bool save(const Snapshot& snapshot);
    /**
    * @brief 反序列化成 snapshot
    */
    Snapshot::ptr read(const std::string& snapname);
private:
    // 快照目录
    const std::filesystem::path m_dir;
    // 快照文件后缀
    const std::string m_snap_suffix;
};

}
#endif //SHARDKV_SNAPSHOT_H

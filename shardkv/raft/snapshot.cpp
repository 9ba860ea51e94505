//
// Created by zavier on 2022/7/8.
//

#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include "shardkv/common/util.h"
#include "snapshot.h"

namespace shardkv::raft {
static auto g_logger = GetLogInstance();

void to_json(Json& j, const SnapshotMetadata& meta) {
    j = Json{{"index", meta.index},
             {"term", meta.term},
             {"configuration", meta.configuration}};
}

void from_json(const Json& j, SnapshotMetadata& meta) {
    j.at("index").get_to(meta.index);
    j.at("term").get_to(meta.term);
    j.at("configuration").get_to(meta.configuration);
}

void to_json(Json& j, const Snapshot& snap) {
    j = Json{{"metadata", snap.metadata},
             {"data", ToBinary(snap.data)}};
}

void from_json(const Json& j, Snapshot& snap) {
    j.at("metadata").get_to(snap.metadata);
    snap.data = FromBinary(j.at("data"));
}

Snapshotter::Snapshotter(const std::filesystem::path& dir, const std::string& snap_suffix)
        : m_dir(dir)
        , m_snap_suffix(snap_suffix) {
    if (m_dir.empty()) {
        SPDLOG_LOGGER_WARN(g_logger, "snapshot path is empty");
        return;
    }
    std::error_code ec;
    if (!std::filesystem::exists(m_dir, ec)) {
        SPDLOG_LOGGER_INFO(g_logger, "snapshot path: {} is not exists, create directory", m_dir.string());
        std::filesystem::create_directories(m_dir, ec);
        if (ec) {
            SPDLOG_LOGGER_ERROR(g_logger, "create snapshot directory {} fail: {}", m_dir.string(), ec.message());
        }
    } else if (!std::filesystem::is_directory(m_dir, ec)) {
        SPDLOG_LOGGER_WARN(g_logger, "snapshot path: {} is not a directory", m_dir.string());
    }
}

bool Snapshotter::saveSnap(const Snapshot::ptr& snapshot) {
    if (!snapshot || snapshot->empty()) {
        return false;
    }
    if (!save(*snapshot)) {
        return false;
    }
    // 只保留最新的快照
    auto names = snapNames();
    for (size_t i = 1; i < names.size(); ++i) {
        std::error_code ec;
        std::filesystem::remove(m_dir / names[i], ec);
        if (ec) {
            SPDLOG_LOGGER_WARN(g_logger, "remove old snapshot {} fail: {}", names[i], ec.message());
        }
    }
    return true;
}

Snapshot::ptr Snapshotter::loadSnap() {
    std::vector<std::string> names = snapNames();
    // 从最新到最旧来遍历所有snapshot文件
    for (auto& name: names) {
        Snapshot::ptr snap = read(name);
        if (snap) {
            return snap;
        }
    }
    return nullptr;
}

std::vector<std::string> Snapshotter::snapNames() {
    std::vector<std::string> snaps;
    std::error_code ec;
    if (!std::filesystem::is_directory(m_dir, ec)) {
        return {};
    }
    for (auto& ite: std::filesystem::directory_iterator(m_dir, ec)) {
        // 忽略其他类型文件
        if (ite.is_regular_file()) {
            snaps.push_back(ite.path().filename().string());
        }
    }
    snaps = checkSuffix(snaps);
    std::sort(snaps.begin(), snaps.end(), std::greater<>());
    return snaps;
}

std::vector<std::string> Snapshotter::checkSuffix(const std::vector<std::string>& names) {
    std::vector<std::string> snaps;
    for (auto& name: names) {
        if (name.size() > m_snap_suffix.size()
                && name.compare(name.size() - m_snap_suffix.size(), m_snap_suffix.size(), m_snap_suffix) == 0) {
            snaps.push_back(name);
        } else {
            SPDLOG_LOGGER_WARN(g_logger, "skipped unexpected non snapshot file {}", name);
        }
    }
    return snaps;
}

bool Snapshotter::save(const Snapshot& snapshot) {
    // 快照名格式 %016ld-%016ld%s，任期-索引
    std::string filename = fmt::format("{:016d}-{:016d}{}", snapshot.metadata.term,
                                       snapshot.metadata.index, m_snap_suffix);
    std::string path = m_dir / filename;
    std::string tmp = path + ".tmp";

    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        SPDLOG_LOGGER_ERROR(g_logger, "open {} fail, errno={} errstr={}", tmp, errno, strerror(errno));
        return false;
    }
    std::vector<uint8_t> data = Json::to_msgpack(Json(snapshot));
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            SPDLOG_LOGGER_ERROR(g_logger, "write {} fail, errno={} errstr={}", tmp, errno, strerror(errno));
            close(fd);
            return false;
        }
        offset += n;
    }
    // 持久化，必须马上刷新磁盘
    fsync(fd);
    close(fd);
    if (rename(tmp.c_str(), path.c_str()) != 0) {
        SPDLOG_LOGGER_ERROR(g_logger, "rename {} fail, errno={} errstr={}", tmp, errno, strerror(errno));
        return false;
    }
    return true;
}

Snapshot::ptr Snapshotter::read(const std::string& snapname) {
    std::ifstream file(m_dir / snapname, std::ios::binary);
    if (!file.is_open()) {
        return nullptr;
    }
    std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (data.empty()) {
        return nullptr;
    }
    try {
        auto snapshot = std::make_shared<Snapshot>(Json::from_msgpack(data).get<Snapshot>());
        return snapshot;
    } catch (Json::exception& e) {
        SPDLOG_LOGGER_WARN(g_logger, "read snapshot {} fail: {}", snapname, e.what());
    }
    return nullptr;
}

}

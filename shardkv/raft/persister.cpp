//
// Created by zavier on 2022/11/28.
//

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include "shardkv/common/util.h"
#include "persister.h"

namespace shardkv::raft {
static auto g_logger = GetLogInstance();

void to_json(Json& j, const HardState& hs) {
    j = Json{{"term", hs.term}, {"vote", hs.vote}, {"commit", hs.commit}};
}

void from_json(const Json& j, HardState& hs) {
    j.at("term").get_to(hs.term);
    j.at("vote").get_to(hs.vote);
    j.at("commit").get_to(hs.commit);
}

Persister::Persister(const std::filesystem::path& path)
        : m_path(path)
        , m_shotter(path / "snapshot") {
    std::error_code ec;
    if (m_path.empty()) {
        SPDLOG_LOGGER_WARN(g_logger, "Persist path is empty");
    } else if (!std::filesystem::exists(m_path, ec)) {
        SPDLOG_LOGGER_WARN(g_logger, "Persist path: {} is not exists, create directory", m_path.string());
        std::filesystem::create_directories(m_path, ec);
    } else if (!std::filesystem::is_directory(m_path, ec)) {
        SPDLOG_LOGGER_WARN(g_logger, "Persist path: {} is not a directory", m_path.string());
    } else {
        SPDLOG_LOGGER_INFO(g_logger, "Persist path : {}", getFullPathName());
    }
    std::filesystem::path state = m_path / m_name;
    if (std::filesystem::exists(state, ec)) {
        m_raftStateSize = std::filesystem::file_size(state, ec);
        if (ec) {
            m_raftStateSize = -1;
        }
    }
}

std::string Persister::getFullPathName() const {
    std::error_code ec;
    auto path = std::filesystem::canonical(m_path, ec);
    return ec ? m_path.string() : path.string();
}

bool Persister::readState(HardState& hs, std::vector<Entry>& ents) {
    std::ifstream in(m_path / m_name, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::string str((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (str.empty()) {
        return false;
    }
    try {
        Json j = Json::from_msgpack(str);
        j.at("hard_state").get_to(hs);
        j.at("entries").get_to(ents);
    } catch (Json::exception& e) {
        SPDLOG_LOGGER_ERROR(g_logger, "read raft state fail: {}", e.what());
        return false;
    }
    return !ents.empty();
}

std::optional<HardState> Persister::loadHardState() {
    std::unique_lock<MutexType> lock(m_mutex);
    HardState hs{};
    std::vector<Entry> ents;
    if (!readState(hs, ents)) {
        return std::nullopt;
    }
    return hs;
}

std::optional<std::vector<Entry>> Persister::loadEntries() {
    std::unique_lock<MutexType> lock(m_mutex);
    HardState hs{};
    std::vector<Entry> ents;
    if (!readState(hs, ents)) {
        return std::nullopt;
    }
    return ents;
}

Snapshot::ptr Persister::loadSnapshot() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_shotter.loadSnap();
}

int64_t Persister::getRaftStateSize() {
    std::unique_lock<MutexType> lock(m_mutex);
    return m_raftStateSize;
}

bool Persister::persist(const HardState& hs, const std::vector<Entry>& ents, const Snapshot::ptr& snapshot) {
    std::unique_lock<MutexType> lock(m_mutex);
    if (snapshot && !m_shotter.saveSnap(snapshot)) {
        SPDLOG_LOGGER_ERROR(g_logger, "save snapshot [index: {}, term: {}] fail",
                            snapshot->metadata.index, snapshot->metadata.term);
        return false;
    }

    Json j;
    j["hard_state"] = hs;
    j["entries"] = ents;
    std::vector<uint8_t> data = Json::to_msgpack(j);

    std::string path = m_path / m_name;
    std::string tmp = path + ".tmp";
    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        SPDLOG_LOGGER_ERROR(g_logger, "open {} fail, errno={} errstr={}", tmp, errno, strerror(errno));
        return false;
    }
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
    m_raftStateSize = data.size();
    return true;
}

}

//
// Created by zavier on 2022/7/8.
//

#ifndef SHARDKV_ENTRY_H
#define SHARDKV_ENTRY_H

#include <cstdint>
#include <string>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace shardkv::raft {
using Json = nlohmann::json;

enum class EntryType {
    NORMAL,         // 使用者提交的命令
    NOOP,           // 新 leader 上任后提交的空日志
    CONFIGURATION,  // 成员变更
};

inline std::string EntryTypeToString(EntryType type) {
    switch (type) {
        case EntryType::NORMAL: return "NORMAL";
        case EntryType::NOOP: return "NOOP";
        case EntryType::CONFIGURATION: return "CONFIGURATION";
    }
    return "UNKNOWN";
}

/**
 * @brief 日志条目，一条日志
 */
struct Entry {
    // 日志索引
    int64_t index = 0;
    // 日志任期
    int64_t term = 0;
    EntryType type = EntryType::NORMAL;
    // 日志内容 data 是一个二进制类型，
    // 使用者负责把业务序列化成二进制数，
    // 在 apply 日志的时候再反序列化执行相应业务操作
    std::string data{};
    std::string toString() const {
        std::string str = fmt::format("Index: {}, Term: {}, Type: {}, Size: {}",
                                      index, term, EntryTypeToString(type), data.size());
        return "{" + str + "}";
    }
};

/**
 * @brief 二进制数据在 msgpack 里按 bin 类型编码
 */
inline Json ToBinary(const std::string& data) {
    return Json::binary(Json::binary_t::container_type(data.begin(), data.end()));
}

inline std::string FromBinary(const Json& j) {
    if (j.is_binary()) {
        const auto& bin = j.get_binary();
        return std::string(bin.begin(), bin.end());
    }
    return j.get<std::string>();
}

inline void to_json(Json& j, const Entry& ent) {
    j = Json{{"index", ent.index},
             {"term", ent.term},
             {"type", static_cast<int>(ent.type)},
             {"data", ToBinary(ent.data)}};
}

inline void from_json(const Json& j, Entry& ent) {
    j.at("index").get_to(ent.index);
    j.at("term").get_to(ent.term);
    ent.type = static_cast<EntryType>(j.at("type").get<int>());
    ent.data = FromBinary(j.at("data"));
}

}
#endif //SHARDKV_ENTRY_H

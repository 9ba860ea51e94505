//
// Created by zavier on 2021/10/26.
//

#include <algorithm>
#include <cctype>
#include "shardkv/common/config.h"

namespace shardkv {
static auto g_logger = GetLogInstance();

bool ConfigVarBase::fromString(const std::string& str) {
    YAML::Node node;
    try {
        node = YAML::Load(str);
    } catch (const YAML::Exception& e) {
        SPDLOG_LOGGER_ERROR(g_logger, "config {} invalid yaml {}: {}", m_name, str, e.what());
        return false;
    }
    return fromNode(node);
}

bool Config::IsValidName(const std::string& name) {
    return !name.empty() && name.find_first_not_of("abcdefghijklmnopqrstuvwxyz0123456789._") == std::string::npos;
}

namespace {
/**
 * @brief 深度优先展开 yaml，key 统一转小写后用 '.' 连接
 */
void Flatten(const std::string& prefix, const YAML::Node& node,
             std::vector<std::pair<std::string, YAML::Node>>& output) {
    if (!prefix.empty()) {
        output.emplace_back(prefix, node);
    }
    if (!node.IsMap()) {
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.Scalar();
        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        std::string name = prefix.empty() ? key : prefix + "." + key;
        if (!Config::IsValidName(name)) {
            SPDLOG_LOGGER_ERROR(g_logger, "config invalid name: {}", name);
            continue;
        }
        Flatten(name, it->second, output);
    }
}
}

void Config::LoadFromYaml(const YAML::Node &root) {
    std::vector<std::pair<std::string, YAML::Node>> nodes;
    Flatten("", root, nodes);
    for (auto& [name, node]: nodes) {
        auto var = LookupBase(name);
        if (var) {
            var->fromNode(node);
        }
    }
}

void Config::LoadFromFile(const std::string &file) {
    SPDLOG_LOGGER_INFO(g_logger, "load config file: {}", file);
    LoadFromYaml(YAML::LoadFile(file));
}

ConfigVarBase::ptr Config::LookupBase(const std::string &name) {
    std::unique_lock<co_rmutex> lock(GetMutex().Reader());
    auto it = GetDatas().find(name);
    return it == GetDatas().end() ? nullptr : it->second;
}

}

//
// Created by zavier on 2022/12/3.
//

#include "shardkv/common/util.h"
#include "kv_fsm.h"

namespace shardkv::kv {
static auto g_logger = GetLogInstance();

std::string KVStateMachine::apply(const std::string& data) {
    CommandResult result;
    auto command = DecodeCommand(data);
    if (!command) {
        // 日志已经提交，无法拒绝，只能记录下来
        SPDLOG_LOGGER_ERROR(g_logger, "KVStateMachine apply malformed command: {}", data);
        result.error = INVALID_ARGUMENT;
    } else {
        result = applyCommand(*command);
    }
    return Json(result).dump();
}

CommandResult KVStateMachine::applyCommand(const Command& command) {
    CommandResult result;
    std::unique_lock<co_wmutex> lock(m_mutex.Writer());
    if (command.operation != GET && isDuplicateRequest(command)) {
        SPDLOG_LOGGER_DEBUG(g_logger, "KVStateMachine doesn't apply duplicated command {}", command.toString());
        return m_lastOperation[*command.clientId].second;
    }
    KVMap::iterator it;
    switch (command.operation) {
        case PUT:
            m_data[command.key] = command.value;
            result.value = command.value;
            break;
        case GET:
            it = m_data.find(command.key);
            if (it == m_data.end()) {
                result.error = NO_KEY;
            } else {
                result.value = it->second;
            }
            break;
        case DEL:
            it = m_data.find(command.key);
            if (it == m_data.end()) {
                result.error = NO_KEY;
            } else {
                m_data.erase(it);
            }
            break;
    }
    if (command.operation != GET && command.hasToken()) {
        m_lastOperation[*command.clientId] = {*command.requestId, result};
    }
    return result;
}

std::string KVStateMachine::snapshot() {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    Json ops = Json::array();
    for (auto& [client, op]: m_lastOperation) {
        ops.push_back(Json{{"client_id", client}, {"request_id", op.first}, {"result", op.second}});
    }
    Json json{{"data", m_data}, {"last_operation", ops}};
    std::vector<uint8_t> bytes = Json::to_msgpack(json);
    return {bytes.begin(), bytes.end()};
}

bool KVStateMachine::restore(const std::string& data) {
    KVMap kv;
    std::map<int64_t, std::pair<int64_t, CommandResult>> ops;
    // 空快照表示空状态
    if (!data.empty()) {
        try {
            Json json = Json::from_msgpack(data);
            json.at("data").get_to(kv);
            for (auto& op: json.at("last_operation")) {
                ops[op.at("client_id").get<int64_t>()] = {op.at("request_id").get<int64_t>(),
                                                          op.at("result").get<CommandResult>()};
            }
        } catch (const Json::exception& e) {
            SPDLOG_LOGGER_ERROR(g_logger, "KVStateMachine restore snapshot fail, {}", e.what());
            return false;
        }
    }
    std::unique_lock<co_wmutex> lock(m_mutex.Writer());
    m_data = std::move(kv);
    m_lastOperation = std::move(ops);
    SPDLOG_LOGGER_INFO(g_logger, "KVStateMachine restored {} keys", m_data.size());
    return true;
}

std::optional<std::string> KVStateMachine::localGet(const std::string& key) {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    auto it = m_data.find(key);
    if (it == m_data.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t KVStateMachine::size() {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    return m_data.size();
}

KVStateMachine::KVMap KVStateMachine::getData() {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    return m_data;
}

bool KVStateMachine::isDuplicateRequest(const Command& command) {
    if (!command.hasToken()) {
        return false;
    }
    auto it = m_lastOperation.find(*command.clientId);
    if (it == m_lastOperation.end()) {
        return false;
    }
    return it->second.first == *command.requestId;
}

}

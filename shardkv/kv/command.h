//
// Created by zavier on 2022/12/3.
//

#ifndef SHARDKV_KV_COMMAND_H
#define SHARDKV_KV_COMMAND_H

#include <optional>
#include <stdexcept>
#include <string>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace shardkv::kv {
using Json = nlohmann::json;

enum Error {
    OK,
    NO_KEY,
    WRONG_LEADER,
    TIMEOUT,
    INVALID_ARGUMENT,
    MEMBERSHIP,
    CLOSED,
};

inline std::string toString(Error err) {
    std::string str;
    switch (err) {
        case OK: str = "OK"; break;
        case NO_KEY: str = "Key not found"; break;
        case WRONG_LEADER: str = "This node is not the leader"; break;
        case TIMEOUT: str = "Consensus timeout, outcome unknown"; break;
        case INVALID_ARGUMENT: str = "Invalid argument"; break;
        case MEMBERSHIP: str = "Membership change failed"; break;
        case CLOSED: str = "Closed"; break;
        default: str = "Unexpect Error";
    }
    return str;
}

enum Operation {
    PUT,
    GET,
    DEL,
};

inline std::string toString(Operation op) {
    std::string str;
    switch (op) {
        case PUT: str = "PUT"; break;
        case GET: str = "GET"; break;
        case DEL: str = "DEL"; break;
        default: str = "Unexpect Operation";
    }
    return str;
}

/**
 * @brief 写入日志的命令
 * @details clientId 和 requestId 同时存在时，同一个客户端重复的写请求只会 apply 一次
 */
struct Command {
    Operation operation = GET;
    std::string key;
    std::string value;
    std::optional<int64_t> clientId;
    std::optional<int64_t> requestId;

    bool hasToken() const { return clientId && requestId;}
    std::string toString() const {
        std::string str = fmt::format("operation: {}, key: {}, value: {}, clientId: {}, requestId: {}",
                                      kv::toString(operation), key, value,
                                      clientId ? std::to_string(*clientId) : "none",
                                      requestId ? std::to_string(*requestId) : "none");
        return "{" + str + "}";
    }
};

struct CommandResult {
    Error error = OK;
    std::string value;
    std::string toString() const {
        std::string str = fmt::format("error: {}, value: {}", kv::toString(error), value);
        return "{" + str + "}";
    }
};

inline void to_json(Json& j, const Command& c) {
    j = Json{{"op", kv::toString(c.operation)}, {"key", c.key}, {"value", c.value}};
    if (c.clientId) {
        j["client_id"] = *c.clientId;
    }
    if (c.requestId) {
        j["request_id"] = *c.requestId;
    }
}

inline void from_json(const Json& j, Command& c) {
    const std::string op = j.at("op").get<std::string>();
    if (op == "PUT") {
        c.operation = PUT;
    } else if (op == "GET") {
        c.operation = GET;
    } else if (op == "DEL") {
        c.operation = DEL;
    } else {
        throw std::invalid_argument("unknown operation " + op);
    }
    j.at("key").get_to(c.key);
    c.value = j.value("value", "");
    c.clientId.reset();
    c.requestId.reset();
    if (j.contains("client_id")) {
        c.clientId = j.at("client_id").get<int64_t>();
    }
    if (j.contains("request_id")) {
        c.requestId = j.at("request_id").get<int64_t>();
    }
}

/**
 * @brief 解码日志里的命令，格式错误时返回 std::nullopt
 */
inline std::optional<Command> DecodeCommand(const std::string& data) {
    try {
        return Json::parse(data).get<Command>();
    } catch (const Json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

inline std::string EncodeCommand(const Command& command) {
    return Json(command).dump();
}

inline void to_json(Json& j, const CommandResult& r) {
    j = Json{{"error", (int)r.error}, {"value", r.value}};
}

inline void from_json(const Json& j, CommandResult& r) {
    r.error = (Error)j.at("error").get<int>();
    j.at("value").get_to(r.value);
}

}
#endif //SHARDKV_KV_COMMAND_H

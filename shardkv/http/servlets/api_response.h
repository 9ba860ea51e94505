//
// Created by zavier on 2023/1/14.
//

#ifndef SHARDKV_API_RESPONSE_H
#define SHARDKV_API_RESPONSE_H

#include <optional>
#include <string>
#include "shardkv/http/http.h"
#include "shardkv/kv/command.h"

namespace shardkv::http {

inline const std::string kNotLeaderError = "This node is not the leader";
inline const std::string kKeyNotFoundError = "Key not found";

/**
 * 统一的 json 响应格式：
 *  {
 *      "success": true,
 *      "message": "...",   // 可选
 *      "data": {...},      // 可选
 *      "error": "..."      // 失败时的原因
 *  }
 */
void WriteJson(HttpResponse::ptr response, HttpStatus status, const Json& json);
void WriteSuccess(HttpResponse::ptr response, const std::string& message, const Json& data = nullptr);
void WriteError(HttpResponse::ptr response, HttpStatus status, const std::string& error);
/**
 * @brief 把 kv 的错误转成对应的状态码，WRONG_LEADER 时带上 leader 地址
 */
void WriteKVError(HttpResponse::ptr response, kv::Error error, const std::string& message, const std::string& leader = "");
HttpStatus KVErrorToStatus(kv::Error error);

/**
 * @brief 读取请求参数，Content-Type 为 json 时解析 body，否则使用 query 和表单参数
 * @return json 格式错误时返回 std::nullopt
 */
std::optional<Json> ReadParams(HttpRequest::ptr request);
/**
 * @brief 读取字符串字段，数字会被转成字符串
 */
std::optional<std::string> GetString(const Json& params, const std::string& key);
/**
 * @brief 读取整数字段，字符串会被转成整数
 */
std::optional<int64_t> GetInt(const Json& params, const std::string& key);

}
#endif //SHARDKV_API_RESPONSE_H

//
// Created by zavier on 2023/1/12.
//

#include "shardkv/common/config.h"
#include "node_client.h"

namespace shardkv::router {
static auto g_logger = GetLogInstance();

static ConfigVar<uint32_t>::ptr g_pool_size =
        Config::Lookup<uint32_t>("router.pool_size", 16, "max idle connections to one node");

static const std::string NOT_LEADER_ERROR = "This node is not the leader";

bool NodeReply::success() const {
    if (status != OK || !body.is_object()) {
        return false;
    }
    auto it = body.find("success");
    return it != body.end() && it->is_boolean() && it->get<bool>();
}

bool NodeReply::notLeader() const {
    if (status != OK || !body.is_object()) {
        return false;
    }
    auto it = body.find("error");
    return it != body.end() && it->is_string() && it->get<std::string>() == NOT_LEADER_ERROR;
}

std::string NodeReply::toString() const {
    std::string str = fmt::format("status: {}, httpStatus: {}, body: {}, error: {}",
                                  status == OK ? "OK" : "UNREACHABLE", httpStatus,
                                  body.is_discarded() ? "" : body.dump(), error);
    return "{" + str + "}";
}

HttpNodeClient::HttpNodeClient(const std::string& address)
    : NodeClient(TrimScheme(address)) {
    m_pool = http::HttpConnectionPool::Create(m_address, g_pool_size->getValue(), 60000, UINT32_MAX);
    if (!m_pool) {
        SPDLOG_LOGGER_ERROR(g_logger, "invalid node address {}", address);
    }
}

NodeReply HttpNodeClient::put(const std::string& key, const std::string& value, uint64_t timeout_ms) {
    return request(http::HttpMethod::PUT, "/put", timeout_ms, Json{{"key", key}, {"val", value}});
}

NodeReply HttpNodeClient::get(const std::string& key, uint64_t timeout_ms) {
    return request(http::HttpMethod::GET, "/get?key=" + UrlEncode(key), timeout_ms, nullptr);
}

NodeReply HttpNodeClient::del(const std::string& key, uint64_t timeout_ms) {
    return request(http::HttpMethod::DELETE, "/delete", timeout_ms, Json{{"key", key}});
}

NodeReply HttpNodeClient::status(uint64_t timeout_ms) {
    return request(http::HttpMethod::GET, "/raft/status", timeout_ms, nullptr);
}

NodeReply HttpNodeClient::request(http::HttpMethod method, const std::string& path, uint64_t timeout_ms, const Json& body) {
    if (!m_pool) {
        return {.status = NodeReply::UNREACHABLE, .error = "invalid node address " + m_address};
    }
    std::map<std::string, std::string> headers;
    std::string content;
    if (!body.is_null()) {
        headers["Content-Type"] = "application/json";
        content = body.dump();
    }
    return toReply(m_pool->doRequest(method, path, timeout_ms, headers, content));
}

NodeReply HttpNodeClient::toReply(const http::HttpResult::ptr& result) {
    NodeReply reply;
    if (result->result != http::HttpResult::OK || !result->response) {
        reply.status = NodeReply::UNREACHABLE;
        reply.error = result->toString();
        SPDLOG_LOGGER_DEBUG(g_logger, "node {} unreachable, {}", m_address, reply.error);
        return reply;
    }
    reply.httpStatus = (uint32_t)result->response->getStatus();
    reply.body = result->response->getJson();
    return reply;
}

}

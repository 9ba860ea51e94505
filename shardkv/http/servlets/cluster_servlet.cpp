//
// Created by zavier on 2023/1/14.
//

#include "shardkv/cluster/leader_broadcaster.h"
#include "shardkv/kv/kv_server.h"
#include "api_response.h"
#include "cluster_servlet.h"

namespace shardkv::http {
static auto g_logger = GetLogInstance();

ClusterServlet::ClusterServlet(std::shared_ptr<shardkv::kv::KVServer> store,
                               std::shared_ptr<shardkv::cluster::LeaderBroadcaster> broadcaster)
    : Servlet("ClusterServlet")
    , m_store(std::move(store))
    , m_broadcaster(std::move(broadcaster)) {
}

int32_t ClusterServlet::handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) {
    const std::string& path = request->getPath();
    if (path == "/config") {
        handleConfig(request, response);
    } else if (path == "/addshard") {
        handleShard(request, response, "Shard added successfully");
    } else if (path == "/newleader") {
        handleShard(request, response, "Leader information updated successfully");
    } else {
        WriteError(response, HttpStatus::NOT_FOUND, "Not found");
    }
    return 0;
}

void ClusterServlet::handleConfig(HttpRequest::ptr request, HttpResponse::ptr response) {
    std::map<int64_t, std::string> shards = m_store->Config();
    // 还没有成员配置时使用本地缓存
    if (shards.empty()) {
        shards = m_broadcaster->getKnownPeers()->addresses();
        shards[m_store->getId()] = m_store->getAddress();
        SPDLOG_LOGGER_DEBUG(g_logger, "membership is empty, using fallback configuration: {} shards", shards.size());
    }
    Json map = Json::object();
    for (auto& [id, address]: shards) {
        map[std::to_string(id)] = address;
    }
    Json data{{"shardCount", shards.size()}, {"shards", map}};
    WriteSuccess(response, "Configuration retrieved successfully", data);
}

void ClusterServlet::handleShard(HttpRequest::ptr request, HttpResponse::ptr response, const std::string& message) {
    auto params = ReadParams(request);
    if (!params) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid JSON format");
        return;
    }
    auto address = GetString(*params, "shardAddress");
    if (!address) {
        address = GetString(*params, "address");
    }
    if (!params->contains("shardID") || !address || address->empty()) {
        WriteError(response, HttpStatus::BAD_REQUEST, "ShardID and ShardAddress are required");
        return;
    }
    auto shardId = GetInt(*params, "shardID");
    if (!shardId) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid shard ID format");
        return;
    }
    cluster::LeaderInfo info{.shardId = *shardId, .address = *address};
    if (params->contains("term")) {
        info.term = GetInt(*params, "term");
        if (!info.term) {
            WriteError(response, HttpStatus::BAD_REQUEST, "Invalid term format");
            return;
        }
    }

    cluster::MergeResult result = m_broadcaster->receive(info);
    if (result == cluster::MergeResult::FULL) {
        WriteError(response, HttpStatus::INTERNAL_SERVER_ERROR, "Known peers map is full");
        return;
    }
    Json data{{"shardID", info.shardId},
              {"shardAddress", info.address},
              {"result", cluster::MergeResultToString(result)}};
    WriteSuccess(response, message, data);
}

}

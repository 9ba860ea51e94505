//
// Created by zavier on 2023/1/14.
//

#include "shardkv/kv/kv_server.h"
#include "api_response.h"
#include "raft_servlet.h"

namespace shardkv::http {
static auto g_logger = GetLogInstance();

Json RaftStatsToJson(const raft::RaftStats& stats) {
    Json data;
    data["state"] = raft::RaftStateToString(stats.state);
    data["term"] = stats.term;
    data["leader"] = stats.leaderAddress;
    data["leader_id"] = stats.leaderId;
    data["num_peers"] = stats.numPeers;
    data["commit_index"] = stats.commitIndex;
    data["applied_index"] = stats.appliedIndex;
    data["last_log_index"] = stats.lastLogIndex;
    data["last_log_term"] = stats.lastLogTerm;
    data["last_snapshot_index"] = stats.lastSnapshotIndex;
    data["latest_configuration"] = stats.configuration.servers;
    return data;
}

RaftServlet::RaftServlet(std::shared_ptr<shardkv::kv::KVServer> store)
    : Servlet("RaftServlet"), m_store(std::move(store)) {
}

int32_t RaftServlet::handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) {
    const std::string& path = request->getPath();
    if (path == "/raft/join") {
        handleJoin(request, response);
    } else if (path == "/raft/leave") {
        handleLeave(request, response);
    } else if (path == "/raft/status") {
        handleStatus(request, response);
    } else {
        WriteError(response, HttpStatus::NOT_FOUND, "Not found");
    }
    return 0;
}

void RaftServlet::handleJoin(HttpRequest::ptr request, HttpResponse::ptr response) {
    auto params = ReadParams(request);
    if (!params) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid JSON format");
        return;
    }
    auto address = GetString(*params, "addr");
    if (!params->contains("nodeid") || !address || address->empty()) {
        WriteError(response, HttpStatus::BAD_REQUEST, "NodeID and address are required");
        return;
    }
    auto nodeId = GetInt(*params, "nodeid");
    if (!nodeId) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid node ID format");
        return;
    }
    kv::CommandResponse resp = m_store->Join(*nodeId, *address);
    if (!resp.ok()) {
        WriteKVError(response, resp.error, resp.errorMessage(), resp.leader);
        return;
    }
    WriteSuccess(response, "Node joined successfully",
                 Json{{"nodeid", std::to_string(*nodeId)}, {"addr", *address}});
}

void RaftServlet::handleLeave(HttpRequest::ptr request, HttpResponse::ptr response) {
    auto params = ReadParams(request);
    if (!params) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid JSON format");
        return;
    }
    if (!params->contains("nodeid")) {
        WriteError(response, HttpStatus::BAD_REQUEST, "NodeID is required");
        return;
    }
    auto nodeId = GetInt(*params, "nodeid");
    if (!nodeId) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid node ID format");
        return;
    }
    kv::CommandResponse resp = m_store->Leave(*nodeId);
    if (!resp.ok()) {
        WriteKVError(response, resp.error, fmt::format("Failed to remove node {}: {}", *nodeId, resp.errorMessage()),
                     resp.leader);
        return;
    }
    WriteSuccess(response, "Node removed successfully", Json{{"nodeid", std::to_string(*nodeId)}});
}

void RaftServlet::handleStatus(HttpRequest::ptr request, HttpResponse::ptr response) {
    WriteSuccess(response, "Raft status retrieved successfully", RaftStatsToJson(m_store->Status()));
}

RaftRpcServlet::RaftRpcServlet(raft::RaftNode::ptr raft)
    : Servlet("RaftRpcServlet"), m_raft(std::move(raft)) {
}

int32_t RaftRpcServlet::handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) {
    const std::string& path = request->getPath();
    const std::string& body = request->getBody();
    std::string reply;
    if (path == raft::REQUEST_VOTE) {
        auto args = raft::DecodeMessage<raft::RequestVoteArgs>(body);
        if (args) {
            reply = raft::EncodeMessage(m_raft->handleRequestVote(std::move(*args)));
        }
    } else if (path == raft::APPEND_ENTRIES) {
        auto args = raft::DecodeMessage<raft::AppendEntriesArgs>(body);
        if (args) {
            reply = raft::EncodeMessage(m_raft->handleAppendEntries(std::move(*args)));
        }
    } else if (path == raft::INSTALL_SNAPSHOT) {
        auto args = raft::DecodeMessage<raft::InstallSnapshotArgs>(body);
        if (args) {
            reply = raft::EncodeMessage(m_raft->handleInstallSnapshot(std::move(*args)));
        }
    } else {
        WriteError(response, HttpStatus::NOT_FOUND, "Not found");
        return 0;
    }
    if (reply.empty()) {
        SPDLOG_LOGGER_DEBUG(g_logger, "invalid raft rpc body on {}", path);
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid raft message");
        return 0;
    }
    response->setStatus(HttpStatus::OK);
    response->setContentType(HttpContentType::APPLICATION_MSGPACK);
    response->setBody(reply);
    return 0;
}

}

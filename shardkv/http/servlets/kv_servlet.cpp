//
// Created by zavier on 2022/12/6.
//

#include "shardkv/kv/kv_server.h"
#include "api_response.h"
#include "kv_servlet.h"

namespace shardkv::http {
static auto g_logger = GetLogInstance();

KVServlet::KVServlet(std::shared_ptr<shardkv::kv::KVServer> store)
    : Servlet("KVServlet"), m_store(std::move(store)) {
}

int32_t KVServlet::handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) {
    const std::string& path = request->getPath();
    if (path == "/put") {
        handlePut(request, response);
    } else if (path == "/get") {
        handleGet(request, response);
    } else if (path == "/delete") {
        handleDelete(request, response);
    } else {
        WriteError(response, HttpStatus::NOT_FOUND, "Not found");
    }
    return 0;
}

void KVServlet::handlePut(HttpRequest::ptr request, HttpResponse::ptr response) {
    auto params = ReadParams(request);
    if (!params) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid JSON format");
        return;
    }
    auto key = GetString(*params, "key");
    auto value = GetString(*params, "val");
    if (!value) {
        value = GetString(*params, "value");
    }
    if (!key || key->empty() || !value || value->empty()) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Key and value are required");
        return;
    }
    auto clientId = GetInt(*params, "client_id");
    auto requestId = GetInt(*params, "request_id");

    SPDLOG_LOGGER_DEBUG(g_logger, "[HTTP-PUT] key {}", *key);
    kv::CommandResponse resp = m_store->Put(*key, *value, clientId, requestId);
    if (!resp.ok()) {
        WriteKVError(response, resp.error, resp.errorMessage(), resp.leader);
        return;
    }
    WriteSuccess(response, "Key-value pair stored successfully", Json{{"key", *key}, {"value", resp.value}});
}

void KVServlet::handleGet(HttpRequest::ptr request, HttpResponse::ptr response) {
    std::string key = request->getParam("key");
    if (key.empty()) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Key parameter is required");
        return;
    }
    kv::CommandResponse resp = m_store->Get(key);
    if (resp.error == kv::NO_KEY) {
        Json json{{"success", false}, {"key", key}, {"error", kKeyNotFoundError}};
        WriteJson(response, HttpStatus::NOT_FOUND, json);
        return;
    }
    if (!resp.ok()) {
        WriteKVError(response, resp.error, resp.errorMessage(), resp.leader);
        return;
    }
    SPDLOG_LOGGER_DEBUG(g_logger, "[HTTP-GET] key {} was found", key);
    WriteJson(response, HttpStatus::OK, Json{{"success", true}, {"key", key}, {"value", resp.value}});
}

void KVServlet::handleDelete(HttpRequest::ptr request, HttpResponse::ptr response) {
    auto params = ReadParams(request);
    if (!params) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid JSON format");
        return;
    }
    auto key = GetString(*params, "key");
    if (!key || key->empty()) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Key parameter is required");
        return;
    }
    auto clientId = GetInt(*params, "client_id");
    auto requestId = GetInt(*params, "request_id");

    kv::CommandResponse resp = m_store->Delete(*key, clientId, requestId);
    if (resp.error == kv::NO_KEY) {
        WriteError(response, HttpStatus::NOT_FOUND, kKeyNotFoundError);
        return;
    }
    if (!resp.ok()) {
        WriteKVError(response, resp.error, resp.errorMessage(), resp.leader);
        return;
    }
    SPDLOG_LOGGER_DEBUG(g_logger, "[HTTP-DELETE] key {} was deleted", *key);
    WriteSuccess(response, "Key deleted successfully", Json{{"key", *key}});
}

}

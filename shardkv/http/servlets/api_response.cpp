//
// Created by zavier on 2023/1/14.
//

#include "shardkv/common/util.h"
#include "api_response.h"

#include <boost/lexical_cast.hpp>

namespace shardkv::http {
static auto g_logger = GetLogInstance();

void WriteJson(HttpResponse::ptr response, HttpStatus status, const Json& json) {
    response->setStatus(status);
    response->setJson(json);
}

void WriteSuccess(HttpResponse::ptr response, const std::string& message, const Json& data) {
    Json resp;
    resp["success"] = true;
    if (!message.empty()) {
        resp["message"] = message;
    }
    if (!data.is_null()) {
        resp["data"] = data;
    }
    WriteJson(response, HttpStatus::OK, resp);
}

void WriteError(HttpResponse::ptr response, HttpStatus status, const std::string& error) {
    Json resp;
    resp["success"] = false;
    resp["error"] = error;
    WriteJson(response, status, resp);
}

HttpStatus KVErrorToStatus(kv::Error error) {
    switch (error) {
        case kv::OK: return HttpStatus::OK;
        case kv::NO_KEY: return HttpStatus::NOT_FOUND;
        case kv::WRONG_LEADER:
        case kv::INVALID_ARGUMENT: return HttpStatus::BAD_REQUEST;
        case kv::TIMEOUT: return HttpStatus::SERVICE_UNAVAILABLE;
        case kv::MEMBERSHIP:
        case kv::CLOSED: return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

void WriteKVError(HttpResponse::ptr response, kv::Error error, const std::string& message, const std::string& leader) {
    Json resp;
    resp["success"] = false;
    if (error == kv::WRONG_LEADER) {
        resp["error"] = kNotLeaderError;
        resp["leader"] = leader;
    } else {
        resp["error"] = message;
    }
    WriteJson(response, KVErrorToStatus(error), resp);
}

std::optional<Json> ReadParams(HttpRequest::ptr request) {
    if (request->getContentType() == HttpContentType::APPLICATION_JSON) {
        Json json = request->getJson();
        if (json.is_discarded() || !json.is_object()) {
            return std::nullopt;
        }
        // query 参数作为补充
        for (auto& [key, val]: request->getParams()) {
            if (!json.contains(key)) {
                json[key] = val;
            }
        }
        return json;
    }
    Json json = Json::object();
    for (auto& [key, val]: request->getParams()) {
        json[key] = val;
    }
    return json;
}

std::optional<std::string> GetString(const Json& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<int64_t>());
    }
    return std::nullopt;
}

std::optional<int64_t> GetInt(const Json& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        try {
            return boost::lexical_cast<int64_t>(it->get<std::string>());
        } catch (const boost::bad_lexical_cast& e) {
            SPDLOG_LOGGER_DEBUG(g_logger, "field {} is not an integer: {}", key, e.what());
        }
    }
    return std::nullopt;
}

}

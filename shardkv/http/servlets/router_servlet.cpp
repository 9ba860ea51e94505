//
// Created by zavier on 2023/1/15.
//

#include "shardkv/router/router.h"
#include "api_response.h"
#include "router_servlet.h"

namespace shardkv::http {
static auto g_logger = GetLogInstance();

RouterServlet::RouterServlet(std::shared_ptr<shardkv::router::Router> router)
    : Servlet("RouterServlet"), m_router(std::move(router)) {
}

int32_t RouterServlet::handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) {
    const std::string& path = request->getPath();
    if (path == "/status") {
        WriteSuccess(response, "Router status retrieved successfully", m_router->status());
        return 0;
    }
    if (path == "/get") {
        std::string key = request->getParam("key");
        if (key.empty()) {
            WriteError(response, HttpStatus::BAD_REQUEST, "Key parameter is required");
            return 0;
        }
        writeResult(response, m_router->get(key));
        return 0;
    }
    if (path != "/put" && path != "/delete") {
        WriteError(response, HttpStatus::NOT_FOUND, "Not found");
        return 0;
    }

    auto params = ReadParams(request);
    if (!params) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Invalid JSON format");
        return 0;
    }
    auto key = GetString(*params, "key");
    if (!key || key->empty()) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Key parameter is required");
        return 0;
    }
    if (path == "/delete") {
        writeResult(response, m_router->del(*key));
        return 0;
    }
    auto value = GetString(*params, "val");
    if (!value) {
        value = GetString(*params, "value");
    }
    if (!value || value->empty()) {
        WriteError(response, HttpStatus::BAD_REQUEST, "Key and value are required");
        return 0;
    }
    writeResult(response, m_router->put(*key, *value));
    return 0;
}

void RouterServlet::writeResult(HttpResponse::ptr response, const shardkv::router::RouterResult& result) {
    switch (result.error) {
        case router::RouterError::OK:
            break;
        case router::RouterError::NO_LEADER:
            WriteError(response, HttpStatus::SERVICE_UNAVAILABLE, router::RouterErrorToString(result.error));
            return;
        case router::RouterError::UNREACHABLE:
            WriteError(response, HttpStatus::BAD_GATEWAY, router::RouterErrorToString(result.error));
            return;
    }
    SPDLOG_LOGGER_DEBUG(g_logger, "forwarded to {}, {}", result.node, result.reply.toString());
    if (result.reply.body.is_discarded() || result.reply.body.is_null()) {
        WriteError(response, HttpStatus::BAD_GATEWAY, "Invalid response from " + result.node);
        return;
    }
    WriteJson(response, (HttpStatus)result.reply.httpStatus, result.reply.body);
}

}

//
// Created by zavier on 2023/1/16.
//

#include <cstdlib>
#include <fmt/ranges.h>
#include "shardkv/common/config.h"
#include "shardkv/http/http_server.h"
#include "shardkv/http/servlets/router_servlet.h"
#include "shardkv/router/router.h"

using namespace shardkv;

static auto g_logger = GetLogInstance();

static ConfigVar<std::string>::ptr g_router_address =
        Config::Lookup<std::string>("router.address", "0.0.0.0:3000", "router http address");

static ConfigVar<std::vector<std::string>>::ptr g_router_nodes =
        Config::Lookup<std::vector<std::string>>("router.nodes",
                {"127.0.0.1:8011", "127.0.0.1:8021", "127.0.0.1:8031"}, "node addresses");

http::HttpServer::ptr server;

void Main() {
    auto router = std::make_shared<router::Router>(g_router_nodes->getValue());
    Address::ptr address = Address::Resolve(TrimScheme(g_router_address->getValue()));
    if (!address) {
        SPDLOG_LOGGER_CRITICAL(g_logger, "invalid router address {}", g_router_address->getValue());
        exit(EXIT_FAILURE);
    }
    server = std::make_shared<http::HttpServer>(true);
    server->setName("shardkv-router");
    auto servlet = std::make_shared<http::RouterServlet>(router);
    auto dispatch = server->getServletDispatch();
    dispatch->addServlet("/put", servlet);
    dispatch->addServlet("/get", servlet);
    dispatch->addServlet("/delete", servlet);
    dispatch->addServlet("/status", servlet);
    while (!server->bind(address)) {
        sleep(1);
    }
    server->start();
    SPDLOG_LOGGER_INFO(g_logger, "router serving on {}, nodes {}",
                       address->toString(), fmt::join(router->getNodes(), ", "));
}

// 启动方法
// ./shardkv_router conf/router.yml

int main(int argc, char** argv) {
    if (argc > 1) {
        try {
            Config::LoadFromFile(argv[1]);
        } catch (YAML::Exception& e) {
            SPDLOG_LOGGER_CRITICAL(g_logger, "load config file {} fail, {}", argv[1], e.what());
            return EXIT_FAILURE;
        }
    }
    go Main;
    co_sched.Start(0);
}

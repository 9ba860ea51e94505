//
// Created by zavier on 2022/12/20.
//

#include <algorithm>
#include "shardkv/common/util.h"
#include "configuration.h"

namespace shardkv::raft {
static auto g_logger = GetLogInstance();

std::string SuffrageToString(Suffrage suffrage) {
    return suffrage == Suffrage::Voter ? "Voter" : "Nonvoter";
}

bool Configuration::contains(int64_t id) const {
    return find(id) != nullptr;
}

bool Configuration::hasVoter(int64_t id) const {
    auto server = find(id);
    return server && server->suffrage == Suffrage::Voter;
}

const Server* Configuration::find(int64_t id) const {
    for (auto& server: servers) {
        if (server.id == id) {
            return &server;
        }
    }
    return nullptr;
}

std::optional<std::string> Configuration::getAddress(int64_t id) const {
    auto server = find(id);
    if (!server) {
        return std::nullopt;
    }
    return server->address;
}

size_t Configuration::voterCount() const {
    return std::count_if(servers.begin(), servers.end(), [](const Server& s) {
        return s.suffrage == Suffrage::Voter;
    });
}

size_t Configuration::quorumSize() const {
    size_t voters = voterCount();
    if (!voters) {
        return 0;
    }
    return voters / 2 + 1;
}

bool Configuration::addVoter(int64_t id, const std::string& address) {
    for (auto& server: servers) {
        if (server.id == id) {
            if (server.address == address && server.suffrage == Suffrage::Voter) {
                return false;
            }
            server.address = address;
            server.suffrage = Suffrage::Voter;
            return true;
        }
    }
    servers.push_back({.id = id, .address = address, .suffrage = Suffrage::Voter});
    return true;
}

bool Configuration::removeServer(int64_t id) {
    auto it = std::find_if(servers.begin(), servers.end(), [id](const Server& s) {
        return s.id == id;
    });
    if (it == servers.end()) {
        return false;
    }
    servers.erase(it);
    return true;
}

std::string Configuration::encode() const {
    std::vector<uint8_t> buff = Json::to_msgpack(Json(*this));
    return std::string(buff.begin(), buff.end());
}

std::optional<Configuration> Configuration::Decode(const std::string& data) {
    try {
        return Json::from_msgpack(data).get<Configuration>();
    } catch (Json::exception& e) {
        SPDLOG_LOGGER_ERROR(g_logger, "decode configuration fail: {}", e.what());
    }
    return std::nullopt;
}

std::string Configuration::toString() const {
    std::string str;
    for (auto& server: servers) {
        if (!str.empty()) {
            str.push_back(',');
        }
        str += fmt::format("{{Id: {}, Address: {}, Suffrage: {}}}",
                           server.id, server.address, SuffrageToString(server.suffrage));
    }
    return "[" + str + "]";
}

void to_json(Json& j, const Server& server) {
    j = Json{{"id", server.id},
             {"address", server.address},
             {"suffrage", SuffrageToString(server.suffrage)}};
}

void from_json(const Json& j, Server& server) {
    j.at("id").get_to(server.id);
    j.at("address").get_to(server.address);
    server.suffrage = j.value("suffrage", "Voter") == "Voter" ? Suffrage::Voter : Suffrage::Nonvoter;
}

void to_json(Json& j, const Configuration& conf) {
    j = Json{{"servers", conf.servers}};
}

void from_json(const Json& j, Configuration& conf) {
    j.at("servers").get_to(conf.servers);
}

}

//
// Created by zavier on 2022/12/3.
//

#include "shardkv/common/config.h"
#include "kv_server.h"

namespace shardkv::kv {
static auto g_logger = GetLogInstance();

static ConfigVar<uint64_t>::ptr g_apply_timeout =
        Config::Lookup<uint64_t>("kv.apply.timeout", 500, "kv apply timeout(ms), outcome is unknown after it");

static uint64_t s_apply_timeout = 500;

namespace {
struct KVServerIniter{
    KVServerIniter(){
        s_apply_timeout = g_apply_timeout->getValue();
        g_apply_timeout->addListener([](const uint64_t& old_val, const uint64_t& new_val){
            SPDLOG_LOGGER_INFO(g_logger, "kv apply timeout changed from {} to {}", old_val, new_val);
            s_apply_timeout = new_val;
        });
    }
};

[[maybe_unused]]
static KVServerIniter s_initer;
}

uint64_t KVServer::GetApplyTimeout() {
    return s_apply_timeout;
}

KVServer::KVServer(int64_t id, const std::string& address, const std::string& dataDir, PeerFactory factory)
    : m_id(id)
    , m_address(TrimScheme(address))
    , m_persister(std::make_shared<Persister>(dataDir))
    , m_fsm(std::make_shared<KVStateMachine>()) {
    m_raft = std::make_shared<RaftNode>(id, m_address, m_persister, m_fsm, std::move(factory));
}

KVServer::~KVServer() {
    stop();
}

void KVServer::start() {
    m_raft->start();
}

void KVServer::stop() {
    m_raft->stop();
}

bool KVServer::bootstrap() {
    Configuration conf;
    conf.addVoter(m_id, m_address);
    return m_raft->bootstrap(conf);
}

CommandResponse KVServer::Put(const std::string& key, const std::string& value,
                              std::optional<int64_t> clientId, std::optional<int64_t> requestId) {
    if (key.empty() || value.empty()) {
        return {.error = INVALID_ARGUMENT, .message = "Key and value are required"};
    }
    Command command{.operation = PUT, .key = key, .value = value, .clientId = clientId, .requestId = requestId};
    return handleCommand(command);
}

CommandResponse KVServer::Get(const std::string& key) {
    if (key.empty()) {
        return {.error = INVALID_ARGUMENT, .message = "Key parameter is required"};
    }
    Command command{.operation = GET, .key = key};
    return handleCommand(command);
}

CommandResponse KVServer::Delete(const std::string& key,
                                 std::optional<int64_t> clientId, std::optional<int64_t> requestId) {
    if (key.empty()) {
        return {.error = INVALID_ARGUMENT, .message = "Key parameter is required"};
    }
    Command command{.operation = DEL, .key = key, .clientId = clientId, .requestId = requestId};
    return handleCommand(command);
}

CommandResponse KVServer::handleCommand(const Command& command) {
    CommandResponse response;
    co_defer_scope {
        SPDLOG_LOGGER_DEBUG(g_logger, "Node[{}] processes Command {} with CommandResponse {}",
                            m_id, command.toString(), response.toString());
    };
    ApplyResult result = m_raft->apply(EncodeCommand(command), s_apply_timeout);
    if (result.error != RaftError::OK) {
        response = fromRaftError(result.error);
        return response;
    }
    try {
        CommandResult commandResult = Json::parse(result.response).get<CommandResult>();
        response.error = commandResult.error;
        response.value = std::move(commandResult.value);
    } catch (const Json::exception& e) {
        SPDLOG_LOGGER_ERROR(g_logger, "Node[{}] invalid state machine response {}, {}", m_id, result.response, e.what());
        response.error = CLOSED;
        response.message = "Invalid state machine response";
    }
    return response;
}

CommandResponse KVServer::Join(int64_t id, const std::string& address) {
    if (address.empty()) {
        return {.error = INVALID_ARGUMENT, .message = "NodeID and address are required"};
    }
    RaftError err = m_raft->addVoter(id, address, s_apply_timeout);
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] join Node[{}] at {}: {}", m_id, id, address, RaftErrorToString(err));
    return fromRaftError(err);
}

CommandResponse KVServer::Leave(int64_t id) {
    RaftError err = m_raft->removeServer(id, s_apply_timeout);
    SPDLOG_LOGGER_INFO(g_logger, "Node[{}] remove Node[{}]: {}", m_id, id, RaftErrorToString(err));
    return fromRaftError(err);
}

RaftStats KVServer::Status() {
    return m_raft->stats();
}

std::map<int64_t, std::string> KVServer::Config() {
    std::map<int64_t, std::string> shards;
    for (auto& server: m_raft->getConfiguration().servers) {
        shards[server.id] = server.address;
    }
    return shards;
}

CommandResponse KVServer::fromRaftError(RaftError err) {
    CommandResponse response;
    switch (err) {
        case RaftError::OK:
            break;
        case RaftError::NOT_LEADER:
            response.error = WRONG_LEADER;
            response.leader = m_raft->leader();
            break;
        // 失去领导权时日志可能仍然会被提交
        case RaftError::TIMEOUT:
        case RaftError::LEADERSHIP_LOST:
            response.error = TIMEOUT;
            break;
        case RaftError::SHUTDOWN:
            response.error = CLOSED;
            break;
        case RaftError::CONFIG_IN_PROGRESS:
        case RaftError::UNKNOWN_SERVER:
        case RaftError::ALREADY_MEMBER:
            response.error = MEMBERSHIP;
            response.message = "Membership change failed: " + RaftErrorToString(err);
            break;
    }
    return response;
}

}

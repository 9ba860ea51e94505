//
// Created by zavier on 2023/1/14.
//

#ifndef SHARDKV_RAFT_SERVLET_H
#define SHARDKV_RAFT_SERVLET_H

#include "shardkv/http/servlet.h"
#include "shardkv/raft/raft_node.h"

namespace shardkv::kv {
    class KVServer;
}
namespace shardkv::http {

/**
 * @brief 把 raft 状态转成 /raft/status 的 data
 */
Json RaftStatsToJson(const raft::RaftStats& stats);

/**
 * @brief 成员管理和状态查询：/raft/join /raft/leave /raft/status
 */
class RaftServlet : public Servlet {
public:
    using ptr = std::shared_ptr<RaftServlet>;
    RaftServlet(std::shared_ptr<shardkv::kv::KVServer> store);
    /**
     * POST /raft/join 的 request json 格式：{"nodeid": "2", "addr": "127.0.0.1:8021"}
     * POST /raft/leave 的 request json 格式：{"nodeid": "2"}
     * 也可以使用表单参数，只能在 leader 上调用
     */
    int32_t handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) override;
private:
    void handleJoin(HttpRequest::ptr request, HttpResponse::ptr response);
    void handleLeave(HttpRequest::ptr request, HttpResponse::ptr response);
    void handleStatus(HttpRequest::ptr request, HttpResponse::ptr response);
private:
    std::shared_ptr<shardkv::kv::KVServer> m_store;
};

/**
 * @brief 节点间的 raft rpc，body 为 MessagePack
 */
class RaftRpcServlet : public Servlet {
public:
    using ptr = std::shared_ptr<RaftRpcServlet>;
    RaftRpcServlet(raft::RaftNode::ptr raft);
    int32_t handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) override;
private:
    raft::RaftNode::ptr m_raft;
};

}
#endif //SHARDKV_RAFT_SERVLET_H

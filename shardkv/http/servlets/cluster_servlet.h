//
// Created by zavier on 2023/1/14.
//

#ifndef SHARDKV_CLUSTER_SERVLET_H
#define SHARDKV_CLUSTER_SERVLET_H

#include "shardkv/http/servlet.h"

namespace shardkv::kv {
    class KVServer;
}
namespace shardkv::cluster {
    class LeaderBroadcaster;
}
namespace shardkv::http {
/**
 * @brief /config /addshard /newleader
 */
class ClusterServlet : public Servlet {
public:
    using ptr = std::shared_ptr<ClusterServlet>;
    ClusterServlet(std::shared_ptr<shardkv::kv::KVServer> store,
                   std::shared_ptr<shardkv::cluster::LeaderBroadcaster> broadcaster);
    /**
     * GET /config 返回：
     *  {
     *      "success": true,
     *      "data": {
     *          "shardCount": 3,
     *          "shards": {"1": "127.0.0.1:8011", ...}
     *      }
     *  }
     * POST /addshard 和 /newleader 的 request json 格式：
     *  {
     *      "shardID": 2,           // 数字或字符串
     *      "shardAddress": "127.0.0.1:8021",
     *      "term": 3               // 可选
     *  }
     */
    int32_t handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) override;
private:
    void handleConfig(HttpRequest::ptr request, HttpResponse::ptr response);
    void handleShard(HttpRequest::ptr request, HttpResponse::ptr response, const std::string& message);
private:
    std::shared_ptr<shardkv::kv::KVServer> m_store;
    std::shared_ptr<shardkv::cluster::LeaderBroadcaster> m_broadcaster;
};
}
#endif //SHARDKV_CLUSTER_SERVLET_H

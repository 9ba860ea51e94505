//
// Created by zavier on 2022/12/6.
//

#ifndef SHARDKV_KV_SERVLET_H
#define SHARDKV_KV_SERVLET_H

#include "shardkv/http/servlet.h"

namespace shardkv::kv {
    class KVServer;
}
namespace shardkv::http {
/**
 * @brief /put /get /delete
 */
class KVServlet : public Servlet {
public:
    using ptr = std::shared_ptr<KVServlet>;
    KVServlet(std::shared_ptr<shardkv::kv::KVServer> store);
    /**
     * PUT /put 的 request json 格式：
     *  {
     *      "key": "name",
     *      "val": "zavier",            // 也可以用 "value"
     *      "client_id": 1,             // 可选，和 request_id 一起用于去重
     *      "request_id": 1
     *  }
     * 或者使用 query/表单参数 key=name&val=zavier
     *
     * GET /get?key=name 返回：
     *  {
     *      "success": true,
     *      "key": "name",
     *      "value": "zavier"
     *  }
     *
     * DELETE /delete 的 request json 格式：{"key": "name"}
     */
    int32_t handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) override;
private:
    void handlePut(HttpRequest::ptr request, HttpResponse::ptr response);
    void handleGet(HttpRequest::ptr request, HttpResponse::ptr response);
    void handleDelete(HttpRequest::ptr request, HttpResponse::ptr response);
private:
    std::shared_ptr<shardkv::kv::KVServer> m_store;
};
}
#endif //SHARDKV_KV_SERVLET_H

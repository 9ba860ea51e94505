//
// Created by zavier on 2023/1/15.
//

#ifndef SHARDKV_ROUTER_SERVLET_H
#define SHARDKV_ROUTER_SERVLET_H

#include "shardkv/http/servlet.h"

namespace shardkv::router {
    class Router;
    struct RouterResult;
}
namespace shardkv::http {
/**
 * @brief router 对外的 /put /get /delete /status，请求格式和节点相同
 */
class RouterServlet : public Servlet {
public:
    using ptr = std::shared_ptr<RouterServlet>;
    RouterServlet(std::shared_ptr<shardkv::router::Router> router);
    int32_t handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) override;
private:
    /**
     * @brief 透传节点的响应，router 自己的错误转成 json 错误
     */
    void writeResult(HttpResponse::ptr response, const shardkv::router::RouterResult& result);
private:
    std::shared_ptr<shardkv::router::Router> m_router;
};
}
#endif //SHARDKV_ROUTER_SERVLET_H

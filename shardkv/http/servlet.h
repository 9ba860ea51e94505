//
// Created by zavier on 2021/12/17.
//

#ifndef SHARDKV_SERVLET_H
#define SHARDKV_SERVLET_H
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <libgo/libgo.h>
#include "http.h"
#include "http_session.h"

namespace shardkv::http {
/**
 * @brief 处理一类 HTTP 请求
 */
class Servlet {
public:
    using ptr = std::shared_ptr<Servlet>;
    explicit Servlet(std::string name) : m_name(std::move(name)) {}
    virtual ~Servlet() = default;
    /**
     * @return 0 表示由 server 把 response 发回客户端
     */
    virtual int32_t handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) = 0;
    const std::string& getName() const { return m_name;}
private:
    std::string m_name;
};

/**
 * @brief 按路径分发：先精确匹配，再按注册顺序做 fnmatch 通配，都没有时交给默认的 404
 */
class ServletDispatch : public Servlet {
public:
    using ptr = std::shared_ptr<ServletDispatch>;
    ServletDispatch();
    int32_t handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) override;

    void addServlet(const std::string& path, Servlet::ptr servlet);
    void addGlobServlet(const std::string& pattern, Servlet::ptr servlet);
    void setDefault(Servlet::ptr servlet);

    Servlet::ptr getMatchedServlet(const std::string& path);
private:
    co_rwmutex m_mutex;
    std::map<std::string, Servlet::ptr> m_exact;
    std::vector<std::pair<std::string, Servlet::ptr>> m_globs;
    Servlet::ptr m_default;
};

/**
 * @brief 未注册路径返回 404 的 json 错误
 */
class NotFoundServlet : public Servlet {
public:
    explicit NotFoundServlet(std::string server);
    int32_t handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) override;
private:
    std::string m_server;
};

}

#endif //SHARDKV_SERVLET_H

//
// Created by zavier on 2021/12/17.
//

#include <fnmatch.h>
#include "shardkv/http/servlet.h"

namespace shardkv::http {

NotFoundServlet::NotFoundServlet(std::string server)
    : Servlet("NotFoundServlet")
    , m_server(std::move(server)) {
}

int32_t NotFoundServlet::handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) {
    response->setStatus(HttpStatus::NOT_FOUND);
    response->setHeader("Server", m_server);
    response->setJson({{"success", false}, {"error", "Not found"}});
    return 0;
}

ServletDispatch::ServletDispatch()
    : Servlet("ServletDispatch")
    , m_default(std::make_shared<NotFoundServlet>("shardkv/1.0.0")) {
}

int32_t ServletDispatch::handle(HttpRequest::ptr request, HttpResponse::ptr response, HttpSession::ptr session) {
    return getMatchedServlet(request->getPath())->handle(request, response, session);
}

void ServletDispatch::addServlet(const std::string& path, Servlet::ptr servlet) {
    std::unique_lock<co_wmutex> lock(m_mutex.Writer());
    m_exact[path] = std::move(servlet);
}

void ServletDispatch::addGlobServlet(const std::string& pattern, Servlet::ptr servlet) {
    std::unique_lock<co_wmutex> lock(m_mutex.Writer());
    for (auto& item: m_globs) {
        if (item.first == pattern) {
            item.second = std::move(servlet);
            return;
        }
    }
    m_globs.emplace_back(pattern, std::move(servlet));
}

void ServletDispatch::setDefault(Servlet::ptr servlet) {
    std::unique_lock<co_wmutex> lock(m_mutex.Writer());
    m_default = std::move(servlet);
}

Servlet::ptr ServletDispatch::getMatchedServlet(const std::string& path) {
    std::unique_lock<co_rmutex> lock(m_mutex.Reader());
    auto it = m_exact.find(path);
    if (it != m_exact.end()) {
        return it->second;
    }
    for (auto& [pattern, servlet]: m_globs) {
        if (fnmatch(pattern.c_str(), path.c_str(), 0) == 0) {
            return servlet;
        }
    }
    return m_default;
}

}

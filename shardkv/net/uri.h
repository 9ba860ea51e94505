//
// Created by zavier on 2021/12/20.
//

#ifndef SHARDKV_URI_H
#define SHARDKV_URI_H
#include <memory>
#include <ostream>
#include "address.h"

namespace shardkv {

/**
 * @brief 节点地址解析，支持 "host:port"、"http://host:port/path?query" 两种写法
 */
class Uri{
public:
    using ptr = std::shared_ptr<Uri>;
    Uri();

    /**
     * @brief 创建Uri对象
     * @param uri uri字符串
     * @return 解析成功返回Uri对象否则返回nullptr
     */
    static Uri::ptr Create(const std::string& uri);

    Address::ptr createAddress();
    const std::string& getScheme() const { return m_scheme;}
    const std::string& getHost() const { return m_host;}
    const std::string& getPath() const;
    const std::string& getQuery() const { return m_query;}
    uint32_t getPort() const;

    void setPath(const std::string& path) { m_path = path;}
    void setQuery(const std::string& query) { m_query = query;}

    std::ostream& dump(std::ostream& ostream);
    std::string toString();

private:
    bool parse(std::string_view uri);
    bool isDefaultPort() const;
private:
    std::string m_scheme;
    std::string m_host;
    std::string m_path;
    std::string m_query;
    uint32_t m_port;
};

}
#endif //SHARDKV_URI_H

//
// Created by zavier on 2021/10/26.
//

#ifndef SHARDKV_CONFIG_H
#define SHARDKV_CONFIG_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <libgo/libgo.h>
#include <yaml-cpp/yaml.h>
#include "util.h"

namespace shardkv {

/**
 * @brief 配置项基类，名字只允许小写字母、数字、'.' 和 '_'
 */
class ConfigVarBase{
public:
    using ptr = std::shared_ptr<ConfigVarBase>;
    ConfigVarBase(std::string name, std::string description)
        : m_name(std::move(name)), m_description(std::move(description)) {}
    virtual ~ConfigVarBase() = default;

    const std::string& getName() const { return m_name;}
    const std::string& getDescription() const { return m_description;}

    virtual std::string getTypeName() const = 0;
    virtual std::string toString() = 0;
    /**
     * @brief 从 yaml 节点取值，类型不匹配时记录日志并保留原值
     */
    virtual bool fromNode(const YAML::Node& node) = 0;
    bool fromString(const std::string& str);
protected:
    std::string m_name;
    std::string m_description;
};

/**
 * @brief 类型为 T 的配置项，和字符串之间的转换交给 YAML::convert<T>
 * 需要自定义类型时特化 YAML::convert
 */
template<class T>
class ConfigVar : public ConfigVarBase{
public:
    using ptr = std::shared_ptr<ConfigVar>;
    // 配置变更回调 (旧值, 新值)
    using Callback = std::function<void(const T& old_val, const T& new_val)>;

    ConfigVar(const std::string& name, const T& value, const std::string& description)
        : ConfigVarBase(name, description), m_val(value) {}

    std::string getTypeName() const override { return typeid(T).name();}

    std::string toString() override {
        YAML::Emitter out;
        out << YAML::Node(getValue());
        return out.c_str();
    }

    bool fromNode(const YAML::Node& node) override {
        T value;
        try {
            value = node.as<T>();
        } catch (const YAML::Exception& e) {
            SPDLOG_LOGGER_ERROR(GetLogInstance(), "config {} convert to {} fail: {}",
                                m_name, getTypeName(), e.what());
            return false;
        }
        setValue(value);
        return true;
    }

    T getValue() {
        std::unique_lock<co_rmutex> lock(m_mutex.Reader());
        return m_val;
    }

    /**
     * @brief 值有变化时才通知监听者，回调在锁外执行
     */
    void setValue(const T& value) {
        T old;
        std::map<uint64_t, Callback> callbacks;
        {
            std::unique_lock<co_wmutex> lock(m_mutex.Writer());
            if (m_val == value) {
                return;
            }
            old = std::move(m_val);
            m_val = value;
            callbacks = m_callbacks;
        }
        for (auto& [id, cb]: callbacks) {
            cb(old, value);
        }
    }

    uint64_t addListener(Callback cb) {
        std::unique_lock<co_wmutex> lock(m_mutex.Writer());
        uint64_t id = ++m_nextId;
        m_callbacks.emplace(id, std::move(cb));
        return id;
    }
    void delListener(uint64_t id) {
        std::unique_lock<co_wmutex> lock(m_mutex.Writer());
        m_callbacks.erase(id);
    }
    void clearListener() {
        std::unique_lock<co_wmutex> lock(m_mutex.Writer());
        m_callbacks.clear();
    }
private:
    T m_val;
    uint64_t m_nextId = 0;
    std::map<uint64_t, Callback> m_callbacks;
    co_rwmutex m_mutex;
};

/**
 * @brief 全局配置表，配置项在使用它的文件里以静态变量声明，启动后由 yaml 覆盖
 */
class Config{
public:
    using ConfigVarMap = std::map<std::string, ConfigVarBase::ptr>;

    /**
     * @brief 查找配置项，不存在时用默认值创建
     * @return 同名但类型不同时返回 nullptr
     * @exception std::invalid_argument 名字非法
     */
    template<class T>
    static typename ConfigVar<T>::ptr Lookup(const std::string& name, const T& value, const std::string& description) {
        std::unique_lock<co_wmutex> lock(GetMutex().Writer());
        auto& datas = GetDatas();
        auto it = datas.find(name);
        if (it != datas.end()) {
            auto var = std::dynamic_pointer_cast<ConfigVar<T>>(it->second);
            if (!var) {
                SPDLOG_LOGGER_ERROR(GetLogInstance(), "config {} exists with type {}, lookup as {}",
                                    name, it->second->getTypeName(), typeid(T).name());
            }
            return var;
        }
        if (!IsValidName(name)) {
            SPDLOG_LOGGER_ERROR(GetLogInstance(), "config invalid name: {}", name);
            throw std::invalid_argument(name);
        }
        auto var = std::make_shared<ConfigVar<T>>(name, value, description);
        datas.emplace(name, var);
        return var;
    }

    template<class T>
    static typename ConfigVar<T>::ptr Lookup(const std::string& name) {
        return std::dynamic_pointer_cast<ConfigVar<T>>(LookupBase(name));
    }

    static ConfigVarBase::ptr LookupBase(const std::string& name);
    static void LoadFromFile(const std::string& file);
    /**
     * @brief 按 "a.b.c" 的路径把 yaml 的值写入已声明的配置项，未声明的忽略
     */
    static void LoadFromYaml(const YAML::Node& root);

    static bool IsValidName(const std::string& name);
private:
    static ConfigVarMap& GetDatas() {
        static ConfigVarMap s_datas;
        return s_datas;
    }

    static co_rwmutex& GetMutex() {
        static co_rwmutex s_mutex;
        return s_mutex;
    }
};

}

#endif //SHARDKV_CONFIG_H

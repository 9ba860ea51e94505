//
// Created by zavier on 2021/10/20.
//

#ifndef SHARDKV_UTIL_H
#define SHARDKV_UTIL_H

#include <unistd.h>
#include <syscall.h>
#include <ctime>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#if SHARDKV_ENABLE_DEBUGGER
# define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

// 前向声明
namespace co {
class Scheduler;
}

namespace shardkv {

std::shared_ptr<spdlog::logger> GetLogInstance();

//时间
uint64_t GetCurrentMS();
uint64_t GetCurrentUS();

/**
 * @brief 十六进制字符的值，非法字符返回 -1
 */
int HexValue(char c);

/**
 * @brief URL 编解码，'+' 解码为空格
 */
std::string UrlEncode(std::string_view str);
std::string UrlDecode(std::string_view str);

/**
 * @brief 去掉地址前面的 "http://"，并去掉结尾的 '/'
 */
std::string TrimScheme(const std::string& address);

class CycleTimerTocken {
public:
    CycleTimerTocken(std::shared_ptr<bool> cancel = nullptr) : m_cancel(std::move(cancel)) {}

    operator bool () {
        return m_cancel || !isCancel();
    }

    void stop() {
        if (!m_cancel) return;
        *m_cancel = true;
    }

    bool isCancel() {
        if (!m_cancel) {
            return true;
        }
        return *m_cancel;
    }

private:
    std::shared_ptr<bool> m_cancel;
};

/**
 * 设置循环定时器
 * @param interval_ms 循环间隔（ms）
 * @param cb 回调函数
 * @param worker 定时器所在的调度器，如果默认则会先检查函数是否在协程内，在的话则设置为所在协程的调度器，否则设置为 co_sched
 * @param times 循环次数，-1为无限循环
 * @return CycleTimerTocken 可用来停止循环定时器
 */
CycleTimerTocken CycleTimer(unsigned interval_ms, std::function<void()> cb, co::Scheduler* worker = nullptr, int times = -1);

}

#endif //SHARDKV_UTIL_H

//
// Created by zavier on 2021/10/20.
//
#include <sys/time.h>
#include <libgo/libgo.h>
#include "util.h"

namespace shardkv {

static std::shared_ptr<spdlog::logger> GetLogInstanceHelper() {
    auto instance = spdlog::stdout_color_mt("shardkv");
#if SHARDKV_ENABLE_DEBUGGER
    instance->set_level(spdlog::level::debug);
    SPDLOG_LOGGER_INFO(instance, "ENABLE_DEBUGGER");
#endif
    return instance;
}

std::shared_ptr<spdlog::logger> GetLogInstance() {
    static std::shared_ptr<spdlog::logger> instance = GetLogInstanceHelper();
    return instance;
}

uint64_t GetCurrentMS(){
    struct timeval tm;
    gettimeofday(&tm,0);
    return tm.tv_sec * 1000ul + tm.tv_usec / 1000;
}

uint64_t GetCurrentUS(){
    struct timeval tm;
    gettimeofday(&tm,0);
    return tm.tv_sec * 1000ul * 1000ul + tm.tv_usec;
}

static const char s_hex[] = "0123456789ABCDEF";

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string UrlEncode(std::string_view str) {
    std::string res;
    res.reserve(str.size());
    for (unsigned char c : str) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            res.push_back(c);
        } else {
            res.push_back('%');
            res.push_back(s_hex[c >> 4]);
            res.push_back(s_hex[c & 0xF]);
        }
    }
    return res;
}

std::string UrlDecode(std::string_view str) {
    std::string res;
    res.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '+') {
            res.push_back(' ');
        } else if (str[i] == '%' && i + 2 < str.size()
                    && HexValue(str[i + 1]) >= 0 && HexValue(str[i + 2]) >= 0) {
            res.push_back((char)(HexValue(str[i + 1]) * 16 + HexValue(str[i + 2])));
            i += 2;
        } else {
            res.push_back(str[i]);
        }
    }
    return res;
}

std::string TrimScheme(const std::string& address) {
    std::string_view view = address;
    constexpr std::string_view scheme = "http://";
    if (view.substr(0, scheme.size()) == scheme) {
        view.remove_prefix(scheme.size());
    }
    while (!view.empty() && view.back() == '/') {
        view.remove_suffix(1);
    }
    return std::string(view);
}

CycleTimerTocken CycleTimer(unsigned interval_ms, std::function<void()> cb, co::Scheduler* worker, int times) {
    if (!worker) {
        auto sc = co::Processer::GetCurrentScheduler();
        if (sc) {
            worker = sc;
        } else {
            worker = &co_sched;
        }
    }

    CycleTimerTocken tocken(std::make_shared<bool>(false));
    go co_scheduler(worker) [tocken, interval_ms, cb, times]() mutable {
        while (times) {
            co_sleep(interval_ms);
            if (tocken.isCancel()) return;
            cb();
            if (times > 0) --times;
        }
    };
    return tocken;
}

}

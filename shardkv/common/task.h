//
// Created by zavier on 2021/12/20.
//

#ifndef SHARDKV_TASK_H
#define SHARDKV_TASK_H
#include <coroutine>
#include <exception>
#include <utility>

namespace shardkv {
/**
 * @brief 无栈协程的句柄，协程通过 co_yield 交出当前结果并挂起，co_return 给出最终结果
 * 由调用方 resume 驱动，不属于任何调度器
 */
template<class T>
class Task {
public:
    struct promise_type {
        T value{};

        Task get_return_object() {
            return Task(std::coroutine_handle<promise_type>::from_promise(*this));
        }
        // 创建后先挂起，第一次 resume 才开始执行
        std::suspend_always initial_suspend() { return {};}
        std::suspend_always final_suspend() noexcept { return {};}
        std::suspend_always yield_value(T v) {
            value = std::move(v);
            return {};
        }
        void return_value(T v) { value = std::move(v);}
        void unhandled_exception() { std::terminate();}
    };

    Task() = default;
    explicit Task(std::coroutine_handle<promise_type> h) : m_handle(h) {}
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&& rhs) noexcept : m_handle(std::exchange(rhs.m_handle, nullptr)) {}
    Task& operator=(Task&& rhs) noexcept {
        if (this != &rhs) {
            reset();
            m_handle = std::exchange(rhs.m_handle, nullptr);
        }
        return *this;
    }
    ~Task() { reset();}

    bool valid() const { return (bool)m_handle;}
    bool done() const { return !m_handle || m_handle.done();}

    /**
     * @brief 恢复协程到下一次挂起点，已结束时什么都不做
     */
    void resume() {
        if (!done()) {
            m_handle.resume();
        }
    }
    const T& get() const { return m_handle.promise().value;}

    void reset() {
        if (m_handle) {
            m_handle.destroy();
            m_handle = nullptr;
        }
    }
private:
    std::coroutine_handle<promise_type> m_handle{};
};

}
#endif //SHARDKV_TASK_H

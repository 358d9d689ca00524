#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>

// 单槽合并通知：最多挂起一个信号，重复 raise 会被合并，raise 从不等待消费者。
class ReloadSignal {
public:
    ReloadSignal() = default;

    ReloadSignal(const ReloadSignal&)            = delete;
    ReloadSignal& operator=(const ReloadSignal&) = delete;

    // 已有挂起信号时为空操作。返回本次是否新置位。
    bool raise();

    // 挂起直到有信号或 stop 被请求。取走信号返回 true，被取消返回 false。
    // 两者同时就绪时优先取消。
    bool wait(std::stop_token stop);

    bool pending() const { return pending_.load(std::memory_order_acquire); }

private:
    std::atomic<bool>           pending_{false};
    std::mutex                  m_;
    std::condition_variable_any cv_;
};

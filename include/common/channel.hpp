#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

// 无缓冲的交接通道：send 只有在接收方真正取走数据后才返回 true。
// 发送期间被取消或通道关闭时，数据被撤回，不会残留给接收方。
template <typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&)            = delete;
    Channel& operator=(const Channel&) = delete;

    bool send(T value, std::stop_token stop = {})
    {
        std::unique_lock lk(m_);
        // 同一时刻只允许一个发送方占用槽位
        cv_.wait(lk, stop, [this] { return closed_ || !slot_.has_value(); });
        if (closed_ || stop.stop_requested())
            return false;

        slot_.emplace(std::move(value));
        const auto ticket = ++posted_;
        cv_.notify_all();

        cv_.wait(lk, stop, [this, ticket] { return taken_ >= ticket || closed_; });
        if (taken_ >= ticket)
            return true;

        // 撤回：此时槽位里一定还是本次发送的值
        slot_.reset();
        --posted_;
        cv_.notify_all();
        return false;
    }

    // 通道关闭或取消时返回 nullopt
    std::optional<T> receive(std::stop_token stop = {})
    {
        std::unique_lock lk(m_);
        cv_.wait(lk, stop, [this] { return closed_ || slot_.has_value(); });
        if (!slot_.has_value())
            return std::nullopt;

        std::optional<T> out(std::move(slot_));
        slot_.reset();
        ++taken_;
        cv_.notify_all();
        return out;
    }

    void close()
    {
        {
            std::lock_guard lg(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard lg(m_);
        return closed_;
    }

    // 是否有发送方正在等待接收
    bool waiting() const
    {
        std::lock_guard lg(m_);
        return slot_.has_value();
    }

private:
    mutable std::mutex          m_;
    std::condition_variable_any cv_;
    std::optional<T>            slot_;
    std::uint64_t               posted_ = 0;
    std::uint64_t               taken_  = 0;
    bool                        closed_ = false;
};

#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "writer/ireceiver.h"

// 双缓冲 receiver：append 只写前台缓冲，后台线程按容量或周期换出并 flush。
// 派生类必须在自己的析构函数里先调用 shutdown()，保证 flush_impl 不在析构后被调用。
class base_writer : public IReceiver
{
public:
    base_writer(std::string name,
                std::size_t buf_capacity,
                std::chrono::milliseconds flush_interval = std::chrono::seconds(5));
    ~base_writer() override;

    base_writer(const base_writer&)            = delete;
    base_writer& operator=(const base_writer&) = delete;

    const std::string& name() const override { return name_; }
    void append(const ScrapeBatch& batch) override;

    // 同步 flush 前台缓冲
    void flush();
    void shutdown();

protected:
    virtual void flush_impl(const std::vector<ScrapeBatch>& batch) = 0;

    std::string name_;

private:
    struct Buffer;

    void flush_worker();
    // 调用方持有 flush_mtx_
    void flush_buffer(Buffer& buf);

    const std::size_t               buf_capacity_;
    const std::chrono::milliseconds flush_interval_;
    std::unique_ptr<Buffer>         front_;
    std::unique_ptr<Buffer>         back_;

    std::mutex              mtx_;
    std::mutex              flush_mtx_;   // 串行化换缓冲与 flush_impl，先于 mtx_ 加锁
    std::condition_variable cv_;
    std::thread             flush_thread_;
    bool stop_       = false;
    bool need_flush_ = false;
};

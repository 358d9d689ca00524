#include "writer/base_writer.hpp"

#include <exception>

// 内部类型完整定义
struct base_writer::Buffer
{
    explicit Buffer(std::size_t reserve) { vec.reserve(reserve); }
    void push_back(const ScrapeBatch& b) { vec.push_back(b); }
    void clear() { vec.clear(); }
    std::size_t size() const { return vec.size(); }
    bool empty() const { return vec.empty(); }
    std::vector<ScrapeBatch> vec;
};

// -------------------- 构造 / 析构 --------------------
base_writer::base_writer(std::string name,
                         std::size_t buf_capacity,
                         std::chrono::milliseconds flush_interval)
    : name_(std::move(name)),
      buf_capacity_(buf_capacity == 0 ? 1 : buf_capacity),
      flush_interval_(flush_interval),
      front_(std::make_unique<Buffer>(buf_capacity_)),
      back_(std::make_unique<Buffer>(buf_capacity_))
{
    flush_thread_ = std::thread(&base_writer::flush_worker, this);
}

base_writer::~base_writer()
{
    {
        std::lock_guard lg(mtx_);
        stop_ = true;
    }
    cv_.notify_one();
    if (flush_thread_.joinable())
        flush_thread_.join();
}

// -------------------- 公有接口 --------------------
void base_writer::append(const ScrapeBatch& batch)
{
    bool full = false;
    {
        std::lock_guard lg(mtx_);
        if (stop_) {
            spdlog::warn("base_writer: writer '{}' is shut down, dropping batch from {}", name_, batch.Job);
            return;
        }
        front_->push_back(batch);
        full = front_->size() >= buf_capacity_;
        if (full) need_flush_ = true;
    }
    if (full) cv_.notify_one();
}

void base_writer::flush()
{
    std::unique_ptr<Buffer> pending = std::make_unique<Buffer>(buf_capacity_);
    // 先占住 flush_mtx_ 再换缓冲，换出的顺序即落盘顺序
    std::lock_guard flk(flush_mtx_);
    {
        std::lock_guard lg(mtx_);
        front_.swap(pending);
    }
    flush_buffer(*pending);
}

void base_writer::shutdown()
{
    {
        std::lock_guard lg(mtx_);
        if (stop_) return;
        stop_ = true;
        need_flush_ = false;
    }
    cv_.notify_one();
    if (flush_thread_.joinable()) {
        spdlog::debug("base_writer: waiting for flush worker of '{}' to finish...", name_);
        flush_thread_.join();
    }
    flush();
    spdlog::info("base_writer: shutdown complete for writer '{}'", name_);
}

// -------------------- 私有实现 --------------------
void base_writer::flush_worker()
{
    for (;;)
    {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, flush_interval_, [this] { return stop_ || need_flush_; });
            if (stop_)
                break;
        }

        std::lock_guard flk(flush_mtx_);
        {
            std::lock_guard lg(mtx_);
            if (stop_)
                break;   // 剩余数据由 shutdown 里的 flush 写出
            front_.swap(back_);
            need_flush_ = false;
        }
        flush_buffer(*back_);
        back_->clear();
    }
}

void base_writer::flush_buffer(Buffer& buf)
{
    if (buf.empty()) return;
    try {
        flush_impl(buf.vec);
    } catch (const std::exception& e) {
        spdlog::error("base_writer: writer '{}' failed to flush {} batches: {}", name_, buf.size(), e.what());
    }
}

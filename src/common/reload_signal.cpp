#include "common/reload_signal.hpp"

bool ReloadSignal::raise()
{
    if (pending_.exchange(true, std::memory_order_acq_rel))
        return false;   // 合并

    // 置位在锁外完成，这里只为避免与 wait 的谓词检查之间丢失唤醒
    { std::lock_guard lg(m_); }
    cv_.notify_one();
    return true;
}

bool ReloadSignal::wait(std::stop_token stop)
{
    std::unique_lock lk(m_);
    while (true) {
        cv_.wait(lk, stop, [this] { return pending_.load(std::memory_order_acquire); });
        if (stop.stop_requested())
            return false;
        if (pending_.exchange(false, std::memory_order_acq_rel))
            return true;
    }
}

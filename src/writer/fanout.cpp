#include "writer/fanout.hpp"

#include <exception>
#include <spdlog/spdlog.h>

Fanout::Fanout(std::vector<std::shared_ptr<IReceiver>> receivers)
    : receivers_(std::move(receivers))
{
}

void Fanout::append(const ScrapeBatch& batch)
{
    // 拷贝出当前集合后在锁外调用，setReceivers 不会被慢 receiver 卡住
    auto current = receivers();
    for (const auto& r : current) {
        if (!r) continue;
        try {
            r->append(batch);
        } catch (const std::exception& e) {
            spdlog::error("Fanout: receiver '{}' rejected batch from job {}: {}", r->name(), batch.Job, e.what());
        }
    }
}

void Fanout::setReceivers(std::vector<std::shared_ptr<IReceiver>> receivers)
{
    std::lock_guard lg(m_);
    receivers_ = std::move(receivers);
}

std::vector<std::shared_ptr<IReceiver>> Fanout::receivers() const
{
    std::lock_guard lg(m_);
    return receivers_;
}

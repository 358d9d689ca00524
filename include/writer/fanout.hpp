#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "writer/ireceiver.h"

// 把抓取结果分发给当前的 receiver 集合。集合可在运行中整体替换。
class Fanout : public IReceiver {
public:
    explicit Fanout(std::vector<std::shared_ptr<IReceiver>> receivers = {});

    const std::string& name() const override { return name_; }
    void append(const ScrapeBatch& batch) override;

    void setReceivers(std::vector<std::shared_ptr<IReceiver>> receivers);
    std::vector<std::shared_ptr<IReceiver>> receivers() const;

private:
    const std::string                       name_ = "fanout";
    mutable std::mutex                      m_;
    std::vector<std::shared_ptr<IReceiver>> receivers_;
};

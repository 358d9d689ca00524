#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "writer/ireceiver.h"

#define RECEIVER_TYPE_FILE "FileReceiver"

// 按配置创建具名 receiver，scrape_config.forward_to 通过名字引用它们
class writer_manager {
public:
    explicit writer_manager(const Config& config);
    ~writer_manager();

    writer_manager(const writer_manager&)            = delete;
    writer_manager& operator=(const writer_manager&) = delete;

    // 找不到返回 nullptr
    std::shared_ptr<IReceiver> find(const std::string& name) const;
    std::vector<std::string>   list() const;

    void shutdown();

private:
    void addWriter(std::shared_ptr<IReceiver> writer);

    mutable std::mutex                                m_;
    std::map<std::string, std::shared_ptr<IReceiver>> writers_;
};

#pragma once
#include <functional>
#include <memory>
#include <string>

#include "common/config.hpp"
#include "scrape/supervisor_config.hpp"
#include "writer/ireceiver.h"

#define SCRAPE_CONFIG_SECTION "scrape_config"

// 按名字解析 forward_to 中引用的 receiver，找不到返回 nullptr
using ReceiverLookup = std::function<std::shared_ptr<IReceiver>(const std::string&)>;

// 读取 scrape_config 段。未设置的字段取默认值；
// 未知字段、类型错误、找不到的 receiver 均抛 ConfigError(CONFIG_STAGE_DECODE)。
SupervisorConfig decodeSupervisorConfig(const Config& config, const ReceiverLookup& lookup);

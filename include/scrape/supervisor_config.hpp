#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "scrape/http_client_config.hpp"
#include "scrape/scrape_type.h"

class IReceiver;

// supervisor 的全部输入参数。每次 update 整体替换，不做字段级合并。
struct SupervisorConfig {
    std::vector<DiscoveryTarget>            Targets;
    std::vector<std::shared_ptr<IReceiver>> ForwardTo;

    // 覆盖 job 标签，空则使用实例 ID
    std::string JobName;
    bool        HonorLabels     = false;
    bool        HonorTimestamps = true;
    std::map<std::string, std::vector<std::string>> Params;

    std::chrono::milliseconds ScrapeInterval{std::chrono::minutes(1)};
    std::chrono::milliseconds ScrapeTimeout{std::chrono::seconds(10)};
    std::string MetricsPath = "/metrics";
    std::string Scheme      = "http";

    // 以下限制 0 表示不限制
    std::uint64_t BodySizeLimit         = 0;
    unsigned      SampleLimit           = 0;
    unsigned      TargetLimit           = 0;
    unsigned      LabelLimit            = 0;
    unsigned      LabelNameLengthLimit  = 0;
    unsigned      LabelValueLengthLimit = 0;

    HTTPClientConfig HTTPClient;

    bool ExtraMetrics = false;
};

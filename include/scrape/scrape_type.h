#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "common/channel.hpp"

#define LABEL_ADDRESS       "__address__"
#define LABEL_SCHEME        "__scheme__"
#define LABEL_METRICS_PATH  "__metrics_path__"
#define LABEL_PARAM_PREFIX  "__param_"
#define LABEL_SCRAPE_INTERVAL "__scrape_interval__"
#define LABEL_SCRAPE_TIMEOUT  "__scrape_timeout__"
#define LABEL_JOB           "job"
#define LABEL_INSTANCE      "instance"

// 标签名 -> 标签值，同一目标内标签名唯一
using LabelSet        = std::map<std::string, std::string>;
using DiscoveryTarget = LabelSet;

struct TargetGroup {
    std::string           Source;    // 在本 supervisor 内唯一且稳定
    std::vector<LabelSet> Targets;
};

// key 为 provider 名，引擎按 key 整体替换目标集合
using TargetSets       = std::map<std::string, std::vector<TargetGroup>>;
using TargetSetChannel = Channel<TargetSets>;

enum class TargetHealth {
    Unknown,
    Up,
    Down
};

inline const char* healthName(TargetHealth h)
{
    switch (h) {
        case TargetHealth::Up:   return "up";
        case TargetHealth::Down: return "down";
        default:                 return "unknown";
    }
}

// 一次抓取的产出，交给 fan-out 分发给各 receiver
struct ScrapeBatch {
    std::string                           Job;
    bool                                  HonorLabels = false;
    LabelSet                              Labels;
    std::vector<std::string>              Lines;
    std::chrono::system_clock::time_point Timestamp{std::chrono::system_clock::now()};
};

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "scrape/scrape_type.h"

// 单个目标最近一次抓取的状态快照
struct TargetStatus {
    std::string                           JobName;
    std::string                           URL;
    TargetHealth                          Health = TargetHealth::Unknown;
    LabelSet                              Labels;
    std::string                           LastError;
    std::chrono::system_clock::time_point LastScrape{};
    std::chrono::nanoseconds              LastScrapeDuration{0};
};

struct ScraperStatus {
    std::vector<TargetStatus> Targets;
};

void to_json(nlohmann::json& j, const TargetStatus& s);
void to_json(nlohmann::json& j, const ScraperStatus& s);

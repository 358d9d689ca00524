#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "scrape/http_client_config.hpp"

// 引擎侧的抓取任务声明，等价于 prometheus 的一个 scrape_config 块
struct ScrapeJobConfig {
    std::string JobName;
    bool        HonorLabels     = false;
    bool        HonorTimestamps = true;
    std::map<std::string, std::vector<std::string>> Params;

    std::chrono::milliseconds ScrapeInterval{std::chrono::minutes(1)};
    std::chrono::milliseconds ScrapeTimeout{std::chrono::seconds(10)};
    std::string MetricsPath = "/metrics";
    std::string Scheme      = "http";

    std::uint64_t BodySizeLimit         = 0;
    unsigned      SampleLimit           = 0;
    unsigned      TargetLimit           = 0;
    unsigned      LabelLimit            = 0;
    unsigned      LabelNameLengthLimit  = 0;
    unsigned      LabelValueLengthLimit = 0;

    HTTPClientConfig HTTPClient;

    // 抛出 std::invalid_argument
    void validate() const;
};

bool operator==(const ScrapeJobConfig& a, const ScrapeJobConfig& b);
inline bool operator!=(const ScrapeJobConfig& a, const ScrapeJobConfig& b) { return !(a == b); }

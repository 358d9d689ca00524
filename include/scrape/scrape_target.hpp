#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "scrape/scrape_type.h"

// 引擎内单个抓取目标的实时记录。
// 身份字段构造后不变；健康状态由抓取线程写入，可被任意线程并发读取。
class ScrapeTarget {
public:
    ScrapeTarget(std::string job, std::string url, LabelSet labels, LabelSet discoveredLabels);

    ScrapeTarget(const ScrapeTarget&)            = delete;
    ScrapeTarget& operator=(const ScrapeTarget&) = delete;

    const std::string& job() const { return job_; }
    const std::string& url() const { return url_; }
    const LabelSet&    labels() const { return labels_; }
    const LabelSet&    discoveredLabels() const { return discovered_; }

    // 由 URL 与标签决定，用于去重与打散首次抓取时间
    std::uint64_t hash() const { return hash_; }

    TargetHealth                          health() const;
    std::string                           lastError() const;
    std::chrono::system_clock::time_point lastScrape() const;
    std::chrono::nanoseconds              lastScrapeDuration() const;

    // 记录最近一次抓取结果，error 为空表示成功
    void report(std::chrono::system_clock::time_point start,
                std::chrono::nanoseconds duration,
                const std::string& error);

private:
    const std::string   job_;
    const std::string   url_;
    const LabelSet      labels_;
    const LabelSet      discovered_;
    const std::uint64_t hash_;

    mutable std::mutex                    mtx_;
    TargetHealth                          health_ = TargetHealth::Unknown;
    std::string                           lastError_;
    std::chrono::system_clock::time_point lastScrape_{};
    std::chrono::nanoseconds              lastDuration_{0};
};

// FNV-1a，跨进程稳定
std::uint64_t labelSetHash(const std::string& url, const LabelSet& labels);

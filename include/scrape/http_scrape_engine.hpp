#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/timer_scheduler.hpp"
#include "scrape/iscrape_engine.h"
#include "writer/fanout.hpp"

// 基于 libcurl 的抓取引擎：每个目标一个重复定时器，结果经 Fanout 分发。
// 不解析指标格式，只按行计数样本。
class HttpScrapeEngine : public IScrapeEngine {
public:
    HttpScrapeEngine(EngineOptions opts, std::shared_ptr<Fanout> fanout, size_t numWorkers = 4);
    ~HttpScrapeEngine() override;

    HttpScrapeEngine(const HttpScrapeEngine&)            = delete;
    HttpScrapeEngine& operator=(const HttpScrapeEngine&) = delete;

    void applyConfig(const ScrapeJobConfig& config) override;
    void run(TargetSetChannel& targetSets) override;
    TargetsByJob targetsActive() const override;
    void stop() override;

    struct PopulatedTarget {
        LabelSet    Labels;       // 对外标签，不含 "__" 前缀
        LabelSet    Discovered;   // 补全默认值后的完整标签
        std::string URL;
    };

    // 补全默认标签并生成抓取 URL；目标应被丢弃时返回 nullopt 并写入 reason
    static std::optional<PopulatedTarget> populateTarget(const LabelSet& raw,
                                                         const ScrapeJobConfig& config,
                                                         std::string& reason);

    // 目标标签超出 label_* 限制时返回错误描述，否则返回空串
    static std::string checkLabelLimits(const LabelSet& labels, const ScrapeJobConfig& config);

    // 去掉样本行末尾的时间戳（honor_timestamps 关闭时使用）
    static std::string stripTimestamp(const std::string& line);

private:
    struct ActiveTarget {
        std::shared_ptr<ScrapeTarget> target;
        size_t                        timerId;
    };

    void sync(TargetSets sets);
    void rebuildLocked();
    void scheduleLocked(ActiveTarget& entry);
    void scrape(const std::shared_ptr<ScrapeTarget>& target);
    std::string fetch(const ScrapeTarget& target,
                      const ScrapeJobConfig& config,
                      std::vector<std::string>& lines,
                      std::uint64_t& bodyBytes);

    EngineOptions           opts_;
    std::shared_ptr<Fanout> fanout_;
    std::stop_source        stop_;
    std::atomic<bool>       stopped_{false};

    mutable std::shared_mutex              mtx_;
    std::optional<ScrapeJobConfig>         config_;
    TargetSets                             targetSets_;     // 各 provider 最近一次的原始目标
    std::map<std::uint64_t, ActiveTarget>  active_;         // key = ScrapeTarget::hash()
    std::chrono::milliseconds              scheduledInterval_{0};
    size_t                                 targetCount_ = 0;
    bool                                   targetLimitExceeded_ = false;

    // 必须最后声明：最先析构
    TimerScheduler scheduler_;
};

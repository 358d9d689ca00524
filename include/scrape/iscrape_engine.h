// iscrape_engine.h
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "scrape/scrape_config.hpp"
#include "scrape/scrape_target.hpp"
#include "scrape/scrape_type.h"

#ifndef SCRAPELENS_VERSION
#define SCRAPELENS_VERSION "dev"
#endif

class Fanout;

struct EngineOptions {
    bool        ExtraMetrics = false;
    std::string UserAgent    = "ScrapeLens/" SCRAPELENS_VERSION;
};

using TargetsByJob = std::map<std::string, std::vector<std::shared_ptr<const ScrapeTarget>>>;

// 抓取引擎。实例创建一次后不会被替换，自身负责所有方法之间的同步。
class IScrapeEngine {
public:
    virtual ~IScrapeEngine() = default;

    // 校验并安装任务配置，被拒绝时抛 std::runtime_error，旧配置保持不变
    virtual void applyConfig(const ScrapeJobConfig& config) = 0;

    // 持续消费目标集合，直到 stop() 或通道关闭；引擎故障时抛异常
    virtual void run(TargetSetChannel& targetSets) = 0;

    // 任意时刻可并发读取；允许出现空指针条目
    virtual TargetsByJob targetsActive() const = 0;

    // 幂等；停止所有后台抓取并让 run 返回
    virtual void stop() = 0;
};

using EngineFactory =
    std::function<std::unique_ptr<IScrapeEngine>(const EngineOptions&, std::shared_ptr<Fanout>)>;

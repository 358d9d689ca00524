#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>

#include <spdlog/spdlog.h>

#include "common/reload_signal.hpp"
#include "scrape/iscrape_engine.h"
#include "scrape/scrape_status.hpp"
#include "scrape/supervisor_config.hpp"
#include "writer/fanout.hpp"

// 持有一个抓取引擎，负责在运行期安全地替换它的配置与目标集合。
//
// 构造时创建引擎并同步应用一次参数；run() 在调用方线程上执行主循环，
// 直到 stop 被请求；update()/status() 可在任意线程并发调用。
class ScrapeSupervisor {
public:
    enum class State {
        Initializing,
        Running,
        Stopped
    };

    // 参数非法时抛 ConfigError，此时不会产生可观察的实例
    ScrapeSupervisor(std::string id, SupervisorConfig args, const EngineFactory& factory);
    ~ScrapeSupervisor();

    ScrapeSupervisor(const ScrapeSupervisor&)            = delete;
    ScrapeSupervisor& operator=(const ScrapeSupervisor&) = delete;

    // 阻塞直到 stop 被请求；返回前一定已停止引擎。只能调用一次。
    void run(std::stop_token stop);

    // 整体替换参数。失败抛 ConfigError，之前的参数与引擎状态保持不变。
    // 从不等待主循环，只标记需要重新下发目标。
    void update(SupervisorConfig args);

    // 每次调用都从引擎实时读取，不做缓存
    ScraperStatus status() const;

    // 当前生效参数的拷贝
    SupervisorConfig config() const;

    // 已被引擎接收的目标下发次数
    std::uint64_t handoffs() const { return handoffs_.load(); }

    State state() const { return state_.load(); }
    const std::string& id() const { return id_; }

private:
    void stopEngine();

    const std::string              id_;
    std::shared_ptr<Fanout>        fanout_;
    std::unique_ptr<IScrapeEngine> engine_;
    ReloadSignal                   reload_;

    mutable std::shared_mutex mtx_;
    SupervisorConfig          args_;

    std::atomic<State> state_{State::Initializing};
    std::atomic<bool>  started_{false};
    std::atomic<std::uint64_t> handoffs_{0};
    std::once_flag     stopOnce_;
};

const char* stateName(ScrapeSupervisor::State s);

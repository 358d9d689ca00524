#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <thread>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cxxopts.hpp>

#include "common/config.hpp"
#include "common/config_error.hpp"
#include "common/timer_scheduler.hpp"
#include "common/units.hpp"
#include "scrape/config_decoder.hpp"
#include "scrape/http_scrape_engine.hpp"
#include "scrape/scrape_supervisor.hpp"
#include "writer/writer_manager.hpp"

#define DEFAULT_INSTANCE_ID "prometheus.scrape.default"

void init(const Config& config) {
    // 初始化日志系统
    const static auto log_level_map = std::map<std::string, spdlog::level::level_enum>{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    auto log_level = config.getString("lens_config", "log_level", "info");
    auto it = log_level_map.find(log_level);
    if (it == log_level_map.end()) {
        spdlog::warn("Main: unknown log_level '{}', falling back to info", log_level);
        log_level = "info"; // 默认 info 级别
    }
    spdlog::set_level(log_level_map.at(log_level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

void log_status(const ScrapeSupervisor& supervisor) {
    nlohmann::json j = supervisor.status();
    spdlog::info("Main: status of {} ({}): {}", supervisor.id(), stateName(supervisor.state()), j.dump());
}

bool reload(ScrapeSupervisor& supervisor, const std::string& path, const ReceiverLookup& lookup) {
    try {
        Config fresh(path);
        supervisor.update(decodeSupervisorConfig(fresh, lookup));
        spdlog::info("Main: configuration reloaded from {}", path);
        return true;
    } catch (const ConfigError& e) {
        spdlog::error("Main: reload rejected at stage '{}': {}", e.stage(), e.cause());
    } catch (const std::exception& e) {
        spdlog::error("Main: reload failed: {}", e.what());
    }
    spdlog::warn("Main: keeping previous configuration");
    return false;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("ScrapeLens", "A supervised Prometheus-style scraper");
    options.add_options()
        ("h,help", "Show help")
        ("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value("config.yaml"))
        ("i,instance", "Instance id, overrides lens_config.instance_id", cxxopts::value<std::string>())
        ("w,workers", "Scrape worker threads", cxxopts::value<size_t>()->default_value("4"))
        ("d,dump-status", "Print one status snapshot as JSON and exit");

    auto parsed = [&]() -> std::optional<cxxopts::ParseResult> {
        try {
            return options.parse(argc, argv);
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n" << options.help() << std::endl;
            return std::nullopt;
        }
    }();
    if (!parsed) return 2;
    auto& result = *parsed;
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // 在创建任何线程之前屏蔽信号，统一由主线程 sigwait 处理
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    sigaddset(&sigs, SIGHUP);
    sigaddset(&sigs, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    const auto config_path = result["config"].as<std::string>();
    std::unique_ptr<Config> config;
    try {
        config = std::make_unique<Config>(config_path);
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        return 1;
    }
    init(*config);

    auto id = result.count("instance")
                  ? result["instance"].as<std::string>()
                  : config->getString("lens_config", "instance_id", DEFAULT_INSTANCE_ID);
    auto workers = result["workers"].as<size_t>();

    std::unique_ptr<writer_manager> writers;
    std::unique_ptr<ScrapeSupervisor> supervisor;
    ReceiverLookup lookup;
    units::Duration status_interval{0};
    try {
        status_interval = units::parseDuration(config->getString("lens_config", "status_interval", "0"));
        writers = std::make_unique<writer_manager>(*config);
        lookup = [w = writers.get()](const std::string& name) { return w->find(name); };

        EngineFactory factory = [workers](const EngineOptions& opts, std::shared_ptr<Fanout> fanout) {
            return std::make_unique<HttpScrapeEngine>(opts, std::move(fanout), workers);
        };
        supervisor = std::make_unique<ScrapeSupervisor>(id, decodeSupervisorConfig(*config, lookup), factory);
    } catch (const ConfigError& e) {
        spdlog::critical("Main: configuration rejected at stage '{}': {}", e.stage(), e.cause());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Main: startup failed: {}", e.what());
        return 1;
    }

    std::jthread runner([&supervisor](std::stop_token st) { supervisor->run(st); });

    if (result.count("dump-status")) {
        // 等第一次下发被引擎接收；有目标时再等它们出现在引擎里
        const bool expectTargets = !supervisor->config().Targets.empty();
        auto ready = [&] {
            return supervisor->handoffs() > 0 &&
                   (!expectTargets || !supervisor->status().Targets.empty());
        };
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!ready() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        nlohmann::json j = supervisor->status();
        std::cout << j.dump(2) << std::endl;
        runner.request_stop();
        runner.join();
        writers->shutdown();
        return 0;
    }

    TimerScheduler statusTimer;
    if (status_interval > units::Duration::zero()) {
        statusTimer.registerRepeatingTimer(status_interval, [&supervisor] { log_status(*supervisor); });
        spdlog::info("Main: logging status every {}", units::formatDuration(status_interval));
    }

    spdlog::info("Main: {} running, pid {}", id, getpid());
    for (;;) {
        int sig = 0;
        if (sigwait(&sigs, &sig) != 0) {
            spdlog::error("Main: sigwait failed");
            break;
        }
        if (sig == SIGHUP) {
            reload(*supervisor, config_path, lookup);
            continue;
        }
        if (sig == SIGUSR1) {
            log_status(*supervisor);
            continue;
        }
        spdlog::info("Main: received signal {}, shutting down", sig);
        break;
    }

    statusTimer.shutdown();
    runner.request_stop();
    runner.join();
    supervisor.reset();
    writers->shutdown();
    spdlog::info("Main: bye");
    return 0;
}

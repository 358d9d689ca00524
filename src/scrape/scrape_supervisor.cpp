#include "scrape/scrape_supervisor.hpp"

#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "common/config_error.hpp"
#include "scrape/config_builder.hpp"
#include "scrape/target_translator.hpp"

ScrapeSupervisor::ScrapeSupervisor(std::string id, SupervisorConfig args, const EngineFactory& factory)
    : id_(std::move(id)),
      fanout_(std::make_shared<Fanout>())
{
    if (id_.empty())
        throw std::invalid_argument("ScrapeSupervisor: empty instance id");

    EngineOptions opts;
    opts.ExtraMetrics = args.ExtraMetrics;
    engine_ = factory(opts, fanout_);
    if (!engine_)
        throw std::runtime_error("ScrapeSupervisor: engine factory returned no engine");

    // 同步应用一次初始参数，并挂起一次目标下发
    update(std::move(args));
    state_ = State::Running;
    spdlog::info("ScrapeSupervisor[{}]: initialized", id_);
}

ScrapeSupervisor::~ScrapeSupervisor()
{
    stopEngine();
}

void ScrapeSupervisor::run(std::stop_token stop)
{
    if (started_.exchange(true))
        throw std::logic_error("ScrapeSupervisor: run called more than once");

    TargetSetChannel targetSets;
    std::thread engineThread([this, &targetSets] {
        try {
            engine_->run(targetSets);
            spdlog::info("ScrapeSupervisor[{}]: scrape manager stopped", id_);
        } catch (const std::exception& e) {
            spdlog::info("ScrapeSupervisor[{}]: scrape manager stopped", id_);
            spdlog::error("ScrapeSupervisor[{}]: scrape manager failed: {}", id_, e.what());
        }
    });

    // 任何路径退出都要先停引擎、关通道，再等后台线程结束
    struct Shutdown {
        ScrapeSupervisor* self;
        TargetSetChannel& targetSets;
        std::thread&      engineThread;
        ~Shutdown() {
            self->stopEngine();
            targetSets.close();
            if (engineThread.joinable()) engineThread.join();
            self->state_ = State::Stopped;
            spdlog::info("ScrapeSupervisor[{}]: stopped", self->id_);
        }
    } shutdown{this, targetSets, engineThread};

    while (reload_.wait(stop)) {
        std::vector<DiscoveryTarget> targets;
        {
            std::shared_lock lk(mtx_);
            targets = args_.Targets;
        }
        auto sets = translateTargets(id_, targets);

        // 引擎按自己的节奏消费，这里可能阻塞；取消时放弃本次下发
        if (targetSets.send(std::move(sets), stop)) {
            ++handoffs_;
            spdlog::debug("ScrapeSupervisor[{}]: passed {} targets to scrape manager", id_, targets.size());
        }
    }
}

void ScrapeSupervisor::update(SupervisorConfig args)
{
    {
        std::unique_lock lk(mtx_);

        auto sc = buildScrapeConfig(id_, args);
        try {
            engine_->applyConfig(sc);
        } catch (const std::exception& e) {
            throw ConfigError(CONFIG_STAGE_APPLY, e.what());
        }

        fanout_->setReceivers(args.ForwardTo);
        args_ = std::move(args);
        spdlog::debug("ScrapeSupervisor[{}]: scrape config was updated", id_);
    }

    reload_.raise();
}

ScraperStatus ScrapeSupervisor::status() const
{
    ScraperStatus res;
    for (const auto& [job, targets] : engine_->targetsActive()) {
        for (const auto& st : targets) {
            if (!st) continue;
            res.Targets.push_back(TargetStatus{
                job,
                st->url(),
                st->health(),
                st->labels(),
                st->lastError(),
                st->lastScrape(),
                st->lastScrapeDuration(),
            });
        }
    }
    return res;
}

SupervisorConfig ScrapeSupervisor::config() const
{
    std::shared_lock lk(mtx_);
    return args_;
}

void ScrapeSupervisor::stopEngine()
{
    std::call_once(stopOnce_, [this] {
        try {
            engine_->stop();
        } catch (const std::exception& e) {
            spdlog::error("ScrapeSupervisor[{}]: error stopping scrape manager: {}", id_, e.what());
        }
    });
}

const char* stateName(ScrapeSupervisor::State s)
{
    switch (s) {
        case ScrapeSupervisor::State::Initializing: return "initializing";
        case ScrapeSupervisor::State::Running:      return "running";
        case ScrapeSupervisor::State::Stopped:      return "stopped";
    }
    return "unknown";
}

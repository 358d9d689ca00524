// ============================================================================
// SCRAPE SUPERVISOR TESTS
// ============================================================================
// Run loop, update atomicity, coalescing and shutdown, driven by FakeEngine
// ============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "common/config_error.hpp"
#include "scrape/scrape_supervisor.hpp"
#include "test_helpers.hpp"

namespace
{
    const std::string kID = "prometheus.scrape.test";

    SupervisorConfig argsWithTargets(std::vector<std::string> addresses)
    {
        SupervisorConfig args;
        args.ScrapeInterval = std::chrono::seconds(15);
        for (auto& a : addresses) {
            args.Targets.push_back({{LABEL_ADDRESS, a}});
        }
        return args;
    }

    class ScrapeSupervisorTest : public ::testing::Test {
    protected:
        std::shared_ptr<FakeEngine::State> engine = std::make_shared<FakeEngine::State>();

        std::unique_ptr<ScrapeSupervisor> make(SupervisorConfig args)
        {
            return std::make_unique<ScrapeSupervisor>(kID, std::move(args), FakeEngine::factory(engine));
        }
    };
} // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

TEST_F(ScrapeSupervisorTest, ConstructionAppliesInitialConfig) {
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));

    EXPECT_EQ(sup->state(), ScrapeSupervisor::State::Running);
    std::lock_guard lg(engine->m);
    ASSERT_EQ(engine->applied.size(), 1u);
    EXPECT_EQ(engine->applied[0].JobName, kID);
    EXPECT_EQ(engine->applied[0].ScrapeInterval, std::chrono::seconds(15));
}

TEST_F(ScrapeSupervisorTest, ConstructionFailsOnInvalidArguments) {
    auto args = argsWithTargets({"10.0.0.1:9090"});
    args.Scheme = "ftp";
    EXPECT_THROW(make(args), ConfigError);
}

TEST_F(ScrapeSupervisorTest, ExtraMetricsReachEngineOptions) {
    auto args = argsWithTargets({});
    args.ExtraMetrics = true;
    auto sup = make(args);
    std::lock_guard lg(engine->m);
    EXPECT_TRUE(engine->options.ExtraMetrics);
}

TEST_F(ScrapeSupervisorTest, StatusAfterConstructionShowsUnknownHealth) {
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));
    std::jthread runner([&](std::stop_token st) { sup->run(st); });

    ASSERT_TRUE(waitFor([&] { return !sup->status().Targets.empty(); }));
    auto status = sup->status();
    ASSERT_EQ(status.Targets.size(), 1u);
    EXPECT_EQ(status.Targets[0].JobName, kID);
    EXPECT_EQ(status.Targets[0].URL, "http://10.0.0.1:9090/metrics");
    EXPECT_EQ(status.Targets[0].Health, TargetHealth::Unknown);
    EXPECT_TRUE(status.Targets[0].LastError.empty());
}

// ============================================================================
// PROPAGATION
// ============================================================================

TEST_F(ScrapeSupervisorTest, UpdateReplacesTargetList) {
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));
    std::jthread runner([&](std::stop_token st) { sup->run(st); });
    ASSERT_TRUE(waitFor([&] { return engine->receivedCount() == 1; }));

    sup->update(argsWithTargets({"10.0.0.1:9090", "10.0.0.2:9090", "10.0.0.3:9090"}));
    ASSERT_TRUE(waitFor([&] { return engine->receivedCount() == 2; }));

    std::lock_guard lg(engine->m);
    const auto& first = engine->received[0];
    const auto& sets = engine->received[1];
    ASSERT_EQ(sets.size(), 1u);
    ASSERT_TRUE(sets.count(kID));
    ASSERT_EQ(sets.at(kID).size(), 1u);
    EXPECT_EQ(sets.at(kID)[0].Source, first.at(kID)[0].Source);
    EXPECT_EQ(sets.at(kID)[0].Targets.size(), 3u);
}

TEST_F(ScrapeSupervisorTest, RemovingAllTargetsSendsEmptyGroup) {
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));
    std::jthread runner([&](std::stop_token st) { sup->run(st); });
    ASSERT_TRUE(waitFor([&] { return engine->receivedCount() == 1; }));

    sup->update(argsWithTargets({}));
    ASSERT_TRUE(waitFor([&] { return engine->receivedCount() == 2; }));

    std::lock_guard lg(engine->m);
    const auto& sets = engine->received[1];
    ASSERT_TRUE(sets.count(kID));
    ASSERT_EQ(sets.at(kID).size(), 1u);
    EXPECT_EQ(sets.at(kID)[0].Source, kID);
    EXPECT_TRUE(sets.at(kID)[0].Targets.empty());
}

TEST_F(ScrapeSupervisorTest, EmptyTargetListStillCompletesFirstHandoff) {
    auto sup = make(argsWithTargets({}));
    EXPECT_EQ(sup->handoffs(), 0u);

    std::jthread runner([&](std::stop_token st) { sup->run(st); });
    ASSERT_TRUE(waitFor([&] { return sup->handoffs() == 1; }, std::chrono::seconds(1)));
    EXPECT_TRUE(sup->status().Targets.empty());

    sup->update(argsWithTargets({"10.0.0.1:9090"}));
    ASSERT_TRUE(waitFor([&] { return sup->handoffs() == 2; }));
}

TEST_F(ScrapeSupervisorTest, PendingUpdatesCoalesceIntoOnePropagation) {
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));
    sup->update(argsWithTargets({"10.0.0.2:9090"}));
    sup->update(argsWithTargets({"10.0.0.3:9090", "10.0.0.4:9090"}));

    std::jthread runner([&](std::stop_token st) { sup->run(st); });
    ASSERT_TRUE(waitFor([&] { return engine->receivedCount() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::lock_guard lg(engine->m);
    ASSERT_EQ(engine->received.size(), 1u);
    const auto& targets = engine->received[0].at(kID)[0].Targets;
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].at(LABEL_ADDRESS), "10.0.0.3:9090");
    EXPECT_EQ(targets[1].at(LABEL_ADDRESS), "10.0.0.4:9090");
}

// ============================================================================
// FAILED UPDATES
// ============================================================================

TEST_F(ScrapeSupervisorTest, MutuallyExclusiveAuthIsRejected) {
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));

    auto bad = argsWithTargets({"10.0.0.9:9090"});
    bad.HTTPClient.basic_auth = BasicAuth{"user", "pass", ""};
    bad.HTTPClient.bearer_token = "token";

    try {
        sup->update(bad);
        FAIL() << "update should have thrown";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.stage(), CONFIG_STAGE_BUILD);
        EXPECT_NE(std::string(e.what()).find("bearer_token"), std::string::npos);
    }

    auto current = sup->config();
    ASSERT_EQ(current.Targets.size(), 1u);
    EXPECT_EQ(current.Targets[0].at(LABEL_ADDRESS), "10.0.0.1:9090");
    EXPECT_FALSE(current.HTTPClient.basic_auth.has_value());
    std::lock_guard lg(engine->m);
    EXPECT_EQ(engine->applied.size(), 1u);
}

TEST_F(ScrapeSupervisorTest, EngineRejectionKeepsPreviousConfigAndReceivers) {
    auto first = std::make_shared<RecordingReceiver>("first");
    auto args = argsWithTargets({"10.0.0.1:9090"});
    args.ForwardTo = {first};
    auto sup = make(args);

    {
        std::lock_guard lg(engine->m);
        engine->rejectWith = "invalid relabel regex";
    }
    auto next = argsWithTargets({"10.0.0.2:9090"});
    next.ForwardTo = {std::make_shared<RecordingReceiver>("second")};

    try {
        sup->update(next);
        FAIL() << "update should have thrown";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.stage(), CONFIG_STAGE_APPLY);
        EXPECT_EQ(e.cause(), "invalid relabel regex");
    }

    auto current = sup->config();
    ASSERT_EQ(current.ForwardTo.size(), 1u);
    EXPECT_EQ(current.ForwardTo[0]->name(), "first");
    EXPECT_EQ(current.Targets[0].at(LABEL_ADDRESS), "10.0.0.1:9090");
}

TEST_F(ScrapeSupervisorTest, ConcurrentUpdatesNeverInterleave) {
    auto sup = make(argsWithTargets({"seed:1"}));
    std::jthread runner([&](std::stop_token st) { sup->run(st); });

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::thread reader([&] {
        while (!done) {
            auto cfg = sup->config();
            if (cfg.JobName.empty()) continue;
            // 每次 update 的 job 名与唯一目标地址一一对应
            if (cfg.Targets.size() != 1 || cfg.Targets[0].at(LABEL_ADDRESS) != cfg.JobName)
                ++torn;
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&, w] {
            for (int i = 0; i < 50; ++i) {
                auto addr = "w" + std::to_string(w) + "-" + std::to_string(i) + ":80";
                auto args = argsWithTargets({addr});
                args.JobName = addr;
                sup->update(args);
            }
        });
    }
    for (auto& t : writers) t.join();
    done = true;
    reader.join();

    EXPECT_EQ(torn.load(), 0);

    // 最终下发的目标一定对应最后一次完成的 update
    auto last = sup->config();
    ASSERT_TRUE(waitFor([&] {
        std::lock_guard lg(engine->m);
        if (engine->received.empty()) return false;
        const auto& targets = engine->received.back().at(kID)[0].Targets;
        return targets.size() == 1 && targets[0].at(LABEL_ADDRESS) == last.JobName;
    }));
}

// ============================================================================
// SHUTDOWN
// ============================================================================

TEST_F(ScrapeSupervisorTest, CancellationAbandonsBlockedHandoff) {
    {
        std::lock_guard lg(engine->m);
        engine->consume = false;
    }
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));
    std::jthread runner([&](std::stop_token st) { sup->run(st); });

    ASSERT_TRUE(waitFor([&] {
        std::lock_guard lg(engine->m);
        return engine->channel != nullptr && engine->channel->waiting();
    }));

    runner.request_stop();
    runner.join();

    EXPECT_EQ(engine->stopCount(), 1);
    EXPECT_EQ(engine->receivedCount(), 0u);
    EXPECT_EQ(sup->handoffs(), 0u);
    EXPECT_EQ(sup->state(), ScrapeSupervisor::State::Stopped);

    sup.reset();
    EXPECT_EQ(engine->stopCount(), 1);
}

TEST_F(ScrapeSupervisorTest, EngineFailureKeepsAcceptingUpdates) {
    {
        std::lock_guard lg(engine->m);
        engine->failRun = true;
    }
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));
    std::jthread runner([&](std::stop_token st) { sup->run(st); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_NO_THROW(sup->update(argsWithTargets({"10.0.0.2:9090"})));
    EXPECT_EQ(sup->config().Targets[0].at(LABEL_ADDRESS), "10.0.0.2:9090");
    EXPECT_EQ(sup->state(), ScrapeSupervisor::State::Running);

    runner.request_stop();
    runner.join();
    EXPECT_EQ(engine->stopCount(), 1);
    EXPECT_EQ(engine->receivedCount(), 0u);
}

TEST_F(ScrapeSupervisorTest, DestructorStopsEngineWhenNeverRun) {
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));
    sup.reset();
    EXPECT_EQ(engine->stopCount(), 1);
}

TEST_F(ScrapeSupervisorTest, RunTwiceIsRejected) {
    auto sup = make(argsWithTargets({}));
    std::stop_source src;
    src.request_stop();
    sup->run(src.get_token());
    EXPECT_THROW(sup->run(src.get_token()), std::logic_error);
}

// ============================================================================
// STATUS
// ============================================================================

TEST_F(ScrapeSupervisorTest, StatusSkipsAbsentRecords) {
    {
        std::lock_guard lg(engine->m);
        engine->addNullEntry = true;
    }
    auto sup = make(argsWithTargets({"10.0.0.1:9090", "10.0.0.2:9090"}));
    std::jthread runner([&](std::stop_token st) { sup->run(st); });

    ASSERT_TRUE(waitFor([&] { return engine->receivedCount() == 1; }));
    EXPECT_EQ(sup->status().Targets.size(), 2u);
}

TEST_F(ScrapeSupervisorTest, StatusReflectsLatestScrapeResult) {
    auto sup = make(argsWithTargets({"10.0.0.1:9090"}));
    std::jthread runner([&](std::stop_token st) { sup->run(st); });
    ASSERT_TRUE(waitFor([&] { return engine->receivedCount() == 1; }));

    std::shared_ptr<ScrapeTarget> target;
    {
        std::lock_guard lg(engine->m);
        target = engine->created.back();
    }
    auto now = std::chrono::system_clock::now();
    target->report(now, std::chrono::milliseconds(12), "connection refused");

    auto status = sup->status();
    ASSERT_EQ(status.Targets.size(), 1u);
    EXPECT_EQ(status.Targets[0].Health, TargetHealth::Down);
    EXPECT_EQ(status.Targets[0].LastError, "connection refused");
    EXPECT_EQ(status.Targets[0].LastScrape, now);
    EXPECT_EQ(status.Targets[0].LastScrapeDuration, std::chrono::milliseconds(12));

    target->report(now, std::chrono::milliseconds(3), "");
    status = sup->status();
    EXPECT_EQ(status.Targets[0].Health, TargetHealth::Up);
    EXPECT_TRUE(status.Targets[0].LastError.empty());
}

TEST(ScrapeStatusJson, SerializesTargetFields) {
    TargetStatus t;
    t.JobName = "node";
    t.URL = "http://10.0.0.1:9100/metrics";
    t.Health = TargetHealth::Up;
    t.Labels = {{"instance", "10.0.0.1:9100"}, {"job", "node"}};
    t.LastScrape = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    t.LastScrapeDuration = std::chrono::milliseconds(250);

    ScraperStatus s;
    s.Targets.push_back(t);
    nlohmann::json j = s;

    ASSERT_EQ(j["target"].size(), 1u);
    const auto& e = j["target"][0];
    EXPECT_EQ(e["job"], "node");
    EXPECT_EQ(e["health"], "up");
    EXPECT_EQ(e["labels"]["instance"], "10.0.0.1:9100");
    EXPECT_EQ(e["last_error"], "");
    EXPECT_EQ(e["last_scrape"], "2023-11-14T22:13:20.000Z");
    EXPECT_DOUBLE_EQ(e["last_scrape_duration"].get<double>(), 0.25);
}

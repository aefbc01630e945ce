// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <vector>

#include <daemon/poll_scheduler.hpp>

#include "fake_sources.hpp"
#include "test_helpers.hpp"

using namespace meshmetrics;
using meshmetrics::testing::CapturingSink;
using meshmetrics::testing::ScriptedTelemetrySource;
using meshmetrics::testing::TempDirTest;

namespace {

std::vector<Device> two_devices() { return {Device{.node_id = "!a"}, Device{.node_id = "!b", .contact_name = "Hill"}}; }

DaemonConfigPtr make_config(std::chrono::seconds dwell, std::chrono::seconds interval = std::chrono::seconds(300)) {
    DaemonConfig config;
    config.version = 1;
    config.source.dwell_time = dwell;
    config.source.fetch_timeout = std::chrono::seconds(7);
    config.daemon.poll_interval = interval;
    config.daemon.error_cooldown = std::chrono::seconds(3);
    config.monitoring.enable_stats = false;
    return std::make_shared<const DaemonConfig>(config);
}

}  // namespace

class PollSchedulerTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        sink = std::make_shared<CapturingSink>();
        delivery = std::make_unique<DeliveryCoordinator>(SinkSet{.file_sink = sink}, stats);
        source.readings["!a"] = TelemetryReading{{"Battery", int64_t{90}}};
    }

    std::unique_ptr<PollScheduler> make_scheduler(DaemonConfigPtr config) {
        auto scheduler =
            std::make_unique<PollScheduler>(two_devices(), source, *delivery, stats, std::move(config), running);
        scheduler->set_sleeper([this](std::chrono::milliseconds duration) {
            slept.push_back(duration);
            if (on_sleep) {
                on_sleep();
            }
        });
        return scheduler;
    }

    std::chrono::milliseconds total_slept() const {
        std::chrono::milliseconds total{0};
        for (auto d : slept) {
            total += d;
        }
        return total;
    }

    ScriptedTelemetrySource source;
    std::shared_ptr<CapturingSink> sink;
    DaemonStats stats;
    std::unique_ptr<DeliveryCoordinator> delivery;
    std::atomic<bool> running{true};
    std::vector<std::chrono::milliseconds> slept;
    std::function<void()> on_sleep;
};

TEST_F(PollSchedulerTest, RunOnceDeliversOneSnapshotAndRecordsStats) {
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(0)));

    CycleReport report = scheduler->run_once();

    EXPECT_EQ(report.nodes_polled, 2);
    EXPECT_EQ(report.nodes_with_data, 1);
    ASSERT_TRUE(report.delivery.has_value());
    ASSERT_EQ(sink->delivered.size(), 1);
    EXPECT_EQ(sink->delivered[0].size(), report.metric_lines);
    EXPECT_EQ(source.last_timeout, std::chrono::seconds(7));
    EXPECT_TRUE(slept.empty());

    EXPECT_EQ(stats.total_polls, 1);
    EXPECT_EQ(stats.successful_polls, 1);
    EXPECT_EQ(stats.failed_polls, 0);
    EXPECT_EQ(stats.nodes_processed, 2);
    EXPECT_EQ(stats.nodes_successful, 1);
    EXPECT_FALSE(stats.last_poll_time.empty());
}

TEST_F(PollSchedulerTest, CycleWithoutAnyDataCountsAsFailedPoll) {
    source.readings.clear();
    source.throwing_nodes = {"!b"};
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(0)));

    CycleReport report = scheduler->run_once();

    EXPECT_EQ(report.nodes_with_data, 0);
    EXPECT_EQ(stats.failed_polls, 1);
    EXPECT_EQ(stats.successful_polls, 0);
    // Both nodes still publish up=0 so the scraper sees them as down
    ASSERT_EQ(sink->delivered.size(), 1);
    EXPECT_EQ(sink->delivered[0].back().to_exposition(), "meshtastic_up{node=\"!b\",version=\"MTM-v0.98-Daemon\"} 0");
}

TEST_F(PollSchedulerTest, DwellsAfterEveryDeviceInOneSecondTicks) {
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(3)));

    scheduler->run_once();

    EXPECT_EQ(total_slept(), std::chrono::seconds(6));
    for (auto tick : slept) {
        EXPECT_LE(tick, std::chrono::seconds(1));
    }
}

TEST_F(PollSchedulerTest, StopDuringInterCycleSleepEndsWithinOneTick) {
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(0), std::chrono::seconds(300)));
    on_sleep = [&]() {
        EXPECT_EQ(scheduler->state(), SchedulerState::Sleeping);
        running = false;
    };

    scheduler->run();

    EXPECT_EQ(slept.size(), 1);
    EXPECT_EQ(source.fetched.size(), 2);
    EXPECT_EQ(stats.total_polls, 1);
    EXPECT_EQ(scheduler->state(), SchedulerState::Stopped);
}

TEST_F(PollSchedulerTest, StopDuringDwellSkipsRemainingDevices) {
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(10)));
    on_sleep = [&]() { running = false; };

    scheduler->run();

    EXPECT_THAT(source.fetched, ::testing::ElementsAre("!a"));
    EXPECT_EQ(slept.size(), 1);
    EXPECT_EQ(stats.nodes_processed, 1);
    EXPECT_EQ(scheduler->state(), SchedulerState::Stopped);
}

TEST_F(PollSchedulerTest, CycleFailureWaitsForCooldownThenRetries) {
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(1)));
    std::vector<SchedulerState> states;
    on_sleep = [&]() {
        states.push_back(scheduler->state());
        if (states.size() == 1) {
            throw std::runtime_error("serial port vanished");
        }
        if (source.fetched.size() == 2) {
            running = false;
        }
    };

    scheduler->run();

    // Dwell (throws), three cooldown ticks, then the retried cycle's first dwell
    EXPECT_THAT(
        states,
        ::testing::ElementsAre(
            SchedulerState::Dwell,
            SchedulerState::Cooldown,
            SchedulerState::Cooldown,
            SchedulerState::Cooldown,
            SchedulerState::Dwell));
    EXPECT_EQ(stats.total_polls, 1);
    EXPECT_EQ(scheduler->state(), SchedulerState::Stopped);
}

TEST_F(PollSchedulerTest, ConfigUpdateTakesEffectOnNextCycle) {
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(0)));
    scheduler->run_once();

    DaemonConfig next = *make_config(std::chrono::seconds(0));
    next.version = 2;
    next.output.node_id_format = NodeIdFormat::Clean;
    scheduler->update_config(std::make_shared<const DaemonConfig>(next));
    EXPECT_EQ(scheduler->current_config().version, 1);

    scheduler->run_once();

    EXPECT_EQ(scheduler->current_config().version, 2);
    ASSERT_EQ(sink->delivered.size(), 2);
    EXPECT_EQ(sink->delivered[0].front().label("node"), "!a");
    EXPECT_EQ(sink->delivered[1].front().label("node"), "a");
}

TEST_F(PollSchedulerTest, ReloadDuringDwellSwitchesSinksAtNextCycle) {
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(1)));
    auto reloaded_sink = std::make_shared<CapturingSink>();
    bool reloaded = false;
    scheduler->set_tick_callback([&]() {
        if (!reloaded && scheduler->state() == SchedulerState::Dwell) {
            reloaded = true;
            delivery->stage(SinkSet{.file_sink = reloaded_sink, .config_version = 2});
            DaemonConfig next = *make_config(std::chrono::seconds(1));
            next.version = 2;
            next.output.node_id_format = NodeIdFormat::Clean;
            scheduler->update_config(std::make_shared<const DaemonConfig>(next));
        }
    });

    scheduler->run_once();

    ASSERT_TRUE(reloaded);
    EXPECT_EQ(scheduler->current_config().version, 1);
    EXPECT_EQ(delivery->active_config_version(), 0);
    ASSERT_EQ(sink->delivered.size(), 1);
    EXPECT_TRUE(reloaded_sink->delivered.empty());
    EXPECT_EQ(sink->delivered[0].front().label("node"), "!a");

    scheduler->run_once();

    EXPECT_EQ(scheduler->current_config().version, 2);
    EXPECT_EQ(delivery->active_config_version(), 2);
    EXPECT_EQ(sink->delivered.size(), 1);
    ASSERT_EQ(reloaded_sink->delivered.size(), 1);
    EXPECT_EQ(reloaded_sink->delivered[0].front().label("node"), "a");
}

TEST_F(PollSchedulerTest, TickCallbackRunsAtSuspensionPoints) {
    auto scheduler = make_scheduler(make_config(std::chrono::seconds(0)));
    int ticks = 0;
    scheduler->set_tick_callback([&]() {
        ticks++;
        if (ticks == 1) {
            running = false;
        }
    });

    scheduler->run();

    EXPECT_TRUE(source.fetched.empty());
    EXPECT_EQ(ticks, 2);  // before the first fetch, then before the inter-cycle sleep
    EXPECT_EQ(scheduler->state(), SchedulerState::Stopped);
}

TEST_F(PollSchedulerTest, StatsArePersistedAfterEachCycle) {
    DaemonConfig config = *make_config(std::chrono::seconds(0));
    config.monitoring.enable_stats = true;
    config.monitoring.stats_file = (temp_dir / "state" / "stats.json").string();
    auto scheduler = make_scheduler(std::make_shared<const DaemonConfig>(config));

    scheduler->run_once();
    scheduler->run_once();

    auto stats_json = nlohmann::json::parse(meshmetrics::testing::read_text_file(temp_dir / "state" / "stats.json"));
    EXPECT_EQ(stats_json["total_polls"], 2);
    EXPECT_EQ(stats_json["nodes_processed"], 4);
}

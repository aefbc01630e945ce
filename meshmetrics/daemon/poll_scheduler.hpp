// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <daemon/daemon_config.hpp>
#include <daemon/daemon_stats.hpp>
#include <delivery/delivery_coordinator.hpp>
#include <telemetry/device.hpp>
#include <telemetry/telemetry_source.hpp>

namespace meshmetrics {

enum class SchedulerState {
    Idle,
    Polling,
    Dwell,
    Delivering,
    Sleeping,
    Cooldown,
    Stopping,
    Stopped,
};

std::string_view scheduler_state_name(SchedulerState state);

// Blocks for the given duration. Replaced in tests with a virtual clock.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

void real_sleep(std::chrono::milliseconds duration);

struct CycleReport {
    uint64_t nodes_polled = 0;
    uint64_t nodes_with_data = 0;
    size_t metric_lines = 0;
    std::optional<DeliveryOutcome> delivery;  // unset when nothing was delivered
};

/**
 * Drives the poll cadence: fetch every roster device in order, dwell between devices, deliver the snapshot, record
 * stats, then sleep until the next cycle.
 *
 * Every wait is split into ticks of at most one second. Before each tick, and before each fetch, the tick callback
 * runs and the run flag is checked, so clearing the flag stops the scheduler within one tick plus at most one
 * in-flight fetch.
 */
class PollScheduler {
public:
    PollScheduler(
        std::vector<Device> roster,
        TelemetrySource& source,
        DeliveryCoordinator& delivery,
        DaemonStats& stats,
        DaemonConfigPtr config,
        const std::atomic<bool>& running);

    // Loops until the run flag is cleared.
    void run();

    // Exactly one cycle, without the trailing inter-cycle sleep.
    CycleReport run_once();

    // Takes effect at the start of the next cycle, along with any sinks staged on the delivery coordinator.
    void update_config(DaemonConfigPtr config);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_tick_callback(std::function<void()> on_tick) { on_tick_ = std::move(on_tick); }

    SchedulerState state() const { return state_.load(); }
    const DaemonConfig& current_config() const { return *current_config_; }
    const std::vector<Device>& roster() const { return roster_; }

private:
    CycleReport run_cycle();
    TelemetryReading fetch_guarded(const Device& device);
    void persist_stats();
    void apply_pending_config();

    // Returns false if the run flag was cleared before the full duration elapsed.
    bool sleep_interruptible(std::chrono::seconds duration);
    bool keep_running();

    std::vector<Device> roster_;
    TelemetrySource& source_;
    DeliveryCoordinator& delivery_;
    DaemonStats& stats_;
    const std::atomic<bool>& running_;

    DaemonConfigPtr current_config_;
    std::mutex pending_mutex_;
    DaemonConfigPtr pending_config_;

    Sleeper sleeper_ = real_sleep;
    std::function<void()> on_tick_;
    std::atomic<SchedulerState> state_{SchedulerState::Idle};
};

}  // namespace meshmetrics

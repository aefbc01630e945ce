// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <daemon/daemon_config.hpp>
#include <daemon/daemon_stats.hpp>
#include <daemon/poll_scheduler.hpp>
#include <delivery/delivery_coordinator.hpp>
#include <telemetry/device.hpp>
#include <telemetry/telemetry_source.hpp>

namespace meshmetrics {

struct LifecycleOptions {
    std::filesystem::path config_path{std::string(kDefaultConfigPath)};
    bool foreground = false;
    bool once = false;  // run a single cycle, then shut down
    ConfigOverrides overrides;
};

using SourceFactory = std::function<std::unique_ptr<TelemetrySource>(std::string_view mode)>;

// Loads the roster named by config, decrypting it when configured. Throws on a missing password file, a roster
// that cannot be read or decrypted, or an empty roster.
std::vector<Device> load_configured_roster(const DaemonConfig& config);

// Loads the config file and applies the command line overrides.
DaemonConfig load_effective_config(const LifecycleOptions& options, uint64_t previous_version = 0);

/**
 * Owns the daemon process from configuration to shutdown.
 *
 * run() performs the startup sequence in a fixed order: config, logging, daemonize, logging again, signal
 * handlers, privilege drop, PID file, roster, source connection, poll loop. Any failing step ends startup with
 * exit code 1. Whatever was set up is torn down in reverse order on every exit path; in particular the PID file
 * is removed and the telemetry source is closed exactly once.
 *
 * SIGTERM/SIGINT clear the run flag and SIGHUP sets the reload flag. Both are serviced by the poll loop at its
 * next suspension point.
 */
class LifecycleController {
public:
    explicit LifecycleController(LifecycleOptions options);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // Returns the process exit code.
    int run();

    void request_stop() { running_.store(false); }
    void request_reload() { reload_requested_.store(true); }

    // Re-reads the config file and hands it to the delivery sinks and the scheduler. On failure the active config
    // stays in effect and false is returned.
    bool reload_config();

    void set_source_factory(SourceFactory factory) { source_factory_ = std::move(factory); }
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    const DaemonStats& stats() const { return stats_; }
    DaemonConfigPtr active_config() const;
    bool running() const { return running_.load(); }

private:
    int run_daemon();
    void service_reload_request();

    LifecycleOptions options_;
    SourceFactory source_factory_ = create_telemetry_source;
    Sleeper sleeper_ = real_sleep;

    std::atomic<bool> running_{false};
    std::atomic<bool> reload_requested_{false};

    DaemonStats stats_;

    mutable std::mutex config_mutex_;
    DaemonConfigPtr active_config_;

    std::unique_ptr<DeliveryCoordinator> delivery_;
    std::unique_ptr<PollScheduler> scheduler_;
};

}  // namespace meshmetrics

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <iterator>
#include <thread>

#include <tt-logger/tt-logger.hpp>

#include <daemon/poll_scheduler.hpp>
#include <telemetry/metric_renderer.hpp>

namespace meshmetrics {

namespace {

constexpr std::chrono::seconds kTick{1};

}  // namespace

std::string_view scheduler_state_name(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle: return "idle";
        case SchedulerState::Polling: return "polling";
        case SchedulerState::Dwell: return "dwell";
        case SchedulerState::Delivering: return "delivering";
        case SchedulerState::Sleeping: return "sleeping";
        case SchedulerState::Cooldown: return "cooldown";
        case SchedulerState::Stopping: return "stopping";
        case SchedulerState::Stopped: return "stopped";
    }
    return "unknown";
}

void real_sleep(std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); }

PollScheduler::PollScheduler(
    std::vector<Device> roster,
    TelemetrySource& source,
    DeliveryCoordinator& delivery,
    DaemonStats& stats,
    DaemonConfigPtr config,
    const std::atomic<bool>& running) :
    roster_(std::move(roster)),
    source_(source),
    delivery_(delivery),
    stats_(stats),
    running_(running),
    current_config_(std::move(config)) {}

void PollScheduler::update_config(DaemonConfigPtr config) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_config_ = std::move(config);
}

void PollScheduler::apply_pending_config() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    // Sinks staged by a reload switch over at the same cycle boundary as the config they were built from
    delivery_.adopt_pending();
    if (pending_config_) {
        log_info(
            tt::LogAlways,
            "Applying config version {} (was {})",
            pending_config_->version,
            current_config_->version);
        current_config_ = std::move(pending_config_);
        pending_config_.reset();
    }
}

bool PollScheduler::keep_running() {
    if (on_tick_) {
        on_tick_();
    }
    if (!running_.load()) {
        state_ = SchedulerState::Stopping;
        return false;
    }
    return true;
}

bool PollScheduler::sleep_interruptible(std::chrono::seconds duration) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
    while (remaining.count() > 0) {
        if (!keep_running()) {
            return false;
        }
        auto tick = std::min<std::chrono::milliseconds>(remaining, kTick);
        sleeper_(tick);
        remaining -= tick;
    }
    return keep_running();
}

TelemetryReading PollScheduler::fetch_guarded(const Device& device) {
    try {
        return source_.fetch(device, current_config_->source.fetch_timeout);
    } catch (const std::exception& e) {
        log_debug(tt::LogAlways, "Telemetry fetch for {} threw: {}", device.node_id, e.what());
        return {};
    }
}

void PollScheduler::persist_stats() {
    const auto& monitoring = current_config_->monitoring;
    if (!monitoring.enable_stats || monitoring.stats_file.empty()) {
        return;
    }
    try {
        write_stats_file(monitoring.stats_file, stats_);
    } catch (const std::exception& e) {
        log_warning(tt::LogAlways, "Failed to write stats file {}: {}", monitoring.stats_file, e.what());
    }
}

CycleReport PollScheduler::run_cycle() {
    const DaemonConfig& config = *current_config_;
    RenderOptions render_options{.node_id_format = config.output.node_id_format};

    log_info(tt::LogAlways, "Starting poll of {} devices", roster_.size());

    CycleReport report;
    Snapshot snapshot;
    for (const auto& device : roster_) {
        if (!keep_running()) {
            break;
        }
        state_ = SchedulerState::Polling;
        report.nodes_polled++;
        log_debug(tt::LogAlways, "Processing node: {}", device.node_id);

        TelemetryReading reading = fetch_guarded(device);
        if (reading.empty()) {
            log_warning(tt::LogAlways, "No telemetry data from {}", device.node_id);
        } else {
            report.nodes_with_data++;
            log_debug(tt::LogAlways, "Successfully collected telemetry from {}", device.node_id);
        }

        auto lines = render_device_metrics(device, reading, render_options);
        snapshot.insert(snapshot.end(), std::make_move_iterator(lines.begin()), std::make_move_iterator(lines.end()));

        if (config.source.dwell_time.count() > 0 && running_.load()) {
            state_ = SchedulerState::Dwell;
            sleep_interruptible(config.source.dwell_time);
        }
    }

    report.metric_lines = snapshot.size();
    if (!snapshot.empty()) {
        state_ = SchedulerState::Delivering;
        report.delivery = delivery_.deliver(snapshot);
    }

    stats_.record_poll(report.nodes_polled, report.nodes_with_data);
    persist_stats();
    log_info(tt::LogAlways, "Poll completed: {}/{} nodes successful", report.nodes_with_data, report.nodes_polled);
    return report;
}

CycleReport PollScheduler::run_once() {
    apply_pending_config();
    CycleReport report = run_cycle();
    state_ = SchedulerState::Idle;
    return report;
}

void PollScheduler::run() {
    log_info(
        tt::LogAlways, "Starting polling loop with {}s interval", current_config_->daemon.poll_interval.count());
    while (running_.load()) {
        apply_pending_config();
        try {
            run_cycle();
        } catch (const std::exception& e) {
            log_error(tt::LogAlways, "Error during polling: {}", e.what());
            state_ = SchedulerState::Cooldown;
            sleep_interruptible(current_config_->daemon.error_cooldown);
            continue;
        }
        state_ = SchedulerState::Sleeping;
        sleep_interruptible(current_config_->daemon.poll_interval);
    }
    state_ = SchedulerState::Stopped;
    log_info(tt::LogAlways, "Polling loop stopped");
}

}  // namespace meshmetrics

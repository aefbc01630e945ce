// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

#include <delivery/delivery_coordinator.hpp>
#include <delivery/push_client.hpp>
#include <delivery/snapshot_publisher.hpp>

namespace meshmetrics {

namespace {

struct SinkAttempt {
    bool ok = true;
    std::string error;
};

SinkAttempt attempt(const SnapshotSink* sink, const Snapshot& snapshot) {
    if (sink == nullptr || !sink->enabled()) {
        return {};
    }
    try {
        DeliveryResult result = sink->deliver(snapshot);
        if (!result.ok) {
            return SinkAttempt{.ok = false, .error = fmt::format("{} sink: {}", sink->name(), result.reason)};
        }
        return {};
    } catch (const std::exception& e) {
        return SinkAttempt{.ok = false, .error = fmt::format("{} sink threw: {}", sink->name(), e.what())};
    }
}

void append_error(std::string& text, const std::string& error) {
    if (!text.empty()) {
        text += "; ";
    }
    text += error;
}

}  // namespace

DeliveryCoordinator::DeliveryCoordinator(const DaemonConfig& config, DaemonStats& stats) :
    DeliveryCoordinator(make_sinks(config), stats) {}

DeliveryCoordinator::DeliveryCoordinator(SinkSet sinks, DaemonStats& stats) :
    stats_(stats), active_(std::make_shared<const SinkSet>(std::move(sinks))) {}

SinkSet DeliveryCoordinator::make_sinks(const DaemonConfig& config) {
    SinkSet sinks;
    sinks.file_sink = std::make_shared<const SnapshotPublisher>(SnapshotPublisherConfig{
        .directory = config.output.directory,
        .individual_files = config.output.individual_files,
        .atomic_writes = config.output.atomic_writes});
    sinks.push_sink = std::make_shared<const PushClient>(PushClientConfig{
        .push_url = config.push.push_url,
        .job_name = config.push.job_name,
        .instance = config.push.instance,
        .timeout = config.push.timeout});
    sinks.config_version = config.version;
    return sinks;
}

void DeliveryCoordinator::reload(const DaemonConfig& config) {
    SinkSet sinks = make_sinks(config);
    stage(std::move(sinks));
    log_info(tt::LogAlways, "Staged delivery sinks for config version {}", config.version);
}

void DeliveryCoordinator::stage(SinkSet sinks) {
    auto staged = std::make_shared<const SinkSet>(std::move(sinks));
    std::lock_guard<std::mutex> lock(mutex_);
    staged_ = std::move(staged);
}

uint64_t DeliveryCoordinator::active_config_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_->config_version;
}

bool DeliveryCoordinator::adopt_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!staged_) {
        return false;
    }
    log_info(
        tt::LogAlways,
        "Switching delivery sinks from config version {} to {}",
        active_->config_version,
        staged_->config_version);
    active_ = std::move(staged_);
    staged_.reset();
    return true;
}

std::shared_ptr<const SinkSet> DeliveryCoordinator::active_sinks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

DeliveryOutcome DeliveryCoordinator::deliver(const Snapshot& snapshot) {
    // Holding our own reference keeps this delivery's sinks alive even if new ones are adopted meanwhile
    std::shared_ptr<const SinkSet> sinks = active_sinks();

    DeliveryOutcome outcome;

    SinkAttempt file = attempt(sinks->file_sink.get(), snapshot);
    outcome.file_ok = file.ok;
    if (!file.ok) {
        log_error(tt::LogAlways, "Failed to publish metrics: {}", file.error);
        append_error(outcome.error_text, file.error);
    }

    outcome.push_attempted = sinks->push_sink && sinks->push_sink->enabled();
    SinkAttempt push = attempt(sinks->push_sink.get(), snapshot);
    outcome.push_ok = push.ok;
    if (!push.ok) {
        log_error(tt::LogAlways, "Failed to push metrics: {}", push.error);
        append_error(outcome.error_text, push.error);
    }

    if (outcome.push_attempted) {
        stats_.record_push(outcome.push_ok);
    }
    return outcome;
}

}  // namespace meshmetrics

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <daemon/daemon_config.hpp>
#include <daemon/daemon_stats.hpp>
#include <delivery/snapshot_sink.hpp>

namespace meshmetrics {

// The sinks one delivery runs against. Replaced wholesale on reload; never modified in place.
struct SinkSet {
    std::shared_ptr<const SnapshotSink> file_sink;
    std::shared_ptr<const SnapshotSink> push_sink;
    uint64_t config_version = 0;
};

struct DeliveryOutcome {
    bool file_ok = true;
    bool push_ok = true;
    bool push_attempted = false;
    std::string error_text;

    bool ok() const { return file_ok && push_ok; }
};

/**
 * Fans each snapshot out to the file and push sinks.
 *
 * Both sinks are always attempted; an exception or failure in one is recorded in the outcome and never prevents
 * the other. Push statistics are updated exactly once per delivery, and only when a push endpoint is configured.
 *
 * reload() may be called from a different thread than deliver(). The new sink set is only staged; the poll loop
 * adopts it with adopt_pending() at the boundary between cycles, together with the matching config, so a cycle
 * always delivers through the sinks that were active when it started.
 */
class DeliveryCoordinator {
public:
    DeliveryCoordinator(const DaemonConfig& config, DaemonStats& stats);
    DeliveryCoordinator(SinkSet sinks, DaemonStats& stats);

    DeliveryOutcome deliver(const Snapshot& snapshot);

    // Builds and validates sinks for config, then stages them. Throws if the sinks cannot be built; the live and
    // any previously staged sinks are then left untouched.
    void reload(const DaemonConfig& config);

    void stage(SinkSet sinks);

    // Makes the staged sink set (if any) active. Returns true if a switch happened.
    bool adopt_pending();

    uint64_t active_config_version() const;

    // Throws std::invalid_argument for an unusable push URL.
    static SinkSet make_sinks(const DaemonConfig& config);

private:
    std::shared_ptr<const SinkSet> active_sinks() const;

    DaemonStats& stats_;

    mutable std::mutex mutex_;
    std::shared_ptr<const SinkSet> active_;
    std::shared_ptr<const SinkSet> staged_;
};

}  // namespace meshmetrics

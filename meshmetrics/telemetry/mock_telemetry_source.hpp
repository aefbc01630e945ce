// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_set>

#include <telemetry/telemetry_source.hpp>

namespace meshmetrics {

/**
 * Synthetic telemetry for running the daemon without a radio. Values are derived from the node id and a fetch
 * counter, so they are deterministic across runs but still move from cycle to cycle.
 *
 * The connect address may list nodes that should appear unreachable: "offline=!a1b2c3d4,!deadbeef".
 */
class MockTelemetrySource : public TelemetrySource {
public:
    Status connect(std::string_view mode, std::string_view address) override;
    TelemetryReading fetch(const Device& device, std::chrono::seconds timeout) override;
    void close() override;

    bool connected() const { return connected_; }
    uint64_t fetch_count() const { return fetch_count_.load(); }

private:
    bool connected_ = false;
    std::unordered_set<std::string> offline_nodes_;
    std::atomic<uint64_t> fetch_count_{0};
};

}  // namespace meshmetrics

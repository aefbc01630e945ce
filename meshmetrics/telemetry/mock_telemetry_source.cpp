// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <functional>
#include <sstream>

#include <tt-logger/tt-logger.hpp>

#include <telemetry/mock_telemetry_source.hpp>

namespace meshmetrics {

Status MockTelemetrySource::connect(std::string_view mode, std::string_view address) {
    offline_nodes_.clear();

    constexpr std::string_view offline_prefix = "offline=";
    if (address.starts_with(offline_prefix)) {
        std::stringstream ss{std::string(address.substr(offline_prefix.size()))};
        std::string node;
        while (std::getline(ss, node, ',')) {
            if (!node.empty()) {
                offline_nodes_.insert(node);
            }
        }
    }

    connected_ = true;
    log_info(
        tt::LogAlways,
        "Using mock telemetry data (mode={}, {} node(s) simulated offline)",
        mode,
        offline_nodes_.size());
    return Status::Ok();
}

TelemetryReading MockTelemetrySource::fetch(const Device& device, std::chrono::seconds /*timeout*/) {
    uint64_t iteration = fetch_count_.fetch_add(1);
    if (!connected_ || offline_nodes_.contains(device.node_id)) {
        return {};
    }

    uint64_t seed = std::hash<std::string>{}(device.node_id);
    int64_t battery = static_cast<int64_t>(40 + (seed + iteration) % 61);
    double voltage = 3.3 + static_cast<double>((seed >> 8) % 90) / 100.0;
    double utilization = static_cast<double>((seed >> 16) % 400) / 10.0;

    TelemetryReading reading;
    reading.set("Battery", battery);
    reading.set("Voltage", voltage);
    reading.set("utilization", utilization);
    reading.set("airtime_tx", static_cast<double>((seed >> 24) % 100) / 10.0);
    reading.set("uptime", static_cast<int64_t>(3600 + iteration * 300));
    return reading;
}

void MockTelemetrySource::close() {
    if (connected_) {
        log_debug(tt::LogAlways, "Mock telemetry source closed");
    }
    connected_ = false;
}

}  // namespace meshmetrics

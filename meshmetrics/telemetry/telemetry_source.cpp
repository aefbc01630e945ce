// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <telemetry/json_telemetry_source.hpp>
#include <telemetry/mock_telemetry_source.hpp>
#include <telemetry/telemetry_source.hpp>
#include <utils/assert.hpp>

namespace meshmetrics {

bool is_known_source_mode(std::string_view mode) {
    return mode == "serial" || mode == "ip" || mode == "mock" || mode == "json";
}

std::unique_ptr<TelemetrySource> create_telemetry_source(std::string_view mode) {
    if (mode == "mock") {
        return std::make_unique<MockTelemetrySource>();
    }
    if (mode == "json") {
        return std::make_unique<JsonTelemetrySource>();
    }
    MESHMETRICS_FATAL(is_known_source_mode(mode), "Invalid mode: {}", mode);
    MESHMETRICS_THROW(
        "The '{}' radio transport is not built into meshmetricsd; run a radio bridge and use mode 'json'", mode);
}

}  // namespace meshmetrics

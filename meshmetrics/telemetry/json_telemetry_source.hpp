// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include <telemetry/telemetry_source.hpp>

namespace meshmetrics {

/**
 * Reads telemetry that an external radio bridge drops into a JSON document of the form
 *
 *   { "!a1b2c3d4": { "Battery": 87, "Voltage": 4.1, "status": "ok" }, ... }
 *
 * The document is re-read on every fetch so the bridge can replace it at any time. Numbers keep their integer or
 * floating-point type, booleans become 0/1, strings pass through, and anything else is skipped.
 */
class JsonTelemetrySource : public TelemetrySource {
public:
    Status connect(std::string_view mode, std::string_view address) override;
    TelemetryReading fetch(const Device& device, std::chrono::seconds timeout) override;
    void close() override;

private:
    std::filesystem::path document_path_;
    bool connected_ = false;
};

}  // namespace meshmetrics

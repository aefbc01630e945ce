// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * telemetry/telemetry_source.hpp
 *
 * Transport-agnostic access to node telemetry. The poll scheduler only ever talks to this interface; the
 * radio link itself lives behind an implementation.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <telemetry/device.hpp>

namespace meshmetrics {

struct Status {
    bool ok = true;
    std::string message;

    static Status Ok() { return Status{}; }
    static Status Error(std::string message) { return Status{.ok = false, .message = std::move(message)}; }
};

class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;

    virtual Status connect(std::string_view mode, std::string_view address) = 0;

    // Must not throw. Any failure (unreachable node, timeout, decode error) yields an empty reading.
    virtual TelemetryReading fetch(const Device& device, std::chrono::seconds timeout) = 0;

    // Idempotent.
    virtual void close() = 0;
};

// Transport modes accepted in the `meshtastic.mode` config key.
bool is_known_source_mode(std::string_view mode);

// Creates the source for a mode. Throws for modes that have no implementation in this build.
std::unique_ptr<TelemetrySource> create_telemetry_source(std::string_view mode);

}  // namespace meshmetrics

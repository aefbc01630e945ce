// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <fstream>

#include <nlohmann/json.hpp>
#include <tt-logger/tt-logger.hpp>

#include <telemetry/json_telemetry_source.hpp>

using json = nlohmann::json;

namespace meshmetrics {

Status JsonTelemetrySource::connect(std::string_view /*mode*/, std::string_view address) {
    if (address.empty()) {
        return Status::Error("json telemetry source requires the path of the bridge document as its address");
    }
    document_path_ = std::filesystem::path(address);

    std::error_code ec;
    if (!std::filesystem::exists(document_path_, ec)) {
        // The bridge may not have produced its first document yet; fetches return empty readings until it does
        log_warning(tt::LogAlways, "Telemetry bridge document {} does not exist yet", document_path_.string());
    }

    connected_ = true;
    log_info(tt::LogAlways, "Reading telemetry from bridge document {}", document_path_.string());
    return Status::Ok();
}

TelemetryReading JsonTelemetrySource::fetch(const Device& device, std::chrono::seconds /*timeout*/) {
    TelemetryReading reading;
    if (!connected_) {
        return reading;
    }

    try {
        std::ifstream input(document_path_);
        if (!input.is_open()) {
            log_debug(tt::LogAlways, "Cannot open bridge document {}", document_path_.string());
            return reading;
        }

        json document = json::parse(input);
        auto node_it = document.find(device.node_id);
        if (node_it == document.end() || !node_it->is_object()) {
            return reading;
        }

        for (const auto& [key, value] : node_it->items()) {
            if (value.is_number_integer()) {
                reading.set(key, value.get<int64_t>());
            } else if (value.is_number_float()) {
                reading.set(key, value.get<double>());
            } else if (value.is_boolean()) {
                reading.set(key, static_cast<int64_t>(value.get<bool>() ? 1 : 0));
            } else if (value.is_string()) {
                reading.set(key, value.get<std::string>());
            }
        }
    } catch (const std::exception& e) {
        log_debug(tt::LogAlways, "Failed to get telemetry from {}: {}", device.node_id, e.what());
        return {};
    }

    return reading;
}

void JsonTelemetrySource::close() { connected_ = false; }

}  // namespace meshmetrics

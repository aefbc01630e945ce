// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <telemetry/device.hpp>
#include <telemetry/metric_line.hpp>
#include <utils/version.hpp>

namespace meshmetrics {

inline constexpr std::string_view kMetricPrefix = "meshtastic_";

// How the node identifier appears in the `node` label.
enum class NodeIdFormat {
    Raw,    // as listed in the roster, e.g. "!a1b2c3d4"
    Clean,  // sigil stripped, e.g. "a1b2c3d4"
};

std::optional<NodeIdFormat> parse_node_id_format(std::string_view text);
std::string_view node_id_format_name(NodeIdFormat format);

struct RenderOptions {
    NodeIdFormat node_id_format = NodeIdFormat::Raw;
    std::string version = std::string(kDaemonVersion);
};

/**
 * Returns true when text matches ^[+-]?[0-9]+\.?[0-9]*$, i.e. an optional sign, at least one digit, and an
 * optional fractional part. Such readings are exported as bare sample values; everything else becomes an
 * info-style metric carrying the text in a `str` label.
 */
bool is_numeric_value(std::string_view text);

std::string format_node_id(std::string_view node_id, NodeIdFormat format);

// "Channel Utilization" -> "meshtastic_channel_utilization"
std::string metric_name_for_key(std::string_view key);

/**
 * Renders one device's reading and metadata. Output order is fixed: readings in insertion order, then
 * contact/location (each only if non-empty), latitude/longitude (each only if numeric), then exactly one
 * meshtastic_up line whose value is 1 when the reading was non-empty.
 */
std::vector<MetricLine> render_device_metrics(
    const Device& device, const TelemetryReading& reading, const RenderOptions& options = {});

}  // namespace meshmetrics

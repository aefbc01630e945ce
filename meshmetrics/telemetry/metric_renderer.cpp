// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <cctype>
#include <cmath>
#include <type_traits>

#include <fmt/format.h>

#include <telemetry/metric_renderer.hpp>

namespace meshmetrics {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::string format_sample_value(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    return fmt::format("{}", value);
}

MetricLine info_line(std::string name, const std::string& node, std::string label_name, std::string label_value) {
    return MetricLine{
        .name = std::move(name),
        .labels = {{"node", node}, {std::move(label_name), std::move(label_value)}},
        .value = "1"};
}

MetricLine sample_line(std::string name, const std::string& node, std::string value) {
    return MetricLine{.name = std::move(name), .labels = {{"node", node}}, .value = std::move(value)};
}

}  // namespace

std::optional<NodeIdFormat> parse_node_id_format(std::string_view text) {
    if (text == "raw" || text == "default") {
        return NodeIdFormat::Raw;
    }
    if (text == "clean") {
        return NodeIdFormat::Clean;
    }
    return std::nullopt;
}

std::string_view node_id_format_name(NodeIdFormat format) {
    switch (format) {
        case NodeIdFormat::Raw: return "raw";
        case NodeIdFormat::Clean: return "clean";
    }
    return "raw";
}

bool is_numeric_value(std::string_view text) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        pos++;
    }

    size_t integer_digits = 0;
    while (pos < text.size() && is_digit(text[pos])) {
        pos++;
        integer_digits++;
    }
    if (integer_digits == 0) {
        return false;
    }

    if (pos < text.size() && text[pos] == '.') {
        pos++;
    }
    while (pos < text.size() && is_digit(text[pos])) {
        pos++;
    }
    return pos == text.size();
}

std::string format_node_id(std::string_view node_id, NodeIdFormat format) {
    if (format == NodeIdFormat::Raw) {
        return std::string(node_id);
    }
    std::string cleaned;
    cleaned.reserve(node_id.size());
    for (char c : node_id) {
        if (c != '!') {
            cleaned += c;
        }
    }
    return cleaned;
}

std::string metric_name_for_key(std::string_view key) {
    std::string name(kMetricPrefix);
    for (char c : key) {
        if (c == ' ') {
            name += '_';
        } else {
            name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return name;
}

std::vector<MetricLine> render_device_metrics(
    const Device& device, const TelemetryReading& reading, const RenderOptions& options) {
    std::vector<MetricLine> lines;
    const std::string node = format_node_id(device.node_id, options.node_id_format);

    for (const auto& [key, value] : reading) {
        std::string name = metric_name_for_key(key);
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::int64_t>) {
                    lines.push_back(sample_line(std::move(name), node, std::to_string(v)));
                } else if constexpr (std::is_same_v<T, double>) {
                    lines.push_back(sample_line(std::move(name), node, format_sample_value(v)));
                } else if (is_numeric_value(v)) {
                    lines.push_back(sample_line(std::move(name), node, v));
                } else {
                    lines.push_back(info_line(std::move(name), node, "str", v));
                }
            },
            value);
    }

    if (!device.contact_name.empty()) {
        lines.push_back(info_line("meshtastic_contact", node, "contact", device.contact_name));
    }
    if (!device.location.empty()) {
        lines.push_back(info_line("meshtastic_location", node, "location", device.location));
    }
    // Coordinates are sample values; text like "N/A" would make the whole file unparseable, so it is left out.
    // The roster loader warns about such entries once at load time.
    if (is_numeric_value(device.latitude)) {
        lines.push_back(sample_line("meshtastic_latitude", node, device.latitude));
    }
    if (is_numeric_value(device.longitude)) {
        lines.push_back(sample_line("meshtastic_longitude", node, device.longitude));
    }

    lines.push_back(MetricLine{
        .name = "meshtastic_up",
        .labels = {{"node", node}, {"version", options.version}},
        .value = reading.empty() ? "0" : "1"});

    return lines;
}

}  // namespace meshmetrics

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <telemetry/metric_line.hpp>

namespace meshmetrics {

std::string escape_label_value(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"': escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string MetricLine::to_exposition() const {
    std::string output = name;
    if (!labels.empty()) {
        output += '{';
        bool first_label = true;
        for (const auto& [label_name, label_value] : labels) {
            if (!first_label) {
                output += ',';
            }
            output += label_name;
            output += "=\"";
            output += escape_label_value(label_value);
            output += '"';
            first_label = false;
        }
        output += '}';
    }
    output += ' ';
    output += value;
    return output;
}

std::optional<std::string> MetricLine::label(std::string_view label_name) const {
    for (const auto& [name, value] : labels) {
        if (name == label_name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string format_exposition(const Snapshot& snapshot) {
    std::string output;
    for (const auto& line : snapshot) {
        output += line.to_exposition();
        output += '\n';
    }
    return output;
}

std::string format_exposition(const std::vector<const MetricLine*>& lines) {
    std::string output;
    for (const MetricLine* line : lines) {
        output += line->to_exposition();
        output += '\n';
    }
    return output;
}

}  // namespace meshmetrics

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshmetrics {

// A fully rendered exposition record, independent of the sink it ends up in.
struct MetricLine {
    std::string name;
    std::vector<std::pair<std::string, std::string>> labels;
    std::string value;

    // name{label="value",...} value -- no trailing newline
    std::string to_exposition() const;

    std::optional<std::string> label(std::string_view label_name) const;

    bool operator==(const MetricLine&) const = default;
};

// All lines of one poll cycle, in render order.
using Snapshot = std::vector<MetricLine>;

// Backslash, double quote and newline escaping for label values.
std::string escape_label_value(std::string_view value);

// One line per MetricLine, each newline-terminated. An empty snapshot yields an empty string.
std::string format_exposition(const Snapshot& snapshot);
std::string format_exposition(const std::vector<const MetricLine*>& lines);

}  // namespace meshmetrics

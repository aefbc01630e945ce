// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * telemetry/device.hpp
 *
 * Roster entries and the per-cycle telemetry readings fetched for them.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace meshmetrics {

// One roster entry. Only node_id is mandatory; the remaining fields are static metadata rendered as info metrics.
struct Device {
    std::string node_id;
    std::string contact_name;
    std::string location;
    std::string latitude;
    std::string longitude;

    bool operator==(const Device&) const = default;
};

using TelemetryValue = std::variant<std::int64_t, double, std::string>;

// Insertion-ordered key -> value map. Keys absent from a reading are simply not rendered that cycle.
class TelemetryReading {
public:
    using Entry = std::pair<std::string, TelemetryValue>;

    TelemetryReading() = default;
    TelemetryReading(std::initializer_list<Entry> entries) {
        for (const auto& [key, value] : entries) {
            set(key, value);
        }
    }

    // Replaces the value of an existing key in place, keeping its original position.
    void set(std::string key, TelemetryValue value) {
        for (auto& entry : entries_) {
            if (entry.first == key) {
                entry.second = std::move(value);
                return;
            }
        }
        entries_.emplace_back(std::move(key), std::move(value));
    }

    const TelemetryValue* find(std::string_view key) const {
        for (const auto& entry : entries_) {
            if (entry.first == key) {
                return &entry.second;
            }
        }
        return nullptr;
    }

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

}  // namespace meshmetrics

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace meshmetrics {

// Health counters. Counters only ever increase for the lifetime of the process; only the poll loop thread
// mutates them.
struct DaemonStats {
    std::string start_time;  // ISO-8601 local time, empty until the loop starts
    std::string last_poll_time;

    uint64_t total_polls = 0;
    uint64_t successful_polls = 0;
    uint64_t failed_polls = 0;
    uint64_t nodes_processed = 0;
    uint64_t nodes_successful = 0;
    uint64_t push_successful = 0;
    uint64_t push_failed = 0;

    // One finished cycle: a cycle is successful when at least one node returned data.
    void record_poll(uint64_t nodes_polled, uint64_t nodes_with_data);
    void record_push(bool ok);
};

void to_json(nlohmann::json& j, const DaemonStats& stats);

// Rewrites the stats file atomically as indented JSON, creating the parent directory if needed.
// Throws std::system_error on I/O failure.
void write_stats_file(const std::filesystem::path& path, const DaemonStats& stats);

// e.g. "2025-03-14T09:26:53.589793"
std::string current_iso_timestamp();

}  // namespace meshmetrics

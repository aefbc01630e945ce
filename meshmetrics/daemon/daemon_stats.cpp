// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <ctime>

#include <fmt/format.h>

#include <daemon/daemon_stats.hpp>
#include <utils/atomic_file.hpp>

namespace meshmetrics {

namespace {

nlohmann::json timestamp_or_null(const std::string& timestamp) {
    if (timestamp.empty()) {
        return nullptr;
    }
    return timestamp;
}

}  // namespace

void DaemonStats::record_poll(uint64_t nodes_polled, uint64_t nodes_with_data) {
    total_polls++;
    if (nodes_with_data > 0) {
        successful_polls++;
    } else {
        failed_polls++;
    }
    nodes_processed += nodes_polled;
    nodes_successful += nodes_with_data;
    last_poll_time = current_iso_timestamp();
}

void DaemonStats::record_push(bool ok) {
    if (ok) {
        push_successful++;
    } else {
        push_failed++;
    }
}

void to_json(nlohmann::json& j, const DaemonStats& stats) {
    j = nlohmann::json{
        {"start_time", timestamp_or_null(stats.start_time)},
        {"last_poll", timestamp_or_null(stats.last_poll_time)},
        {"total_polls", stats.total_polls},
        {"successful_polls", stats.successful_polls},
        {"failed_polls", stats.failed_polls},
        {"nodes_processed", stats.nodes_processed},
        {"nodes_successful", stats.nodes_successful},
        {"push_successful", stats.push_successful},
        {"push_failed", stats.push_failed},
    };
}

void write_stats_file(const std::filesystem::path& path, const DaemonStats& stats) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    nlohmann::json j = stats;
    write_file_atomic(path, j.dump(2) + "\n");
}

std::string current_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1'000'000;

    std::tm local{};
    localtime_r(&seconds, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
    return fmt::format("{}.{:06d}", buffer, micros);
}

}  // namespace meshmetrics

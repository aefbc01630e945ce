// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <tt-logger/tt-logger.hpp>

#include <delivery/snapshot_publisher.hpp>

namespace meshmetrics {

std::string sanitize_node_filename(std::string_view node_id) {
    std::string sanitized;
    sanitized.reserve(node_id.size());
    for (char c : node_id) {
        if (c == '!') {
            continue;
        }
        if (c == '/' || c == '\\' || c == '\0') {
            sanitized += '_';
        } else {
            sanitized += c;
        }
    }

    if (sanitized.empty() || sanitized == "." || sanitized == "..") {
        throw std::invalid_argument(fmt::format("Node id '{}' does not yield a usable file name", node_id));
    }
    return sanitized;
}

std::filesystem::path per_node_file_name(std::string_view node_id) {
    return fmt::format("meshtastic-{}.prom", sanitize_node_filename(node_id));
}

SnapshotPublisher::SnapshotPublisher(SnapshotPublisherConfig config) : config_(std::move(config)) {}

void SnapshotPublisher::write_one(const std::filesystem::path& target, std::string_view content) const {
    if (config_.atomic_writes) {
        write_file_atomic(target, content, before_replace_);
    } else {
        write_file_in_place(target, content);
    }
}

DeliveryResult SnapshotPublisher::publish(const Snapshot& snapshot) const {
    if (!enabled()) {
        return DeliveryResult::Success();
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        return DeliveryResult::Failure(
            fmt::format("Cannot create output directory {}: {}", config_.directory.string(), ec.message()));
    }

    return config_.individual_files ? publish_per_node(snapshot) : publish_combined(snapshot);
}

DeliveryResult SnapshotPublisher::publish_combined(const Snapshot& snapshot) const {
    std::filesystem::path target = config_.directory / kCombinedMetricsFile;
    try {
        write_one(target, format_exposition(snapshot));
    } catch (const std::exception& e) {
        return DeliveryResult::Failure(fmt::format("Failed to write output file {}: {}", target.string(), e.what()));
    }
    log_debug(tt::LogAlways, "Wrote {} metrics to {}", snapshot.size(), target.string());
    return DeliveryResult::Success();
}

DeliveryResult SnapshotPublisher::publish_per_node(const Snapshot& snapshot) const {
    // Group by node label, preserving the order nodes first appear in
    std::vector<std::string> node_order;
    std::unordered_map<std::string, std::vector<const MetricLine*>> lines_by_node;
    for (const auto& line : snapshot) {
        auto node = line.label("node");
        if (!node) {
            continue;
        }
        auto [it, inserted] = lines_by_node.try_emplace(*node);
        if (inserted) {
            node_order.push_back(*node);
        }
        it->second.push_back(&line);
    }

    // File name -> node that owns it this cycle. The first node wins; a later one is reported instead of
    // overwriting its data.
    std::unordered_map<std::string, std::string> file_owners;
    std::vector<std::string> errors;
    for (const auto& node : node_order) {
        try {
            std::filesystem::path file_name = per_node_file_name(node);
            auto [owner, inserted] = file_owners.try_emplace(file_name.string(), node);
            if (!inserted) {
                errors.push_back(fmt::format(
                    "Node {} maps to file {} already used by node {}", node, file_name.string(), owner->second));
                continue;
            }
            write_one(config_.directory / file_name, format_exposition(lines_by_node.at(node)));
        } catch (const std::exception& e) {
            errors.push_back(fmt::format("Failed to write individual file for node {}: {}", node, e.what()));
        }
    }

    if (!errors.empty()) {
        return DeliveryResult::Failure(fmt::format("{}", fmt::join(errors, "; ")));
    }
    log_debug(tt::LogAlways, "Wrote {} per-node metrics files to {}", node_order.size(), config_.directory.string());
    return DeliveryResult::Success();
}

}  // namespace meshmetrics

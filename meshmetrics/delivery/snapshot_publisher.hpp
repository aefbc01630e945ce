// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <delivery/snapshot_sink.hpp>
#include <utils/atomic_file.hpp>

namespace meshmetrics {

inline constexpr std::string_view kCombinedMetricsFile = "meshtastic.prom";

using PublishResult = DeliveryResult;

struct SnapshotPublisherConfig {
    std::filesystem::path directory;  // empty disables the file sink
    bool individual_files = false;    // one meshtastic-<node>.prom per device instead of one combined file
    bool atomic_writes = true;
};

// "!a1b2c3d4" -> "a1b2c3d4", "a/b" -> "a_b". Throws std::invalid_argument if nothing usable remains. Distinct ids
// can sanitize to the same name ("!abc" and "abc"); publish() refuses the second one rather than overwrite.
std::string sanitize_node_filename(std::string_view node_id);

std::filesystem::path per_node_file_name(std::string_view node_id);

/**
 * Publishes snapshots as Prometheus textfile-collector files. Every file is replaced atomically (see
 * write_file_atomic), so a scraper never sees a truncated or mixed file and a failed cycle leaves the previous
 * good file in place.
 */
class SnapshotPublisher : public SnapshotSink {
public:
    explicit SnapshotPublisher(SnapshotPublisherConfig config);

    std::string_view name() const override { return "file"; }
    bool enabled() const override { return !config_.directory.empty(); }
    DeliveryResult deliver(const Snapshot& snapshot) const override { return publish(snapshot); }

    PublishResult publish(const Snapshot& snapshot) const;

    const SnapshotPublisherConfig& config() const { return config_; }

    // Test hook: runs between temporary-file write and rename for every file this publisher writes.
    void set_before_replace_hook(BeforeReplaceHook hook) { before_replace_ = std::move(hook); }

private:
    void write_one(const std::filesystem::path& target, std::string_view content) const;

    PublishResult publish_combined(const Snapshot& snapshot) const;
    PublishResult publish_per_node(const Snapshot& snapshot) const;

    SnapshotPublisherConfig config_;
    BeforeReplaceHook before_replace_;
};

}  // namespace meshmetrics

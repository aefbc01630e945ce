// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * daemon/daemon_config.hpp
 *
 * The daemon's YAML configuration. A loaded DaemonConfig is never mutated: a reload produces a new value with
 * version + 1, shared as std::shared_ptr<const DaemonConfig> and adopted by each component between cycles.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <telemetry/metric_renderer.hpp>

namespace meshmetrics {

inline constexpr std::string_view kDefaultConfigPath = "/etc/meshtastic-telemetry/meshmetricsd.yaml";

struct DaemonSettings {
    std::chrono::seconds poll_interval{300};
    std::string log_level = "INFO";
    std::string log_file;
    std::string pid_file;
    std::string user;
    std::string group;
    std::chrono::seconds error_cooldown{60};
};

struct SourceSettings {
    std::string mode = "serial";
    std::string port = "/dev/ttyACM0";
    std::chrono::seconds dwell_time{10};
    std::chrono::seconds fetch_timeout{30};
};

struct RosterSettings {
    std::string file = "/etc/meshtastic-telemetry/devices.csv";
    bool encrypted = false;
    std::string password_file;
};

struct OutputSettings {
    std::string directory = "/var/lib/node_exporter/textfile_collector";
    bool individual_files = false;
    bool atomic_writes = true;
    NodeIdFormat node_id_format = NodeIdFormat::Raw;
};

struct PushSettings {
    std::string push_url;
    std::string job_name = "meshtastic_repeater_telemetry";
    std::string instance;
    std::chrono::seconds timeout{30};
};

struct MonitoringSettings {
    bool enable_stats = true;
    std::string stats_file = "/var/lib/meshtastic-telemetry/stats.json";
};

struct DaemonConfig {
    DaemonSettings daemon;
    SourceSettings source;
    RosterSettings roster;
    OutputSettings output;
    PushSettings push;
    MonitoringSettings monitoring;

    uint64_t version = 0;
    std::filesystem::path source_path;  // empty when built from defaults only
};

using DaemonConfigPtr = std::shared_ptr<const DaemonConfig>;

// Command line values that take precedence over the file. Unset fields leave the file value in place.
struct ConfigOverrides {
    std::optional<std::string> pid_file;
    std::optional<std::string> log_file;
    std::optional<std::string> user;
    std::optional<std::string> group;
};

/**
 * Parses YAML text into a config. Missing sections and keys keep their defaults. Throws std::runtime_error
 * (via MESHMETRICS_FATAL) naming the offending key when a value has the wrong type or fails validation.
 */
DaemonConfig parse_daemon_config(std::string_view yaml_text);

/**
 * Loads the file at path. A missing file yields the defaults, with a warning, so the daemon can start on a fresh
 * install. previous_version is the version of the config being replaced; the result carries previous_version + 1.
 */
DaemonConfig load_daemon_config(const std::filesystem::path& path, uint64_t previous_version = 0);

void apply_overrides(DaemonConfig& config, const ConfigOverrides& overrides);

// Throws std::runtime_error describing the first invalid value.
void validate(const DaemonConfig& config);

// Effective configuration as YAML, for --test-config.
std::string describe(const DaemonConfig& config);

}  // namespace meshmetrics

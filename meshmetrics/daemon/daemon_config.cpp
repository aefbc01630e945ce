// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

#include <daemon/daemon_config.hpp>
#include <daemon/logging.hpp>
#include <delivery/push_client.hpp>
#include <telemetry/telemetry_source.hpp>
#include <utils/assert.hpp>

namespace meshmetrics {

namespace {

// Reads node[section][key] into value when present. yaml-cpp's conversion errors are rethrown with the key name
// so that the operator knows which line to fix.
template <typename T>
void read_key(const YAML::Node& root, const char* section, const char* key, T& value) {
    const YAML::Node section_node = root[section];
    if (!section_node) {
        return;
    }
    MESHMETRICS_FATAL(section_node.IsMap(), "Config section '{}' must be a mapping", section);
    const YAML::Node node = section_node[key];
    if (!node || node.IsNull()) {
        return;
    }
    try {
        value = node.as<T>();
    } catch (const YAML::Exception& e) {
        MESHMETRICS_THROW("Invalid value for {}.{}: {}", section, key, e.what());
    }
}

void read_seconds(const YAML::Node& root, const char* section, const char* key, std::chrono::seconds& value) {
    int64_t count = value.count();
    read_key(root, section, key, count);
    value = std::chrono::seconds(count);
}

void read_string(const YAML::Node& root, const char* section, const char* key, std::string& value) {
    read_key(root, section, key, value);
}

DaemonConfig config_from_yaml(const YAML::Node& root) {
    DaemonConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    MESHMETRICS_FATAL(root.IsMap(), "Config must be a YAML mapping of sections");

    read_seconds(root, "daemon", "poll_interval", config.daemon.poll_interval);
    read_string(root, "daemon", "log_level", config.daemon.log_level);
    read_string(root, "daemon", "log_file", config.daemon.log_file);
    read_string(root, "daemon", "pid_file", config.daemon.pid_file);
    read_string(root, "daemon", "user", config.daemon.user);
    read_string(root, "daemon", "group", config.daemon.group);
    read_seconds(root, "daemon", "error_cooldown", config.daemon.error_cooldown);

    read_string(root, "meshtastic", "mode", config.source.mode);
    read_string(root, "meshtastic", "port", config.source.port);
    read_seconds(root, "meshtastic", "dwell_time", config.source.dwell_time);
    read_seconds(root, "meshtastic", "fetch_timeout", config.source.fetch_timeout);

    read_string(root, "devices", "file", config.roster.file);
    read_key(root, "devices", "encrypted", config.roster.encrypted);
    read_string(root, "devices", "password_file", config.roster.password_file);

    read_string(root, "output", "directory", config.output.directory);
    read_key(root, "output", "individual_files", config.output.individual_files);
    read_key(root, "output", "atomic_writes", config.output.atomic_writes);
    std::string node_id_format(node_id_format_name(config.output.node_id_format));
    read_string(root, "output", "node_id_format", node_id_format);
    auto parsed_format = parse_node_id_format(node_id_format);
    MESHMETRICS_FATAL(
        parsed_format.has_value(),
        "Invalid value for output.node_id_format: '{}' (expected raw, default or clean)",
        node_id_format);
    config.output.node_id_format = *parsed_format;

    read_string(root, "prometheus", "push_url", config.push.push_url);
    read_string(root, "prometheus", "job_name", config.push.job_name);
    read_string(root, "prometheus", "instance", config.push.instance);
    read_seconds(root, "prometheus", "timeout", config.push.timeout);

    read_key(root, "monitoring", "enable_stats", config.monitoring.enable_stats);
    read_string(root, "monitoring", "stats_file", config.monitoring.stats_file);

    validate(config);
    return config;
}

}  // namespace

DaemonConfig parse_daemon_config(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        MESHMETRICS_THROW("Failed to parse config: {}", e.what());
    }
    return config_from_yaml(root);
}

DaemonConfig load_daemon_config(const std::filesystem::path& path, uint64_t previous_version) {
    DaemonConfig config;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch (const YAML::Exception& e) {
            MESHMETRICS_THROW("Failed to read config file {}: {}", path.string(), e.what());
        }
        config = config_from_yaml(root);
        log_info(tt::LogAlways, "Loaded configuration from {}", path.string());
    } else {
        log_warning(tt::LogAlways, "Config file {} not found, using defaults", path.string());
    }
    config.source_path = path;
    config.version = previous_version + 1;
    return config;
}

void apply_overrides(DaemonConfig& config, const ConfigOverrides& overrides) {
    if (overrides.pid_file) {
        config.daemon.pid_file = *overrides.pid_file;
    }
    if (overrides.log_file) {
        config.daemon.log_file = *overrides.log_file;
    }
    if (overrides.user) {
        config.daemon.user = *overrides.user;
    }
    if (overrides.group) {
        config.daemon.group = *overrides.group;
    }
}

void validate(const DaemonConfig& config) {
    MESHMETRICS_FATAL(
        config.daemon.poll_interval.count() > 0,
        "Invalid value for daemon.poll_interval: {} (must be positive)",
        config.daemon.poll_interval.count());
    MESHMETRICS_FATAL(
        logging::parse_level(config.daemon.log_level).has_value(),
        "Invalid value for daemon.log_level: '{}' (expected DEBUG, INFO, WARNING, ERROR or CRITICAL)",
        config.daemon.log_level);
    MESHMETRICS_FATAL(
        config.daemon.error_cooldown.count() >= 0,
        "Invalid value for daemon.error_cooldown: {} (must not be negative)",
        config.daemon.error_cooldown.count());
    MESHMETRICS_FATAL(
        config.source.dwell_time.count() >= 0,
        "Invalid value for meshtastic.dwell_time: {} (must not be negative)",
        config.source.dwell_time.count());
    MESHMETRICS_FATAL(
        config.source.fetch_timeout.count() > 0,
        "Invalid value for meshtastic.fetch_timeout: {} (must be positive)",
        config.source.fetch_timeout.count());
    MESHMETRICS_FATAL(
        is_known_source_mode(config.source.mode),
        "Invalid value for meshtastic.mode: '{}' (expected serial, ip, mock or json)",
        config.source.mode);
    MESHMETRICS_FATAL(
        config.push.timeout.count() > 0,
        "Invalid value for prometheus.timeout: {} (must be positive)",
        config.push.timeout.count());
    MESHMETRICS_FATAL(!config.push.job_name.empty(), "Invalid value for prometheus.job_name: must not be empty");
    if (!config.push.push_url.empty()) {
        MESHMETRICS_FATAL(
            parse_push_url(config.push.push_url).has_value(),
            "Invalid value for prometheus.push_url: '{}'",
            config.push.push_url);
    }
    MESHMETRICS_FATAL(
        !config.roster.encrypted || !config.roster.password_file.empty(),
        "devices.password_file is required when devices.encrypted is true");
}

std::string describe(const DaemonConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "daemon" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "poll_interval" << YAML::Value << config.daemon.poll_interval.count();
    out << YAML::Key << "log_level" << YAML::Value << config.daemon.log_level;
    out << YAML::Key << "log_file" << YAML::Value << config.daemon.log_file;
    out << YAML::Key << "pid_file" << YAML::Value << config.daemon.pid_file;
    out << YAML::Key << "user" << YAML::Value << config.daemon.user;
    out << YAML::Key << "group" << YAML::Value << config.daemon.group;
    out << YAML::Key << "error_cooldown" << YAML::Value << config.daemon.error_cooldown.count();
    out << YAML::EndMap;

    out << YAML::Key << "meshtastic" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "mode" << YAML::Value << config.source.mode;
    out << YAML::Key << "port" << YAML::Value << config.source.port;
    out << YAML::Key << "dwell_time" << YAML::Value << config.source.dwell_time.count();
    out << YAML::Key << "fetch_timeout" << YAML::Value << config.source.fetch_timeout.count();
    out << YAML::EndMap;

    out << YAML::Key << "devices" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "file" << YAML::Value << config.roster.file;
    out << YAML::Key << "encrypted" << YAML::Value << config.roster.encrypted;
    out << YAML::Key << "password_file" << YAML::Value << config.roster.password_file;
    out << YAML::EndMap;

    out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "directory" << YAML::Value << config.output.directory;
    out << YAML::Key << "individual_files" << YAML::Value << config.output.individual_files;
    out << YAML::Key << "atomic_writes" << YAML::Value << config.output.atomic_writes;
    out << YAML::Key << "node_id_format" << YAML::Value
        << std::string(node_id_format_name(config.output.node_id_format));
    out << YAML::EndMap;

    out << YAML::Key << "prometheus" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "push_url" << YAML::Value << config.push.push_url;
    out << YAML::Key << "job_name" << YAML::Value << config.push.job_name;
    out << YAML::Key << "instance" << YAML::Value << config.push.instance;
    out << YAML::Key << "timeout" << YAML::Value << config.push.timeout.count();
    out << YAML::EndMap;

    out << YAML::Key << "monitoring" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enable_stats" << YAML::Value << config.monitoring.enable_stats;
    out << YAML::Key << "stats_file" << YAML::Value << config.monitoring.stats_file;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

}  // namespace meshmetrics

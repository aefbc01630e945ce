// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <daemon/daemon_config.hpp>
#include <daemon/daemon_stats.hpp>
#include <daemon/logging.hpp>

#include "test_helpers.hpp"

using namespace meshmetrics;
using meshmetrics::testing::read_text_file;
using meshmetrics::testing::TempDirTest;
using meshmetrics::testing::write_text_file;
using ::testing::HasSubstr;

TEST(DaemonConfigTest, EmptyDocumentYieldsDefaults) {
    DaemonConfig config = parse_daemon_config("");

    EXPECT_EQ(config.daemon.poll_interval, std::chrono::seconds(300));
    EXPECT_EQ(config.daemon.log_level, "INFO");
    EXPECT_EQ(config.daemon.error_cooldown, std::chrono::seconds(60));
    EXPECT_EQ(config.source.mode, "serial");
    EXPECT_EQ(config.source.port, "/dev/ttyACM0");
    EXPECT_EQ(config.source.dwell_time, std::chrono::seconds(10));
    EXPECT_EQ(config.source.fetch_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.roster.file, "/etc/meshtastic-telemetry/devices.csv");
    EXPECT_FALSE(config.roster.encrypted);
    EXPECT_EQ(config.output.directory, "/var/lib/node_exporter/textfile_collector");
    EXPECT_FALSE(config.output.individual_files);
    EXPECT_TRUE(config.output.atomic_writes);
    EXPECT_EQ(config.output.node_id_format, NodeIdFormat::Raw);
    EXPECT_EQ(config.push.push_url, "");
    EXPECT_EQ(config.push.job_name, "meshtastic_repeater_telemetry");
    EXPECT_EQ(config.push.timeout, std::chrono::seconds(30));
    EXPECT_TRUE(config.monitoring.enable_stats);
    EXPECT_EQ(config.monitoring.stats_file, "/var/lib/meshtastic-telemetry/stats.json");
}

TEST(DaemonConfigTest, ExplicitValuesOverrideDefaultsPerKey) {
    DaemonConfig config = parse_daemon_config(R"(
daemon:
  poll_interval: 120
  log_level: debug
meshtastic:
  mode: mock
  dwell_time: 0
output:
  individual_files: true
  node_id_format: clean
prometheus:
  push_url: http://gateway:9091
  instance: repeater-1
)");

    EXPECT_EQ(config.daemon.poll_interval, std::chrono::seconds(120));
    EXPECT_EQ(config.daemon.log_level, "debug");
    EXPECT_EQ(config.source.mode, "mock");
    EXPECT_EQ(config.source.dwell_time, std::chrono::seconds(0));
    EXPECT_EQ(config.source.port, "/dev/ttyACM0");
    EXPECT_TRUE(config.output.individual_files);
    EXPECT_EQ(config.output.node_id_format, NodeIdFormat::Clean);
    EXPECT_EQ(config.push.push_url, "http://gateway:9091");
    EXPECT_EQ(config.push.instance, "repeater-1");
    EXPECT_EQ(config.push.job_name, "meshtastic_repeater_telemetry");
}

TEST(DaemonConfigTest, RejectsInvalidValuesNamingTheKey) {
    auto expect_rejected = [](const char* yaml, const char* key) {
        try {
            parse_daemon_config(yaml);
            ADD_FAILURE() << "accepted: " << yaml;
        } catch (const std::runtime_error& e) {
            EXPECT_THAT(e.what(), HasSubstr(key));
        }
    };

    expect_rejected("daemon: {poll_interval: -5}", "daemon.poll_interval");
    expect_rejected("daemon: {poll_interval: soon}", "daemon.poll_interval");
    expect_rejected("daemon: {log_level: chatty}", "daemon.log_level");
    expect_rejected("meshtastic: {dwell_time: -1}", "meshtastic.dwell_time");
    expect_rejected("meshtastic: {mode: carrier-pigeon}", "meshtastic.mode");
    expect_rejected("output: {node_id_format: fancy}", "output.node_id_format");
    expect_rejected("prometheus: {push_url: 'gateway:9091'}", "prometheus.push_url");
    expect_rejected("devices: {encrypted: true}", "devices.password_file");
}

TEST(DaemonConfigTest, MalformedYamlIsRejected) {
    EXPECT_THROW(parse_daemon_config("daemon: [unclosed"), std::runtime_error);
    EXPECT_THROW(parse_daemon_config("- just\n- a list\n"), std::runtime_error);
}

TEST(DaemonConfigTest, OverridesReplaceFileValues) {
    DaemonConfig config = parse_daemon_config("daemon: {pid_file: /run/a.pid, user: nobody}");
    apply_overrides(config, ConfigOverrides{.pid_file = "/run/b.pid", .group = "nogroup"});

    EXPECT_EQ(config.daemon.pid_file, "/run/b.pid");
    EXPECT_EQ(config.daemon.user, "nobody");
    EXPECT_EQ(config.daemon.group, "nogroup");
}

TEST(DaemonConfigTest, DescribeRoundTripsThroughParser) {
    DaemonConfig config =
        parse_daemon_config("meshtastic: {mode: json, port: /tmp/bridge.json}\noutput: {node_id_format: clean}");
    DaemonConfig reparsed = parse_daemon_config(describe(config));

    EXPECT_EQ(reparsed.source.mode, "json");
    EXPECT_EQ(reparsed.source.port, "/tmp/bridge.json");
    EXPECT_EQ(reparsed.output.node_id_format, NodeIdFormat::Clean);
    EXPECT_EQ(reparsed.daemon.poll_interval, config.daemon.poll_interval);
}

class DaemonConfigFileTest : public TempDirTest {};

TEST_F(DaemonConfigFileTest, VersionIncrementsOnEachLoad) {
    auto path = temp_dir / "meshmetricsd.yaml";
    write_text_file(path, "daemon: {poll_interval: 60}\n");

    DaemonConfig first = load_daemon_config(path);
    EXPECT_EQ(first.version, 1);
    EXPECT_EQ(first.source_path.string(), path.string());

    write_text_file(path, "daemon: {poll_interval: 90}\n");
    DaemonConfig second = load_daemon_config(path, first.version);
    EXPECT_EQ(second.version, 2);
    EXPECT_EQ(second.daemon.poll_interval, std::chrono::seconds(90));
}

TEST_F(DaemonConfigFileTest, MissingFileYieldsDefaults) {
    DaemonConfig config = load_daemon_config(temp_dir / "absent.yaml");
    EXPECT_EQ(config.version, 1);
    EXPECT_EQ(config.daemon.poll_interval, std::chrono::seconds(300));
}

TEST(DaemonStatsTest, RecordPollAccumulates) {
    DaemonStats stats;
    stats.record_poll(3, 2);
    stats.record_poll(3, 0);
    stats.record_push(true);
    stats.record_push(false);
    stats.record_push(false);

    EXPECT_EQ(stats.total_polls, 2);
    EXPECT_EQ(stats.successful_polls, 1);
    EXPECT_EQ(stats.failed_polls, 1);
    EXPECT_EQ(stats.nodes_processed, 6);
    EXPECT_EQ(stats.nodes_successful, 2);
    EXPECT_EQ(stats.push_successful, 1);
    EXPECT_EQ(stats.push_failed, 2);
}

TEST(DaemonStatsTest, SerializesDocumentedFieldNames) {
    DaemonStats stats;
    stats.start_time = "2025-03-14T09:26:53.589793";
    stats.record_poll(2, 1);

    nlohmann::json j = stats;

    for (const char* key :
         {"start_time",
          "last_poll",
          "total_polls",
          "successful_polls",
          "failed_polls",
          "nodes_processed",
          "nodes_successful",
          "push_successful",
          "push_failed"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j.size(), 9);
    EXPECT_EQ(j["start_time"], "2025-03-14T09:26:53.589793");
    EXPECT_EQ(j["nodes_successful"], 1);
}

TEST(DaemonStatsTest, UnsetTimestampsSerializeAsNull) {
    nlohmann::json j = DaemonStats{};
    EXPECT_TRUE(j["start_time"].is_null());
    EXPECT_TRUE(j["last_poll"].is_null());
}

TEST(DaemonStatsTest, IsoTimestampShape) {
    std::string timestamp = current_iso_timestamp();
    ASSERT_EQ(timestamp.size(), 26);
    EXPECT_EQ(timestamp[4], '-');
    EXPECT_EQ(timestamp[10], 'T');
    EXPECT_EQ(timestamp[19], '.');
}

class DaemonStatsFileTest : public TempDirTest {};

TEST_F(DaemonStatsFileTest, WritesIndentedJson) {
    DaemonStats stats;
    stats.record_poll(1, 1);
    auto path = temp_dir / "nested" / "stats.json";

    write_stats_file(path, stats);

    std::string text = read_text_file(path);
    EXPECT_THAT(text, HasSubstr("\n  \"total_polls\": 1"));
    EXPECT_EQ(nlohmann::json::parse(text)["total_polls"], 1);
}

TEST(LoggingLevelTest, AcceptsConfigNamesInAnyCase) {
    EXPECT_EQ(logging::parse_level("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("info"), spdlog::level::info);
    EXPECT_EQ(logging::parse_level("Warning"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("ERROR"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("critical"), spdlog::level::critical);
    EXPECT_FALSE(logging::parse_level("verbose").has_value());
}

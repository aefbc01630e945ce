// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <daemon/cli_commands.hpp>
#include <telemetry/roster_crypto.hpp>
#include <telemetry/roster_loader.hpp>
#include <utils/assert.hpp>
#include <utils/atomic_file.hpp>
#include <utils/version.hpp>

namespace meshmetrics::cli {

namespace {

std::string_view or_dash(const std::string& value) { return value.empty() ? std::string_view("-") : value; }

}  // namespace

int test_config(const LifecycleOptions& options, std::ostream& out, std::ostream& err) {
    DaemonConfig config;
    try {
        config = load_effective_config(options);
    } catch (const std::exception& e) {
        fmt::print(err, "Configuration error: {}\n", assert::short_message(e));
        return 1;
    }

    fmt::print(out, "meshmetricsd {}\n", kDaemonVersion);
    fmt::print(out, "Config file: {}\n", options.config_path.string());
    fmt::print(out, "Foreground: {}\n", options.foreground);
    fmt::print(out, "{}\n", describe(config));

    try {
        auto devices = load_configured_roster(config);
        fmt::print(out, "Roster: {} devices loaded from {}\n", devices.size(), config.roster.file);
    } catch (const std::exception& e) {
        fmt::print(out, "Roster: failed to load {}: {}\n", config.roster.file, assert::short_message(e));
    }
    return 0;
}

int list_devices(const LifecycleOptions& options, std::ostream& out, std::ostream& err) {
    try {
        DaemonConfig config = load_effective_config(options);
        for (const auto& device : load_configured_roster(config)) {
            fmt::print(
                out,
                "{}\t{}\t{}\t{}\t{}\n",
                device.node_id,
                or_dash(device.contact_name),
                or_dash(device.location),
                or_dash(device.latitude),
                or_dash(device.longitude));
        }
        return 0;
    } catch (const std::exception& e) {
        fmt::print(err, "Error: {}\n", assert::short_message(e));
        return 1;
    }
}

int encrypt_roster_file(
    const LifecycleOptions& options,
    const std::filesystem::path& input,
    const std::filesystem::path& output,
    std::ostream& out,
    std::ostream& err) {
    try {
        DaemonConfig config = load_effective_config(options);
        MESHMETRICS_FATAL(
            !config.roster.password_file.empty(), "devices.password_file must be set to encrypt a roster");
        std::string password = read_password_file(config.roster.password_file);
        MESHMETRICS_FATAL(!password.empty(), "Password file {} is empty", config.roster.password_file);

        std::ifstream in(input, std::ios::binary);
        MESHMETRICS_FATAL(in.is_open(), "Cannot open {}", input.string());
        std::stringstream buffer;
        buffer << in.rdbuf();
        std::string plaintext = buffer.str();

        // Refuse to encrypt something the daemon could not load afterwards
        auto devices = parse_roster_csv(plaintext);

        write_file_atomic(output, encrypt_roster(plaintext, password));
        fmt::print(out, "Encrypted {} devices from {} to {}\n", devices.size(), input.string(), output.string());
        return 0;
    } catch (const std::exception& e) {
        fmt::print(err, "Error: {}\n", assert::short_message(e));
        return 1;
    }
}

}  // namespace meshmetrics::cli

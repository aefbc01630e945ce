// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include <daemon/cli_commands.hpp>
#include <daemon/lifecycle_controller.hpp>
#include <utils/version.hpp>

int main(int argc, char* argv[]) {
    using namespace meshmetrics;

    cxxopts::Options options("meshmetricsd", "Meshtastic Telemetry Daemon");

    options.add_options()(
        "c,config",
        "Configuration file",
        cxxopts::value<std::string>()->default_value(std::string(kDefaultConfigPath)))(
        "f,foreground", "Run in foreground (don't daemonize)")(
        "p,pid-file", "PID file path", cxxopts::value<std::string>())(
        "l,log-file", "Log file path (overrides config)", cxxopts::value<std::string>())(
        "u,user", "Run as user (drop privileges)", cxxopts::value<std::string>())(
        "g,group", "Run as group (drop privileges)", cxxopts::value<std::string>())(
        "t,test-config", "Print the effective configuration and exit")(
        "list-devices", "Load the device roster and print it")(
        "once", "Poll every device once, deliver, and exit")(
        "encrypt-roster",
        "Encrypt a CSV roster using the configured password file",
        cxxopts::value<std::vector<std::string>>(),
        "IN,OUT")("version", "Print version and exit")("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << '\n';
        std::cerr << options.help() << '\n';
        return 2;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    if (result.count("version")) {
        std::cout << kDaemonVersion << std::endl;
        return 0;
    }
    if (!result.unmatched().empty()) {
        std::cerr << "Unexpected argument: " << result.unmatched().front() << '\n';
        std::cerr << options.help() << '\n';
        return 2;
    }

    LifecycleOptions lifecycle;
    lifecycle.config_path = result["config"].as<std::string>();
    lifecycle.foreground = result.count("foreground") > 0;
    lifecycle.once = result.count("once") > 0;
    if (result.count("pid-file")) {
        lifecycle.overrides.pid_file = result["pid-file"].as<std::string>();
    }
    if (result.count("log-file")) {
        lifecycle.overrides.log_file = result["log-file"].as<std::string>();
    }
    if (result.count("user")) {
        lifecycle.overrides.user = result["user"].as<std::string>();
    }
    if (result.count("group")) {
        lifecycle.overrides.group = result["group"].as<std::string>();
    }

    if (result.count("test-config")) {
        return cli::test_config(lifecycle, std::cout, std::cerr);
    }
    if (result.count("list-devices")) {
        return cli::list_devices(lifecycle, std::cout, std::cerr);
    }
    if (result.count("encrypt-roster")) {
        auto paths = result["encrypt-roster"].as<std::vector<std::string>>();
        if (paths.size() != 2) {
            std::cerr << "--encrypt-roster expects IN,OUT\n";
            return 2;
        }
        return cli::encrypt_roster_file(lifecycle, paths[0], paths[1], std::cout, std::cerr);
    }

    // A single cycle is meant to be watched; never detach for it
    if (lifecycle.once) {
        lifecycle.foreground = true;
    }

    LifecycleController controller(std::move(lifecycle));
    return controller.run();
}

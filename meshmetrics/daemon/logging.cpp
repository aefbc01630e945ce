// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <tt-logger/tt-logger.hpp>

#include <daemon/logging.hpp>
#include <utils/assert.hpp>

namespace meshmetrics::logging {

namespace {

constexpr const char* kLogPattern = "%Y-%m-%d %H:%M:%S - meshmetricsd - %^%l%$ - %v";

}  // namespace

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });

    if (upper == "DEBUG") {
        return spdlog::level::debug;
    }
    if (upper == "INFO") {
        return spdlog::level::info;
    }
    if (upper == "WARNING" || upper == "WARN") {
        return spdlog::level::warn;
    }
    if (upper == "ERROR") {
        return spdlog::level::err;
    }
    if (upper == "CRITICAL") {
        return spdlog::level::critical;
    }
    return std::nullopt;
}

void set_level(spdlog::level::level_enum level) {
    ::tt::LoggerRegistry::instance().set_level(level);
    spdlog::set_level(level);
}

void configure(const LoggingOptions& options) {
    auto level = parse_level(options.level);
    MESHMETRICS_FATAL(level.has_value(), "Invalid value for daemon.log_level: '{}'", options.level);

    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!options.log_file.empty()) {
        std::filesystem::path log_path(options.log_file);
        try {
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file));
        } catch (const std::exception& e) {
            MESHMETRICS_THROW("Cannot open log file {}: {}", options.log_file, e.what());
        }
    }
    for (auto& sink : sinks) {
        sink->set_pattern(kLogPattern);
    }

    auto default_logger = std::make_shared<spdlog::logger>("meshmetricsd", sinks.begin(), sinks.end());
    spdlog::set_default_logger(default_logger);

    // Loggers created by tt-logger are registered with spdlog too; point them at the same sinks
    spdlog::apply_all([&sinks](const std::shared_ptr<spdlog::logger>& logger) {
        logger->sinks() = sinks;
    });
    spdlog::flush_on(spdlog::level::warn);
    set_level(*level);
}

}  // namespace meshmetrics::logging

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace meshmetrics::logging {

/**
 * @brief Maps a config log level to spdlog's level.
 *
 * Accepts DEBUG, INFO, WARNING (or WARN), ERROR and CRITICAL in any case. Returns nullopt for anything else.
 */
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

struct LoggingOptions {
    std::string level = "INFO";
    std::string log_file;  // empty for no file sink
    bool console = true;   // false once detached from the terminal
};

/**
 * @brief Routes all log output to the configured sinks at the configured level.
 *
 * Safe to call again, e.g. after daemonizing, to rebuild the sinks. Throws std::runtime_error for an unknown
 * level or a log file that cannot be opened.
 */
void configure(const LoggingOptions& options);

void set_level(spdlog::level::level_enum level);

}  // namespace meshmetrics::logging

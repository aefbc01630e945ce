// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>

#include <tt-logger/tt-logger.hpp>

namespace meshmetrics::assert {

namespace detail {

template <typename... Args>
[[noreturn]] void throw_impl(
    const char* file, int line, const char* assert_type, const char* condition_str, const Args&... args) {
    std::string message = fmt::format("{} @ {}:{}: {}", assert_type, file, line, condition_str);
    if constexpr (sizeof...(args) > 0) {
        std::string info = fmt::format(args...);
        log_critical(tt::LogAlways, "{}: {}", assert_type, info);
        message += "\ninfo:\n" + info;
    }
    throw std::runtime_error(message);
}

[[noreturn]] inline void mm_throw(const char* file, int line, const char* assert_type, const char* condition_str) {
    throw_impl(file, line, assert_type, condition_str);
}

template <typename... Args>
[[noreturn]] void mm_throw(
    const char* file,
    int line,
    const char* assert_type,
    const char* condition_str,
    fmt::format_string<const Args&...> fmt,
    const Args&... args) {
    throw_impl(file, line, assert_type, condition_str, fmt, args...);
}

}  // namespace detail

// Last line of the message produced by MESHMETRICS_FATAL/MESHMETRICS_THROW, i.e. the formatted info without
// the file:line preamble. Used when printing fatal startup errors to the operator.
inline std::string short_message(const std::exception& e) {
    std::string what = e.what();
    auto pos = what.rfind("\ninfo:\n");
    if (pos == std::string::npos) {
        return what;
    }
    return what.substr(pos + 7);
}

}  // namespace meshmetrics::assert

#ifndef MESHMETRICS_THROW
#define MESHMETRICS_THROW(...) \
    meshmetrics::assert::detail::mm_throw(__FILE__, __LINE__, "MESHMETRICS_THROW", "meshmetrics::exception", ##__VA_ARGS__)
#endif

#ifndef MESHMETRICS_FATAL
#define MESHMETRICS_FATAL(condition, message, ...)                                                      \
    do {                                                                                                \
        if (not(condition)) [[unlikely]] {                                                              \
            meshmetrics::assert::detail::mm_throw(                                                      \
                __FILE__, __LINE__, "MESHMETRICS_FATAL", #condition, message, ##__VA_ARGS__);           \
            __builtin_unreachable();                                                                    \
        }                                                                                               \
    } while (0)  // NOLINT(cppcoreguidelines-macro-usage)
#endif

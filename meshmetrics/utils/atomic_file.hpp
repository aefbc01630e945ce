// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <functional>
#include <string_view>

namespace meshmetrics {

// Invoked after the temporary file is durable but before it replaces the target. Tests throw from here to
// simulate a crash or I/O error in the window between write and rename.
using BeforeReplaceHook =
    std::function<void(const std::filesystem::path& temp_path, const std::filesystem::path& target)>;

/**
 * Replaces target with content so that readers only ever observe the old or the new file in full.
 *
 * A uniquely named temporary is created next to target (same directory, hence same filesystem), written, fsync'd,
 * closed and renamed over target. On any failure the temporary is unlinked, target is left untouched, and a
 * std::system_error (or whatever before_replace threw) propagates to the caller.
 */
void write_file_atomic(
    const std::filesystem::path& target, std::string_view content, const BeforeReplaceHook& before_replace = {});

// Truncating in-place write, for setups that explicitly disable atomic writes. Throws std::system_error.
void write_file_in_place(const std::filesystem::path& target, std::string_view content);

}  // namespace meshmetrics

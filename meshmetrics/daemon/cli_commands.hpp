// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <ostream>

#include <daemon/lifecycle_controller.hpp>

namespace meshmetrics::cli {

// One-shot commands that inspect the configuration instead of starting the daemon. Each returns an exit code and
// writes its report to out; errors go to err.

// Prints the effective configuration and whether the roster loads.
int test_config(const LifecycleOptions& options, std::ostream& out, std::ostream& err);

// Prints one roster device per line.
int list_devices(const LifecycleOptions& options, std::ostream& out, std::ostream& err);

// Encrypts a plaintext CSV roster with the configured devices.password_file, in the format the loader decrypts.
int encrypt_roster_file(
    const LifecycleOptions& options,
    const std::filesystem::path& input,
    const std::filesystem::path& output,
    std::ostream& out,
    std::ostream& err);

}  // namespace meshmetrics::cli

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace meshmetrics {

// Build identifier carried on every meshtastic_up line and printed by --version.
inline constexpr std::string_view kDaemonVersion = "MTM-v0.98-Daemon";

}  // namespace meshmetrics

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <telemetry/device.hpp>
#include <telemetry/roster_crypto.hpp>

namespace meshmetrics {

/**
 * Parses roster CSV text. Blank lines and lines starting with '#' are ignored; the remaining rows are
 * node_id[,contact_name[,location[,latitude[,longitude]]]] with surrounding whitespace trimmed and optional
 * double-quoted fields. Throws RosterError for an empty node_id or a node_id listed twice.
 */
std::vector<Device> parse_roster_csv(std::string_view content);

class RosterLoader {
public:
    // Loads and parses the roster at path, decrypting it first when a password is given.
    std::vector<Device> load(
        const std::filesystem::path& path, const std::optional<std::string>& password = std::nullopt) const;
};

// Reads a password file, stripping trailing whitespace and newlines.
std::string read_password_file(const std::filesystem::path& path);

}  // namespace meshmetrics

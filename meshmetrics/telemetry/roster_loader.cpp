// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <fstream>
#include <sstream>
#include <unordered_set>

#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

#include <telemetry/metric_renderer.hpp>
#include <telemetry/roster_loader.hpp>

namespace meshmetrics {

namespace {

std::string_view trim(std::string_view text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Splits one CSV record. Quoted fields may contain commas and doubled quotes ("").
std::vector<std::string> split_csv_row(std::string_view row, size_t line_number) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < row.size(); ++i) {
        char c = row[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < row.size() && row[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"' && trim(field).empty()) {
            field.clear();
            in_quotes = true;
        } else if (c == ',') {
            fields.emplace_back(trim(field));
            field.clear();
        } else {
            field += c;
        }
    }

    if (in_quotes) {
        throw RosterError(fmt::format("Roster line {}: unterminated quoted field", line_number));
    }
    fields.emplace_back(trim(field));
    return fields;
}

void warn_if_not_numeric(
    size_t line_number, std::string_view column, const std::string& value, const std::string& node) {
    if (!value.empty() && !is_numeric_value(value)) {
        log_warning(
            tt::LogAlways,
            "Roster line {}: {} '{}' for {} is not numeric and will not be exported",
            line_number,
            column,
            value,
            node);
    }
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        throw RosterError(fmt::format("Cannot open device file: {}", path.string()));
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

std::vector<Device> parse_roster_csv(std::string_view content) {
    std::vector<Device> devices;
    std::unordered_set<std::string> seen;

    size_t line_number = 0;
    size_t start = 0;
    while (start <= content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        std::string_view line = trim(content.substr(start, end - start));
        start = end + 1;
        line_number++;

        if (line.empty() || line.front() == '#') {
            continue;
        }

        std::vector<std::string> fields = split_csv_row(line, line_number);
        auto field = [&fields](size_t index) { return index < fields.size() ? fields[index] : std::string{}; };

        Device device{
            .node_id = field(0),
            .contact_name = field(1),
            .location = field(2),
            .latitude = field(3),
            .longitude = field(4)};

        if (device.node_id.empty()) {
            throw RosterError(fmt::format("Roster line {}: missing node id", line_number));
        }
        if (!seen.insert(device.node_id).second) {
            throw RosterError(fmt::format("Roster line {}: duplicate node id {}", line_number, device.node_id));
        }
        warn_if_not_numeric(line_number, "latitude", device.latitude, device.node_id);
        warn_if_not_numeric(line_number, "longitude", device.longitude, device.node_id);
        devices.push_back(std::move(device));
    }

    return devices;
}

std::vector<Device> RosterLoader::load(
    const std::filesystem::path& path, const std::optional<std::string>& password) const {
    std::string content = read_file(path);
    if (password) {
        log_debug(tt::LogAlways, "Decrypting device file {}", path.string());
        content = decrypt_roster(content, *password);
    }
    return parse_roster_csv(content);
}

std::string read_password_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw RosterError(fmt::format("Cannot open password file: {}", path.string()));
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return std::string(trim(buffer.str()));
}

}  // namespace meshmetrics

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

#include <telemetry/metric_line.hpp>

namespace meshmetrics {

struct DeliveryResult {
    bool ok = true;
    std::string reason;  // human readable, empty on success

    static DeliveryResult Success() { return DeliveryResult{}; }
    static DeliveryResult Failure(std::string reason) {
        return DeliveryResult{.ok = false, .reason = std::move(reason)};
    }
};

// A destination for a complete cycle snapshot. Each delivery fully supersedes the previous one.
class SnapshotSink {
public:
    virtual ~SnapshotSink() = default;

    virtual std::string_view name() const = 0;

    // A disabled sink is not configured at all; delivering to it trivially succeeds.
    virtual bool enabled() const = 0;

    virtual DeliveryResult deliver(const Snapshot& snapshot) const = 0;
};

}  // namespace meshmetrics

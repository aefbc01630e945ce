// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <delivery/snapshot_sink.hpp>
#include <telemetry/telemetry_source.hpp>

namespace meshmetrics::testing {

// Serves canned readings per node id. Unknown nodes get an empty reading; nodes listed in throwing_nodes throw.
class ScriptedTelemetrySource : public TelemetrySource {
public:
    Status connect(std::string_view, std::string_view) override {
        connect_calls++;
        return connect_status;
    }

    TelemetryReading fetch(const Device& device, std::chrono::seconds timeout) override {
        fetched.push_back(device.node_id);
        last_timeout = timeout;
        for (const auto& node : throwing_nodes) {
            if (node == device.node_id) {
                throw std::runtime_error("radio glitch");
            }
        }
        auto it = readings.find(device.node_id);
        return it == readings.end() ? TelemetryReading{} : it->second;
    }

    void close() override { close_calls++; }

    std::map<std::string, TelemetryReading> readings;
    std::vector<std::string> throwing_nodes;
    Status connect_status = Status::Ok();

    std::vector<std::string> fetched;
    std::chrono::seconds last_timeout{0};
    int connect_calls = 0;
    int close_calls = 0;
};

// Lets a test keep observing a source after the code under test has destroyed its owning pointer.
class ForwardingTelemetrySource : public TelemetrySource {
public:
    explicit ForwardingTelemetrySource(std::shared_ptr<TelemetrySource> target) : target_(std::move(target)) {}

    Status connect(std::string_view mode, std::string_view address) override { return target_->connect(mode, address); }
    TelemetryReading fetch(const Device& device, std::chrono::seconds timeout) override {
        return target_->fetch(device, timeout);
    }
    void close() override { target_->close(); }

private:
    std::shared_ptr<TelemetrySource> target_;
};

class CapturingSink : public SnapshotSink {
public:
    std::string_view name() const override { return "capture"; }
    bool enabled() const override { return true; }
    DeliveryResult deliver(const Snapshot& snapshot) const override {
        delivered.push_back(snapshot);
        return DeliveryResult::Success();
    }

    mutable std::vector<Snapshot> delivered;
};

}  // namespace meshmetrics::testing

// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <delivery/snapshot_sink.hpp>

namespace meshmetrics {

inline constexpr std::string_view kDefaultJobName = "meshtastic_repeater_telemetry";
inline constexpr std::string_view kExpositionContentType = "text/plain; version=0.0.4; charset=utf-8";

using PushResult = DeliveryResult;

struct PushClientConfig {
    std::string push_url;  // empty disables the push sink
    std::string job_name = std::string(kDefaultJobName);
    std::string instance;
    std::chrono::seconds timeout{30};
};

// Split form of push_url. base_path keeps any path prefix the gateway is mounted under, without trailing '/'.
struct PushEndpoint {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string base_path;

    std::string scheme_host_port() const;
};

std::optional<PushEndpoint> parse_push_url(std::string_view url);

// Percent-encodes everything except unreserved characters and '/'.
std::string percent_encode(std::string_view text);

// {base_path}/metrics/job/{job}[/instance/{instance}]
std::string push_request_path(const PushEndpoint& endpoint, std::string_view job_name, std::string_view instance);

struct PushRequest {
    std::string scheme_host_port;
    std::string path;
    std::string body;
    std::chrono::seconds timeout;
};

// Performs one HTTP POST. Must not throw.
using PushTransport = std::function<DeliveryResult(const PushRequest&)>;

// Default transport built on httplib::Client.
DeliveryResult http_post_transport(const PushRequest& request);

/**
 * Delivers snapshots to a Prometheus Pushgateway. Delivery is best-effort: every failure mode (bad URL,
 * connection error, timeout, non-200 status) is reported through the returned DeliveryResult rather than thrown.
 */
class PushClient : public SnapshotSink {
public:
    // Throws std::invalid_argument if push_url is set but cannot be parsed.
    explicit PushClient(PushClientConfig config, PushTransport transport = http_post_transport);

    std::string_view name() const override { return "push"; }
    bool enabled() const override { return endpoint_.has_value(); }
    DeliveryResult deliver(const Snapshot& snapshot) const override { return push(snapshot); }

    PushResult push(const Snapshot& snapshot) const;

    const PushClientConfig& config() const { return config_; }

    // Full target URL, or empty when disabled.
    std::string target_url() const;

private:
    PushClientConfig config_;
    std::optional<PushEndpoint> endpoint_;
    PushTransport transport_;
};

}  // namespace meshmetrics

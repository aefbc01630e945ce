// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <httplib.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <delivery/push_client.hpp>
#include <telemetry/metric_renderer.hpp>

using namespace meshmetrics;

namespace {

Snapshot sample_snapshot() {
    return render_device_metrics(Device{.node_id = "!a1b2c3d4"}, TelemetryReading{{"Battery", int64_t{87}}});
}

struct ReceivedPush {
    std::string path;
    std::string body;
    std::string content_type;
};

// Minimal Pushgateway stand-in listening on an ephemeral loopback port.
class FakePushGateway {
public:
    explicit FakePushGateway(int status = 200) {
        server_.Post(".*", [this, status](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(ReceivedPush{
                .path = req.path, .body = req.body, .content_type = req.get_header_value("Content-Type")});
            res.status = status;
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakePushGateway() {
        server_.stop();
        thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<ReceivedPush> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<ReceivedPush> received_;
};

}  // namespace

TEST(PushUrlTest, ParsesHostPortAndBasePath) {
    auto endpoint = parse_push_url("http://gateway.local:9091/prefix/");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->scheme, "http");
    EXPECT_EQ(endpoint->host, "gateway.local");
    EXPECT_EQ(endpoint->port, 9091);
    EXPECT_EQ(endpoint->base_path, "/prefix");
    EXPECT_EQ(push_request_path(*endpoint, "job", ""), "/prefix/metrics/job/job");
}

TEST(PushUrlTest, DefaultsPortFromScheme) {
    EXPECT_EQ(parse_push_url("https://gw")->port, 443);
    EXPECT_EQ(parse_push_url("http://gw/")->port, 80);
    EXPECT_EQ(parse_push_url("http://[::1]:9091")->host, "[::1]");
}

TEST(PushUrlTest, RejectsUnusableUrls) {
    EXPECT_FALSE(parse_push_url("gateway:9091").has_value());
    EXPECT_FALSE(parse_push_url("ftp://gateway").has_value());
    EXPECT_FALSE(parse_push_url("http://gateway:notaport").has_value());
    EXPECT_FALSE(parse_push_url("http://:9091").has_value());
    EXPECT_THROW(PushClient(PushClientConfig{.push_url = "not a url"}), std::invalid_argument);
}

TEST(PushUrlTest, PercentEncodesLikeUrlQuote) {
    EXPECT_EQ(percent_encode("meshtastic_repeater_telemetry"), "meshtastic_repeater_telemetry");
    EXPECT_EQ(percent_encode("a b/c~d"), "a%20b/c~d");
    EXPECT_EQ(percent_encode("!node:1"), "%21node%3A1");
}

TEST(PushClientTest, DisabledClientNeverTouchesTransport) {
    int transport_calls = 0;
    PushClient client(PushClientConfig{}, [&transport_calls](const PushRequest&) {
        transport_calls++;
        return DeliveryResult::Success();
    });

    EXPECT_FALSE(client.enabled());
    EXPECT_TRUE(client.push(sample_snapshot()).ok);
    EXPECT_EQ(transport_calls, 0);
    EXPECT_EQ(client.target_url(), "");
}

TEST(PushClientTest, BuildsRequestFromConfig) {
    PushRequest seen;
    PushClient client(
        PushClientConfig{
            .push_url = "http://gw:9091/",
            .job_name = "mesh job",
            .instance = "site/1",
            .timeout = std::chrono::seconds(5)},
        [&seen](const PushRequest& request) {
            seen = request;
            return DeliveryResult::Success();
        });

    ASSERT_TRUE(client.push(sample_snapshot()).ok);
    EXPECT_EQ(seen.scheme_host_port, "http://gw:9091");
    EXPECT_EQ(seen.path, "/metrics/job/mesh%20job/instance/site/1");
    EXPECT_EQ(seen.body, format_exposition(sample_snapshot()));
    EXPECT_EQ(seen.timeout, std::chrono::seconds(5));
    EXPECT_EQ(client.target_url(), "http://gw:9091/metrics/job/mesh%20job/instance/site/1");
}

TEST(PushClientTest, ThrowingTransportBecomesFailure) {
    PushClient client(PushClientConfig{.push_url = "http://gw"}, [](const PushRequest&) -> DeliveryResult {
        throw std::runtime_error("boom");
    });

    PushResult result = client.push(sample_snapshot());
    EXPECT_FALSE(result.ok);
    EXPECT_THAT(result.reason, ::testing::HasSubstr("boom"));
}

TEST(PushClientTest, PostsExpositionTextToGateway) {
    FakePushGateway gateway;
    PushClient client(PushClientConfig{.push_url = gateway.url() + "/", .instance = "repeater-1"});

    PushResult result = client.push(sample_snapshot());

    ASSERT_TRUE(result.ok) << result.reason;
    auto received = gateway.received();
    ASSERT_EQ(received.size(), 1);
    EXPECT_EQ(received[0].path, "/metrics/job/meshtastic_repeater_telemetry/instance/repeater-1");
    EXPECT_EQ(received[0].body, format_exposition(sample_snapshot()));
    EXPECT_EQ(received[0].content_type, "text/plain; version=0.0.4; charset=utf-8");
}

TEST(PushClientTest, NonOkStatusIsFailure) {
    FakePushGateway gateway(500);
    PushClient client(PushClientConfig{.push_url = gateway.url()});

    PushResult result = client.push(sample_snapshot());

    EXPECT_FALSE(result.ok);
    EXPECT_THAT(result.reason, ::testing::HasSubstr("500"));
}

TEST(PushClientTest, UnreachableGatewayIsFailure) {
    int port = 0;
    {
        FakePushGateway gateway;
        port = std::stoi(gateway.url().substr(gateway.url().rfind(':') + 1));
    }
    PushClient client(PushClientConfig{
        .push_url = "http://127.0.0.1:" + std::to_string(port), .timeout = std::chrono::seconds(2)});

    PushResult result = client.push(sample_snapshot());

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.reason.empty());
}

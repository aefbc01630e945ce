// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <cctype>
#include <charconv>
#include <stdexcept>

#include <httplib.h>

#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

#include <delivery/push_client.hpp>

namespace meshmetrics {

namespace {

bool is_unreserved(unsigned char c) { return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~'; }

std::string trim_url(std::string_view url) {
    size_t start = url.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = url.find_last_not_of(" \t\r\n");
    return std::string(url.substr(start, end - start + 1));
}

}  // namespace

std::string PushEndpoint::scheme_host_port() const { return fmt::format("{}://{}:{}", scheme, host, port); }

std::optional<PushEndpoint> parse_push_url(std::string_view url) {
    PushEndpoint endpoint;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    endpoint.scheme = std::string(url.substr(0, scheme_end));
    for (auto& c : endpoint.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (endpoint.scheme != "http" && endpoint.scheme != "https") {
        return std::nullopt;
    }

    std::string_view rest = url.substr(scheme_end + 3);
    size_t path_start = rest.find('/');
    std::string_view authority = rest.substr(0, path_start);
    std::string_view path = path_start == std::string_view::npos ? std::string_view{} : rest.substr(path_start);

    if (authority.empty() || authority.find('@') != std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view host = authority;
    endpoint.port = endpoint.scheme == "https" ? 443 : 80;
    if (authority.front() == '[') {
        // [v6addr]:port
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host = authority.substr(0, close + 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            authority = after;
        } else {
            authority = {};
        }
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        std::string_view port_text = authority.substr(colon + 1);
        if (host.front() != '[') {
            host = authority.substr(0, colon);
        }
        int port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        endpoint.port = port;
    }
    if (host.empty()) {
        return std::nullopt;
    }
    endpoint.host = std::string(host);

    size_t query = path.find_first_of("?#");
    if (query != std::string_view::npos) {
        path = path.substr(0, query);
    }
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    endpoint.base_path = std::string(path);
    return endpoint;
}

std::string percent_encode(std::string_view text) {
    std::string encoded;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c) || c == '/') {
            encoded += ch;
        } else {
            encoded += fmt::format("%{:02X}", c);
        }
    }
    return encoded;
}

std::string push_request_path(const PushEndpoint& endpoint, std::string_view job_name, std::string_view instance) {
    std::string path = fmt::format("{}/metrics/job/{}", endpoint.base_path, percent_encode(job_name));
    if (!instance.empty()) {
        path += fmt::format("/instance/{}", percent_encode(instance));
    }
    return path;
}

DeliveryResult http_post_transport(const PushRequest& request) {
    try {
        httplib::Client client(request.scheme_host_port);
        if (!client.is_valid()) {
            return DeliveryResult::Failure(
                fmt::format("Unsupported push gateway address {}", request.scheme_host_port));
        }
        client.set_connection_timeout(request.timeout);
        client.set_read_timeout(request.timeout);
        client.set_write_timeout(request.timeout);

        auto response = client.Post(request.path, request.body, std::string(kExpositionContentType));
        if (!response) {
            return DeliveryResult::Failure(fmt::format(
                "Failed to push metrics to {}{}: {}",
                request.scheme_host_port,
                request.path,
                httplib::to_string(response.error())));
        }
        if (response->status != 200) {
            return DeliveryResult::Failure(fmt::format("Push gateway returned status {}", response->status));
        }
        return DeliveryResult::Success();
    } catch (const std::exception& e) {
        return DeliveryResult::Failure(fmt::format("Unexpected error pushing metrics: {}", e.what()));
    }
}

PushClient::PushClient(PushClientConfig config, PushTransport transport) :
    config_(std::move(config)), transport_(std::move(transport)) {
    config_.push_url = trim_url(config_.push_url);
    if (config_.push_url.empty()) {
        return;
    }
    endpoint_ = parse_push_url(config_.push_url);
    if (!endpoint_) {
        throw std::invalid_argument(fmt::format("Invalid push gateway URL: {}", config_.push_url));
    }
}

std::string PushClient::target_url() const {
    if (!endpoint_) {
        return {};
    }
    return endpoint_->scheme_host_port() + push_request_path(*endpoint_, config_.job_name, config_.instance);
}

DeliveryResult PushClient::push(const Snapshot& snapshot) const {
    if (!endpoint_) {
        return DeliveryResult::Success();
    }

    PushRequest request{
        .scheme_host_port = endpoint_->scheme_host_port(),
        .path = push_request_path(*endpoint_, config_.job_name, config_.instance),
        .body = format_exposition(snapshot),
        .timeout = config_.timeout};

    DeliveryResult result;
    try {
        result = transport_(request);
    } catch (const std::exception& e) {
        result = DeliveryResult::Failure(fmt::format("Unexpected error pushing metrics: {}", e.what()));
    }

    if (result.ok) {
        log_debug(
            tt::LogAlways,
            "Successfully pushed {} metrics to {}{}",
            snapshot.size(),
            request.scheme_host_port,
            request.path);
    }
    return result;
}

}  // namespace meshmetrics

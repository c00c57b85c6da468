// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_types.hpp"
#include "http_client.hpp"
#include "message_transport.hpp"
#include "streaming_connection.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace homewizard {

/// Cache max-age and default wait for the first handshake.
constexpr std::chrono::milliseconds DEFAULT_DEVICE_TIMEOUT{30000};

struct DeviceOptions {
    std::string host;
    std::string token;
    std::chrono::milliseconds timeout{DEFAULT_DEVICE_TIMEOUT};
    std::chrono::milliseconds reconnect_delay{5000};
    std::chrono::milliseconds handshake_timeout{10000};
    TransportFactory transport_factory;   // empty: libcurl WebSocket
    std::shared_ptr<HttpClient> http;     // empty: CurlHttpClient
};

inline std::chrono::milliseconds device_timeout(const DeviceOptions& options) {
    return options.timeout.count() > 0 ? options.timeout : DEFAULT_DEVICE_TIMEOUT;
}

/// \brief The one streaming connection a device owns, plus what the device needs to
/// reach it out of band (host, token, HTTP client).
class DeviceLink {
public:
    DeviceLink(DeviceType type, DeviceOptions options, std::vector<std::string> topics, MessageHandler handler);
    ~DeviceLink();

    DeviceLink(const DeviceLink&) = delete;
    DeviceLink& operator=(const DeviceLink&) = delete;

    std::future<void> start();
    /// \brief Block until the first handshake completes; the device timeout bounds the wait.
    void start_and_wait();
    void start_and_wait(std::chrono::milliseconds timeout);
    void stop();

    void send(const nlohmann::json& message);

    LinkState state() const {
        return connection_.state();
    }
    DeviceType type() const {
        return type_;
    }
    const std::string& host() const {
        return options_.host;
    }
    const std::string& token() const {
        return options_.token;
    }
    std::chrono::milliseconds timeout() const {
        return options_.timeout;
    }
    HttpClient& http() const {
        return *options_.http;
    }

private:
    static ConnectionOptions connection_options(const DeviceOptions& options, std::vector<std::string> topics);

    DeviceType type_;
    DeviceOptions options_;
    StreamingConnection connection_;
};

} // namespace homewizard

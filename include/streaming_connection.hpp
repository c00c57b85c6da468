// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "message_transport.hpp"
#include "stop_signal.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace homewizard {

enum class LinkState { Disconnected, Connecting, Connected, Reconnecting };

const char* to_string(LinkState state);

/// \brief Consumer for inbound `(type, data)` envelopes. May throw DecodeError; the
/// connection logs it and keeps running.
using MessageHandler = std::function<void(const std::string& type, const nlohmann::json& data)>;

struct ConnectionOptions {
    std::string host;
    std::string token;
    std::vector<std::string> topics{"measurement"};
    std::chrono::milliseconds reconnect_delay{5000};
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds receive_poll{250}; // upper bound on how long stop() waits for the rx loop
};

/// \brief Owns the lifecycle of one authenticated persistent connection to one device.
///
/// Disconnected -> Connecting -> Connected -> (link loss) Reconnecting -> Connecting ...
/// Reconnects with a fixed delay until stop(); there is no attempt limit. stop() is terminal.
class StreamingConnection {
public:
    StreamingConnection(ConnectionOptions options, MessageHandler handler, TransportFactory factory);
    ~StreamingConnection();

    StreamingConnection(const StreamingConnection&) = delete;
    StreamingConnection& operator=(const StreamingConnection&) = delete;

    /// \brief Spawn the connection thread. The future resolves once the first handshake
    /// (auth + subscribe) completes, or carries the first failure.
    std::future<void> start();

    /// \brief start() and wait. On failure or after \p timeout, stop() and throw.
    void start_and_wait(std::chrono::milliseconds timeout);

    void stop();

    /// \brief Write one message while Connected. Throws NotConnectedError otherwise; never queues.
    void send(const nlohmann::json& message);

    LinkState state() const;
    const std::string& host() const {
        return options_.host;
    }
    std::string url() const;

private:
    void run();
    void run_session();
    void handshake(MessageTransport& transport);
    void dispatch(const std::string& raw);
    void set_state(LinkState state);
    void resolve_start(std::exception_ptr error);

    ConnectionOptions options_;
    MessageHandler handler_;
    TransportFactory factory_;

    StopSignal stop_;
    std::atomic<bool> started_{false};
    std::mutex worker_mutex_;
    std::thread worker_;

    mutable std::mutex state_mutex_;
    LinkState state_{LinkState::Disconnected};
    std::shared_ptr<MessageTransport> transport_; // the single live session, if any

    std::mutex start_mutex_;
    std::promise<void> start_promise_;
    bool start_resolved_{false};
};

} // namespace homewizard

// SPDX-License-Identifier: Apache-2.0
#include "streaming_connection.hpp"

#include "errors.hpp"
#include "redact.hpp"

#include <algorithm>
#include <stdexcept>

#include <everest/logging.hpp>

namespace homewizard {

namespace {

std::string error_message(const nlohmann::json& data) {
    if (data.is_object() && data.contains("message") && data["message"].is_string()) {
        return data["message"].get<std::string>();
    }
    if (data.is_string()) {
        return data.get<std::string>();
    }
    return data.dump();
}

std::string envelope_type(const nlohmann::json& envelope) {
    if (envelope.is_object() && envelope.contains("type") && envelope["type"].is_string()) {
        return envelope["type"].get<std::string>();
    }
    return {};
}

} // namespace

const char* to_string(LinkState state) {
    switch (state) {
    case LinkState::Disconnected:
        return "disconnected";
    case LinkState::Connecting:
        return "connecting";
    case LinkState::Connected:
        return "connected";
    case LinkState::Reconnecting:
        return "reconnecting";
    }
    return "unknown";
}

StreamingConnection::StreamingConnection(ConnectionOptions options, MessageHandler handler, TransportFactory factory) :
    options_(std::move(options)), handler_(std::move(handler)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = make_curl_websocket_factory();
    }
}

StreamingConnection::~StreamingConnection() {
    stop();
}

std::string StreamingConnection::url() const {
    return "wss://" + options_.host + "/api/ws";
}

std::future<void> StreamingConnection::start() {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (started_.exchange(true)) {
        throw std::logic_error("connection to " + options_.host + " already started");
    }
    auto future = start_promise_.get_future();
    set_state(LinkState::Connecting);
    worker_ = std::thread([this]() { run(); });
    return future;
}

void StreamingConnection::start_and_wait(std::chrono::milliseconds timeout) {
    auto future = start();
    if (future.wait_for(timeout) != std::future_status::ready) {
        stop();
        throw TimeoutError("connection timeout");
    }
    try {
        future.get();
    } catch (const std::exception& e) {
        stop();
        throw ConnectionError("connecting to device: " + redact(e.what(), options_.token));
    }
}

void StreamingConnection::stop() {
    stop_.request();
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }
    set_state(LinkState::Disconnected);
    resolve_start(std::make_exception_ptr(ConnectionError("connection stopped")));
}

void StreamingConnection::send(const nlohmann::json& message) {
    std::shared_ptr<MessageTransport> transport;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != LinkState::Connected || !transport_) {
            throw NotConnectedError("not connected to " + options_.host + " (" + to_string(state_) + ")");
        }
        transport = transport_;
    }
    transport->send_text(message.dump());
}

LinkState StreamingConnection::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void StreamingConnection::set_state(LinkState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == state) {
        return;
    }
    EVLOG_debug << "Connection " << options_.host << ": " << to_string(state_) << " -> " << to_string(state);
    state_ = state;
    if (state != LinkState::Connected) {
        transport_.reset();
    }
}

void StreamingConnection::resolve_start(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (start_resolved_ || !started_) {
        return;
    }
    start_resolved_ = true;
    if (error) {
        start_promise_.set_exception(error);
    } else {
        start_promise_.set_value();
    }
}

void StreamingConnection::run() {
    while (!stop_.requested()) {
        try {
            run_session();
        } catch (const std::exception& e) {
            if (stop_.requested()) {
                break;
            }
            EVLOG_warning << "Connection to " << options_.host << " lost: " << redact(e.what(), options_.token);
            resolve_start(std::current_exception());
        }
        if (stop_.requested()) {
            break;
        }
        set_state(LinkState::Reconnecting);
        if (stop_.wait_for(options_.reconnect_delay)) {
            break;
        }
        set_state(LinkState::Connecting);
    }
    set_state(LinkState::Disconnected);
}

void StreamingConnection::run_session() {
    std::shared_ptr<MessageTransport> transport(factory_());
    transport->open(url());

    // Closes the session on every exit path; clears the published pointer first so
    // concurrent send() calls fail fast with NotConnectedError.
    struct SessionGuard {
        StreamingConnection& self;
        std::shared_ptr<MessageTransport> transport;
        ~SessionGuard() {
            {
                std::lock_guard<std::mutex> lock(self.state_mutex_);
                if (self.transport_ == transport) {
                    self.transport_.reset();
                }
            }
            transport->close();
        }
    } guard{*this, transport};

    set_state(LinkState::Connected);
    handshake(*transport);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transport_ = transport;
    }
    EVLOG_info << "Connected to " << options_.host << " (topics: " << options_.topics.size() << ")";
    resolve_start(nullptr);

    while (!stop_.requested()) {
        const auto raw = transport->receive(options_.receive_poll);
        if (raw.has_value()) {
            dispatch(*raw);
        }
    }
}

void StreamingConnection::handshake(MessageTransport& transport) {
    const auto deadline = std::chrono::steady_clock::now() + options_.handshake_timeout;
    transport.send_text(nlohmann::json{{"type", "authorization"}, {"data", options_.token}}.dump());

    bool authorized = false;
    while (!authorized) {
        if (stop_.requested()) {
            throw ConnectionError("connection stopped");
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw TimeoutError("handshake with " + options_.host + " timed out");
        }
        const auto raw = transport.receive(std::min(remaining, options_.receive_poll));
        if (!raw.has_value()) {
            continue;
        }
        nlohmann::json envelope;
        try {
            envelope = nlohmann::json::parse(*raw);
        } catch (const nlohmann::json::exception& e) {
            EVLOG_debug << "Ignoring malformed handshake frame from " << options_.host << ": " << e.what();
            continue;
        }
        const auto type = envelope_type(envelope);
        if (type == "authorized") {
            authorized = true;
        } else if (type == "error") {
            throw ConnectionError("device " + options_.host + " rejected authorization: " +
                                  error_message(envelope.contains("data") ? envelope["data"] : nlohmann::json()));
        } else if (type != "authorization_requested") {
            EVLOG_debug << "Ignoring '" << type << "' before authorization on " << options_.host;
        }
    }

    for (const auto& topic : options_.topics) {
        transport.send_text(nlohmann::json{{"type", "subscribe"}, {"data", topic}}.dump());
    }
}

void StreamingConnection::dispatch(const std::string& raw) {
    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::exception& e) {
        EVLOG_warning << "Dropping malformed frame from " << options_.host << ": " << e.what();
        return;
    }
    const auto type = envelope_type(envelope);
    if (type.empty()) {
        EVLOG_warning << "Dropping frame without message type from " << options_.host;
        return;
    }
    const auto data = envelope.contains("data") ? envelope["data"] : nlohmann::json();
    if (type == "error") {
        EVLOG_warning << "Device " << options_.host << " reported error: " << error_message(data);
        return;
    }
    try {
        handler_(type, data);
    } catch (const DecodeError& e) {
        EVLOG_warning << "Failed to decode '" << type << "' from " << options_.host << ": " << e.what();
    } catch (const std::exception& e) {
        EVLOG_warning << "Handler for '" << type << "' from " << options_.host
                      << " failed: " << redact(e.what(), options_.token);
    }
}

} // namespace homewizard

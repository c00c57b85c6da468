// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace homewizard {

/// \brief One persistent message link (one transport session).
///
/// Delivers complete decoded text messages and reports link failures as LinkError.
/// send_text may be called from any thread while another thread sits in receive().
class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    /// \brief Establish the session (TCP, TLS and upgrade). Throws LinkError.
    virtual void open(const std::string& url) = 0;

    virtual void send_text(const std::string& message) = 0;

    /// \brief Wait up to \p timeout for one complete message. nullopt means nothing arrived.
    /// Throws LinkError if the peer closed the session or the socket failed.
    virtual std::optional<std::string> receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<MessageTransport>()>;

struct CurlWebSocketOptions {
    int connect_timeout_s{10};
    bool verify_tls{false};
};

/// \brief WebSocket transport on libcurl's connect-only mode (curl_ws_send / curl_ws_recv).
class CurlWebSocketTransport : public MessageTransport {
public:
    explicit CurlWebSocketTransport(CurlWebSocketOptions options = {});
    ~CurlWebSocketTransport() override;

    CurlWebSocketTransport(const CurlWebSocketTransport&) = delete;
    CurlWebSocketTransport& operator=(const CurlWebSocketTransport&) = delete;

    void open(const std::string& url) override;
    void send_text(const std::string& message) override;
    std::optional<std::string> receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    std::optional<std::string> drain_locked();
    void close_locked();

    CurlWebSocketOptions options_;
    std::mutex mutex_; // guards curl_ and partial_; never held while polling the socket
    void* curl_{nullptr};
    std::string partial_;
};

TransportFactory make_curl_websocket_factory(CurlWebSocketOptions options = {});

} // namespace homewizard

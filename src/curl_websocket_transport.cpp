// SPDX-License-Identifier: Apache-2.0
#include "message_transport.hpp"

#include "errors.hpp"

#include <array>
#include <cerrno>
#include <thread>

#include <poll.h>

#include <curl/curl.h>
#include <everest/logging.hpp>

namespace homewizard {

namespace {
constexpr int MAX_SEND_RETRIES = 50;
constexpr std::chrono::milliseconds SEND_RETRY_DELAY(2);

CURL* as_curl(void* handle) {
    return static_cast<CURL*>(handle);
}
} // namespace

CurlWebSocketTransport::CurlWebSocketTransport(CurlWebSocketOptions options) : options_(options) {
    static std::once_flag curl_once;
    std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlWebSocketTransport::~CurlWebSocketTransport() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void CurlWebSocketTransport::open(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw LinkError("curl_easy_init failed");
    }
    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L); // 2 = perform the WebSocket upgrade, then hand over
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_s > 0 ? options_.connect_timeout_s : 10);

    const CURLcode res = curl_easy_perform(curl);
    // The error buffer lives on this stack frame; detach it before the handle outlives it.
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    if (res != CURLE_OK) {
        const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw LinkError("websocket connect to " + url + " failed: " + detail);
    }
    curl_ = curl;
    partial_.clear();
}

void CurlWebSocketTransport::send_text(const std::string& message) {
    // Every call to curl_ws_send with CURLWS_TEXT starts a new frame, so only a send that put nothing
    // on the wire is retried, always with the whole message. A frame cut off part way leaves the
    // stream unusable and ends the link.
    for (int attempt = 0; attempt < MAX_SEND_RETRIES; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!curl_) {
                throw LinkError("websocket is not open");
            }
            std::size_t sent = 0;
            const CURLcode res = curl_ws_send(as_curl(curl_), message.data(), message.size(), &sent, 0, CURLWS_TEXT);
            if (res == CURLE_OK && sent >= message.size()) {
                return;
            }
            if (res != CURLE_OK && res != CURLE_AGAIN) {
                throw LinkError(std::string("websocket send failed: ") + curl_easy_strerror(res));
            }
            if (sent > 0) {
                throw LinkError("websocket send interrupted mid-frame after " + std::to_string(sent) + " of " +
                                std::to_string(message.size()) + " bytes");
            }
        }
        std::this_thread::sleep_for(SEND_RETRY_DELAY);
    }
    throw LinkError("websocket send stalled");
}

std::optional<std::string> CurlWebSocketTransport::receive(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        curl_socket_t sockfd = CURL_SOCKET_BAD;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!curl_) {
                throw LinkError("websocket is not open");
            }
            auto message = drain_locked();
            if (message.has_value()) {
                return message;
            }
            if (curl_easy_getinfo(as_curl(curl_), CURLINFO_ACTIVESOCKET, &sockfd) != CURLE_OK ||
                sockfd == CURL_SOCKET_BAD) {
                throw LinkError("websocket socket unavailable");
            }
        }

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }
        pollfd pfd{};
        pfd.fd = sockfd;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw LinkError("websocket poll failed");
        }
        if (ready == 0) {
            return std::nullopt;
        }
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 && (pfd.revents & POLLIN) == 0) {
            throw LinkError("websocket socket closed");
        }
    }
}

std::optional<std::string> CurlWebSocketTransport::drain_locked() {
    std::array<char, 4096> buffer{};
    while (true) {
        std::size_t received = 0;
        const curl_ws_frame* meta = nullptr;
        const CURLcode res = curl_ws_recv(as_curl(curl_), buffer.data(), buffer.size(), &received, &meta);
        if (res == CURLE_AGAIN) {
            return std::nullopt;
        }
        if (res != CURLE_OK) {
            throw LinkError(std::string("websocket receive failed: ") + curl_easy_strerror(res));
        }
        if (meta == nullptr) {
            continue;
        }
        if (meta->flags & CURLWS_CLOSE) {
            throw LinkError("websocket closed by peer");
        }
        if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
            continue; // curl answers pings itself
        }
        partial_.append(buffer.data(), received);
        if (meta->bytesleft == 0 && (meta->flags & CURLWS_CONT) == 0) {
            std::string complete;
            complete.swap(partial_);
            return complete;
        }
    }
}

void CurlWebSocketTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void CurlWebSocketTransport::close_locked() {
    if (!curl_) {
        return;
    }
    std::size_t sent = 0;
    const CURLcode res = curl_ws_send(as_curl(curl_), "", 0, &sent, 0, CURLWS_CLOSE);
    if (res != CURLE_OK) {
        EVLOG_debug << "websocket close frame not sent: " << curl_easy_strerror(res);
    }
    curl_easy_cleanup(as_curl(curl_));
    curl_ = nullptr;
    partial_.clear();
}

TransportFactory make_curl_websocket_factory(CurlWebSocketOptions options) {
    return [options]() { return std::make_unique<CurlWebSocketTransport>(options); };
}

} // namespace homewizard

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace homewizard {

/// \brief Friendly name rejected before any network call.
class InvalidNameError : public std::invalid_argument {
public:
    explicit InvalidNameError(const std::string& what) : std::invalid_argument(what) {}
};

/// \brief FreshnessCache has no value inside its max-age window (never written or expired).
class StaleValueError : public std::runtime_error {
public:
    explicit StaleValueError(const std::string& what) : std::runtime_error(what) {}
};

class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

/// \brief Base for streaming connection failures.
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

/// \brief Send attempted while the link is not up. Nothing was queued.
class NotConnectedError : public ConnectionError {
public:
    explicit NotConnectedError(const std::string& what) : ConnectionError(what) {}
};

/// \brief Transport-level failure (open, read, write or close frame).
class LinkError : public ConnectionError {
public:
    explicit LinkError(const std::string& what) : ConnectionError(what) {}
};

/// \brief Non-2xx HTTP answer. Carries the status and the raw body.
class HttpError : public std::runtime_error {
public:
    HttpError(int status, std::string body) :
        std::runtime_error("HTTP " + std::to_string(status) + ": " + body), status_(status), body_(std::move(body)) {
    }

    int status() const {
        return status_;
    }
    const std::string& body() const {
        return body_;
    }

private:
    int status_;
    std::string body_;
};

/// \brief Request never produced an HTTP status (DNS, TCP, TLS, timeout).
class HttpTransportError : public std::runtime_error {
public:
    explicit HttpTransportError(const std::string& what) : std::runtime_error(what) {}
};

/// \brief Device rejected pairing with something other than "authorization pending".
class PairingError : public std::runtime_error {
public:
    explicit PairingError(const std::string& what) : std::runtime_error(what) {}
};

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace homewizard

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace homewizard {

/// Header value the v2 device API requires on every request.
constexpr const char* API_VERSION_HEADER = "X-Api-Version";
constexpr const char* API_VERSION = "2";

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::optional<nlohmann::json> body;
    std::map<std::string, std::string> headers;
};

/// \brief JSON request/response collaborator.
///
/// Returns the decoded response body (null for an empty body). Non-2xx answers throw
/// HttpError with the status and raw body; requests that never got a status throw
/// HttpTransportError.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual nlohmann::json request(const HttpRequest& req) = 0;
};

struct HttpClientOptions {
    int connect_timeout_s{10};
    int transfer_timeout_s{10};
    bool verify_tls{false}; // devices serve self-signed certificates
};

/// \brief libcurl-backed HttpClient. One easy handle per request; safe to share across threads.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientOptions options = {});

    nlohmann::json request(const HttpRequest& req) override;

private:
    HttpClientOptions options_;
};

} // namespace homewizard

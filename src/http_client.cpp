// SPDX-License-Identifier: Apache-2.0
#include "http_client.hpp"

#include "errors.hpp"

#include <memory>
#include <mutex>

#include <curl/curl.h>
#include <everest/logging.hpp>

namespace homewizard {

namespace {

std::size_t collect_body(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

struct CurlEasyDeleter {
    void operator()(CURL* curl) const {
        curl_easy_cleanup(curl);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

} // namespace

CurlHttpClient::CurlHttpClient(HttpClientOptions options) : options_(options) {
    static std::once_flag curl_once;
    std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

nlohmann::json CurlHttpClient::request(const HttpRequest& req) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw HttpTransportError("curl_easy_init failed");
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : req.headers) {
        raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
    }
    if (req.body.has_value() && req.headers.count("Content-Type") == 0) {
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    }
    if (req.headers.count("Accept") == 0) {
        raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> headers(raw_headers);

    const std::string payload = req.body.has_value() ? req.body->dump() : std::string{};
    std::string response_body;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    if (req.body.has_value()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_s > 0 ? options_.connect_timeout_s : 10);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.transfer_timeout_s > 0 ? options_.transfer_timeout_s : 10);

    const CURLcode res = curl_easy_perform(curl.get());
    // error_buffer goes out of scope before the handle is cleaned up
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, nullptr);
    if (res != CURLE_OK) {
        const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        throw HttpTransportError(req.method + " " + req.url + " failed: " + detail);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    EVLOG_debug << req.method << " " << req.url << " -> " << status;
    if (status < 200 || status >= 300) {
        throw HttpError(static_cast<int>(status), response_body);
    }
    if (response_body.empty()) {
        return nullptr;
    }
    try {
        return nlohmann::json::parse(response_body);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError("invalid JSON from " + req.url + ": " + e.what());
    }
}

} // namespace homewizard

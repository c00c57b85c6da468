#include "errors.hpp"
#include "http_client.hpp"
#include "message_transport.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace homewizard;

namespace {

// Nothing listens on port 1 of the loopback interface.
constexpr const char* CLOSED_HTTP = "http://127.0.0.1:1/api/user";
constexpr const char* CLOSED_WS = "ws://127.0.0.1:1/api/ws";

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

int main() {
    // A refused connection is a transport error naming the request; the handle is reusable afterwards
    {
        HttpClientOptions options;
        options.connect_timeout_s = 2;
        options.transfer_timeout_s = 2;
        CurlHttpClient http(options);
        for (int i = 0; i < 3; ++i) {
            HttpRequest req;
            req.method = "POST";
            req.url = CLOSED_HTTP;
            req.body = nlohmann::json{{"name", "local/bridge"}};
            std::string message;
            try {
                http.request(req);
            } catch (const HttpTransportError& e) {
                message = e.what();
            }
            assert(contains(message, std::string("POST ") + CLOSED_HTTP + " failed: "));
        }
    }

    // Sending before the link is open is refused without touching the network
    {
        CurlWebSocketTransport transport;
        bool refused = false;
        try {
            transport.send_text(R"({"type":"subscribe","data":"*"})");
        } catch (const LinkError& e) {
            refused = contains(e.what(), "not open");
        }
        assert(refused);
    }

    // A failed upgrade leaves the transport closed; sending still reports the closed link
    {
        CurlWebSocketOptions options;
        options.connect_timeout_s = 2;
        CurlWebSocketTransport transport(options);
        std::string message;
        try {
            transport.open(CLOSED_WS);
        } catch (const LinkError& e) {
            message = e.what();
        }
        assert(contains(message, std::string("websocket connect to ") + CLOSED_WS + " failed: "));

        bool refused = false;
        try {
            transport.send_text("{}");
        } catch (const LinkError& e) {
            refused = contains(e.what(), "not open");
        }
        assert(refused);
        transport.close();
    }

    std::cout << "curl_transport_tests passed\n";
    return 0;
}

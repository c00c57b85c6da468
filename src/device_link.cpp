// SPDX-License-Identifier: Apache-2.0
#include "device_link.hpp"

#include <everest/logging.hpp>

namespace homewizard {

namespace {
DeviceOptions with_defaults(DeviceOptions options) {
    options.timeout = device_timeout(options);
    if (!options.http) {
        options.http = std::make_shared<CurlHttpClient>();
    }
    return options;
}
} // namespace

ConnectionOptions DeviceLink::connection_options(const DeviceOptions& options, std::vector<std::string> topics) {
    ConnectionOptions conn;
    conn.host = options.host;
    conn.token = options.token;
    conn.topics = std::move(topics);
    conn.reconnect_delay = options.reconnect_delay;
    conn.handshake_timeout = options.handshake_timeout;
    return conn;
}

DeviceLink::DeviceLink(DeviceType type, DeviceOptions options, std::vector<std::string> topics,
                       MessageHandler handler) :
    type_(type),
    options_(with_defaults(std::move(options))),
    connection_(connection_options(options_, std::move(topics)), std::move(handler), options_.transport_factory) {
    EVLOG_debug << "Created " << to_string(type_) << " device " << options_.host;
}

DeviceLink::~DeviceLink() {
    connection_.stop();
}

std::future<void> DeviceLink::start() {
    return connection_.start();
}

void DeviceLink::start_and_wait() {
    start_and_wait(device_timeout(options_));
}

void DeviceLink::start_and_wait(std::chrono::milliseconds timeout) {
    connection_.start_and_wait(timeout);
}

void DeviceLink::stop() {
    connection_.stop();
}

void DeviceLink::send(const nlohmann::json& message) {
    connection_.send(message);
}

} // namespace homewizard

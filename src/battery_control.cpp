// SPDX-License-Identifier: Apache-2.0
#include "battery_control.hpp"

#include "errors.hpp"
#include "redact.hpp"

#include <everest/logging.hpp>

namespace homewizard {

BatteryControl::BatteryControl(DeviceLink& link, std::chrono::milliseconds max_age) : link_(link), cache_(max_age) {
}

bool BatteryControl::handle_message(const std::string& type, const nlohmann::json& data) {
    if (type != "batteries") {
        return false;
    }
    cache_.set(decode_payload<BatteriesData>(data, "batteries data"));
    return true;
}

BatteriesData BatteryControl::batteries() const {
    try {
        return cache_.get();
    } catch (const StaleValueError& e) {
        throw TimeoutError("no fresh battery data from " + link_.host() + ": " + e.what());
    }
}

BatteryPowerLimits BatteryControl::power_limits() const {
    const auto b = batteries();
    return BatteryPowerLimits{b.max_consumption_w, b.max_production_w};
}

void BatteryControl::set_battery_mode(BatteryMode mode) {
    EVLOG_info << "Setting battery mode on " << link_.host() << " to " << to_string(mode);
    const nlohmann::json message = {{"type", "batteries"}, {"data", {{"mode", to_string(mode)}}}};
    try {
        link_.send(message);
        EVLOG_debug << "Battery mode sent in-band to " << link_.host();
        return;
    } catch (const ConnectionError& e) {
        EVLOG_debug << "In-band battery control on " << link_.host() << " failed, falling back to HTTP: "
                    << redact(e.what(), link_.token());
    }
    const auto res = put_battery_mode(mode);
    EVLOG_info << "Battery mode set via HTTP on " << link_.host() << ": " << to_string(mode) << " (response: mode="
               << res.mode << ", power=" << res.power_w << " W)";
}

BatteriesData BatteryControl::put_battery_mode(BatteryMode mode) {
    HttpRequest req;
    req.method = "PUT";
    req.url = "https://" + link_.host() + "/api/batteries";
    req.body = nlohmann::json{{"mode", to_string(mode)}};
    req.headers["Authorization"] = "Bearer " + link_.token();
    req.headers[API_VERSION_HEADER] = API_VERSION;
    req.headers["Content-Type"] = "application/json";
    req.headers["Accept"] = "application/json";

    nlohmann::json response;
    try {
        response = link_.http().request(req);
    } catch (const std::exception& e) {
        EVLOG_error << "PUT " << req.url << " failed: " << redact(e.what(), link_.token());
        throw;
    }
    return decode_payload<BatteriesData>(response, "batteries response");
}

} // namespace homewizard

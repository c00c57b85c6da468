// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_link.hpp"
#include "device_types.hpp"
#include "freshness_cache.hpp"
#include "measurement.hpp"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace homewizard {

struct BatteryPowerLimits {
    double max_consumption_w{0.0}; // charge
    double max_production_w{0.0};  // discharge
};

/// \brief Battery group control reached through a P1 meter.
///
/// Keeps the latest "batteries" payload and switches the group mode, in-band over the
/// streaming connection when it is up and over HTTP PUT /api/batteries otherwise.
class BatteryControl {
public:
    BatteryControl(DeviceLink& link, std::chrono::milliseconds max_age);

    /// \brief Consume a "batteries" message. Returns false for any other type.
    bool handle_message(const std::string& type, const nlohmann::json& data);

    BatteriesData batteries() const;
    BatteryPowerLimits power_limits() const;

    void set_battery_mode(BatteryMode mode);

private:
    BatteriesData put_battery_mode(BatteryMode mode);

    DeviceLink& link_;
    FreshnessCache<BatteriesData> cache_;
};

} // namespace homewizard

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>

namespace homewizard {

enum class DeviceType { P1Meter, KwhMeter, Battery };

/// Config/CLI spelling: "p1meter", "kwhmeter", "battery".
std::string to_string(DeviceType type);
std::optional<DeviceType> device_type_from_string(const std::string& value);

/// \brief Map an advertised product type (HWE-P1, HWE-KWH3, SDM630-wifi, HWE-BAT, ...) to a device type.
std::optional<DeviceType> device_type_from_product(const std::string& product_type);

enum class BatteryMode { Zero, ToFull, Standby };

/// Wire spelling: "zero", "to_full", "standby".
std::string to_string(BatteryMode mode);
std::optional<BatteryMode> battery_mode_from_string(const std::string& value);

// HWE-BAT nominal figures
constexpr double DEFAULT_MAX_CHARGE_W = 800.0;
constexpr double DEFAULT_MAX_DISCHARGE_W = 800.0;
constexpr double DEFAULT_BATTERY_CAPACITY_KWH = 2.47;

} // namespace homewizard

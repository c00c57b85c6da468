// SPDX-License-Identifier: Apache-2.0
#include "device_types.hpp"

#include <algorithm>
#include <cctype>

namespace homewizard {

namespace {
std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
} // namespace

std::string to_string(DeviceType type) {
    switch (type) {
    case DeviceType::P1Meter:
        return "p1meter";
    case DeviceType::KwhMeter:
        return "kwhmeter";
    case DeviceType::Battery:
        return "battery";
    }
    return "unknown";
}

std::optional<DeviceType> device_type_from_string(const std::string& value) {
    const auto v = lowercase(value);
    if (v == "p1meter" || v == "p1") {
        return DeviceType::P1Meter;
    }
    if (v == "kwhmeter" || v == "kwh") {
        return DeviceType::KwhMeter;
    }
    if (v == "battery") {
        return DeviceType::Battery;
    }
    return std::nullopt;
}

std::optional<DeviceType> device_type_from_product(const std::string& product_type) {
    const auto p = lowercase(product_type);
    if (p == "hwe-p1") {
        return DeviceType::P1Meter;
    }
    if (p == "hwe-kwh1" || p == "hwe-kwh3" || p == "sdm230-wifi" || p == "sdm630-wifi") {
        return DeviceType::KwhMeter;
    }
    if (p == "hwe-bat") {
        return DeviceType::Battery;
    }
    return std::nullopt;
}

std::string to_string(BatteryMode mode) {
    switch (mode) {
    case BatteryMode::Zero:
        return "zero";
    case BatteryMode::ToFull:
        return "to_full";
    case BatteryMode::Standby:
        return "standby";
    }
    return "zero";
}

std::optional<BatteryMode> battery_mode_from_string(const std::string& value) {
    const auto v = lowercase(value);
    if (v == "zero") {
        return BatteryMode::Zero;
    }
    if (v == "to_full") {
        return BatteryMode::ToFull;
    }
    if (v == "standby") {
        return BatteryMode::Standby;
    }
    return std::nullopt;
}

} // namespace homewizard

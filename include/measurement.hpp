// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"

#include <array>
#include <string>

#include <nlohmann/json.hpp>

namespace homewizard {

/// L1, L2, L3. For single-phase readings the aggregate sits in [0] and the rest are 0.
using PhaseValues = std::array<double, 3>;

/// \brief Power, voltage and current fields shared by every meter type.
struct CommonMeasurement {
    double power_w{0.0};
    double power_l1_w{0.0}; // 3-phase only
    double power_l2_w{0.0};
    double power_l3_w{0.0};

    double voltage_v{0.0}; // 1-phase or aggregate
    double voltage_l1_v{0.0};
    double voltage_l2_v{0.0};
    double voltage_l3_v{0.0};

    double current_a{0.0};
    double current_l1_a{0.0};
    double current_l2_a{0.0};
    double current_l3_a{0.0};

    double frequency_hz{0.0};
};

/// \brief P1 (grid) meter: tariff-split energy registers.
struct P1Measurement {
    CommonMeasurement common;
    double energy_import_kwh{0.0};
    double energy_import_t1_kwh{0.0};
    double energy_import_t2_kwh{0.0};
    double energy_export_kwh{0.0};
    double energy_export_t1_kwh{0.0};
    double energy_export_t2_kwh{0.0};
    int tariff{0};
};

/// \brief kWh meter: simple import/export totals.
struct KwhMeasurement {
    CommonMeasurement common;
    double energy_import_kwh{0.0};
    double energy_export_kwh{0.0};
};

struct BatteryMeasurement {
    CommonMeasurement common;
    double energy_import_kwh{0.0};
    double energy_export_kwh{0.0};
    double state_of_charge_pct{0.0};
    int cycles{0};
};

/// \brief Payload of the "batteries" topic and of /api/batteries.
struct BatteriesData {
    std::string mode;
    double power_w{0.0};
    double target_power_w{0.0};
    double max_consumption_w{0.0};
    double max_production_w{0.0};
};

// nlohmann::json conversions. Missing fields decode as 0; wrongly typed fields throw.
void from_json(const nlohmann::json& j, CommonMeasurement& m);
void from_json(const nlohmann::json& j, P1Measurement& m);
void from_json(const nlohmann::json& j, KwhMeasurement& m);
void from_json(const nlohmann::json& j, BatteryMeasurement& m);
void from_json(const nlohmann::json& j, BatteriesData& b);

/// \brief Decode \p payload into T, turning any JSON error into DecodeError.
template <typename T> T decode_payload(const nlohmann::json& payload, const char* what) {
    if (!payload.is_object()) {
        throw DecodeError(std::string("unmarshal ") + what + ": expected object, got " + payload.type_name());
    }
    try {
        return payload.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("unmarshal ") + what + ": " + e.what());
    }
}

} // namespace homewizard

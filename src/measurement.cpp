// SPDX-License-Identifier: Apache-2.0
#include "measurement.hpp"

namespace homewizard {

namespace {
template <typename T> T field(const nlohmann::json& j, const char* key, T fallback = T{}) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->template get<T>();
}
} // namespace

void from_json(const nlohmann::json& j, CommonMeasurement& m) {
    m.power_w = field<double>(j, "power_w");
    m.power_l1_w = field<double>(j, "power_l1_w");
    m.power_l2_w = field<double>(j, "power_l2_w");
    m.power_l3_w = field<double>(j, "power_l3_w");
    m.voltage_v = field<double>(j, "voltage_v");
    m.voltage_l1_v = field<double>(j, "voltage_l1_v");
    m.voltage_l2_v = field<double>(j, "voltage_l2_v");
    m.voltage_l3_v = field<double>(j, "voltage_l3_v");
    m.current_a = field<double>(j, "current_a");
    m.current_l1_a = field<double>(j, "current_l1_a");
    m.current_l2_a = field<double>(j, "current_l2_a");
    m.current_l3_a = field<double>(j, "current_l3_a");
    m.frequency_hz = field<double>(j, "frequency_hz");
}

void from_json(const nlohmann::json& j, P1Measurement& m) {
    from_json(j, m.common);
    m.energy_import_kwh = field<double>(j, "energy_import_kwh");
    m.energy_import_t1_kwh = field<double>(j, "energy_import_t1_kwh");
    m.energy_import_t2_kwh = field<double>(j, "energy_import_t2_kwh");
    m.energy_export_kwh = field<double>(j, "energy_export_kwh");
    m.energy_export_t1_kwh = field<double>(j, "energy_export_t1_kwh");
    m.energy_export_t2_kwh = field<double>(j, "energy_export_t2_kwh");
    m.tariff = field<int>(j, "tariff");
}

void from_json(const nlohmann::json& j, KwhMeasurement& m) {
    from_json(j, m.common);
    m.energy_import_kwh = field<double>(j, "energy_import_kwh");
    m.energy_export_kwh = field<double>(j, "energy_export_kwh");
}

void from_json(const nlohmann::json& j, BatteryMeasurement& m) {
    from_json(j, m.common);
    m.energy_import_kwh = field<double>(j, "energy_import_kwh");
    m.energy_export_kwh = field<double>(j, "energy_export_kwh");
    m.state_of_charge_pct = field<double>(j, "state_of_charge_pct");
    m.cycles = field<int>(j, "cycles");
}

void from_json(const nlohmann::json& j, BatteriesData& b) {
    b.mode = field<std::string>(j, "mode");
    b.power_w = field<double>(j, "power_w");
    b.target_power_w = field<double>(j, "target_power_w");
    b.max_consumption_w = field<double>(j, "max_consumption_w");
    b.max_production_w = field<double>(j, "max_production_w");
}

} // namespace homewizard

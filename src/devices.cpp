// SPDX-License-Identifier: Apache-2.0
#include "devices.hpp"

#include <everest/logging.hpp>

namespace homewizard {

namespace {
void log_unhandled(const std::string& host, const std::string& type) {
    EVLOG_debug << "Unknown message type '" << type << "' from " << host;
}
} // namespace

// P1 meter

P1MeterDevice::P1MeterDevice(DeviceOptions options) :
    meter_(options.host, device_timeout(options)),
    battery_(link_, device_timeout(options)),
    link_(DeviceType::P1Meter, std::move(options), {"measurement", "batteries"},
          [this](const std::string& type, const nlohmann::json& data) { handle_message(type, data); }) {
}

void P1MeterDevice::handle_message(const std::string& type, const nlohmann::json& data) {
    if (battery_.handle_message(type, data) || meter_.handle_message(type, data)) {
        return;
    }
    log_unhandled(link_.host(), type);
}

double P1MeterDevice::power() const {
    return meter_.power();
}

PhaseValues P1MeterDevice::phase_powers(int phases) const {
    return meter_.phase_powers(phases);
}

PhaseValues P1MeterDevice::phase_voltages(int phases) const {
    return meter_.phase_voltages(phases);
}

PhaseValues P1MeterDevice::phase_currents(int phases) const {
    return meter_.phase_currents(phases);
}

double P1MeterDevice::total_energy() const {
    const auto m = meter_.measurement();
    return m.energy_import_t1_kwh + m.energy_import_t2_kwh;
}

BatteryPowerLimits P1MeterDevice::battery_power_limits() const {
    return battery_.power_limits();
}

void P1MeterDevice::set_battery_mode(BatteryMode mode) {
    battery_.set_battery_mode(mode);
}

// kWh meter

KwhMeterDevice::KwhMeterDevice(DeviceOptions options) :
    meter_(options.host, device_timeout(options)),
    link_(DeviceType::KwhMeter, std::move(options), {"measurement"},
          [this](const std::string& type, const nlohmann::json& data) { handle_message(type, data); }) {
}

void KwhMeterDevice::handle_message(const std::string& type, const nlohmann::json& data) {
    if (!meter_.handle_message(type, data)) {
        log_unhandled(link_.host(), type);
    }
}

double KwhMeterDevice::power(bool invert) const {
    return meter_.power(invert);
}

PhaseValues KwhMeterDevice::phase_powers(int phases, bool invert) const {
    return meter_.phase_powers(phases, invert);
}

PhaseValues KwhMeterDevice::phase_voltages(int phases) const {
    return meter_.phase_voltages(phases);
}

PhaseValues KwhMeterDevice::phase_currents(int phases) const {
    return meter_.phase_currents(phases);
}

double KwhMeterDevice::total_energy(bool use_export) const {
    const auto m = meter_.measurement();
    return use_export ? m.energy_export_kwh : m.energy_import_kwh;
}

// Battery

BatteryDevice::BatteryDevice(DeviceOptions options) :
    meter_(options.host, device_timeout(options)),
    link_(DeviceType::Battery, std::move(options), {"measurement"},
          [this](const std::string& type, const nlohmann::json& data) { handle_message(type, data); }) {
}

void BatteryDevice::handle_message(const std::string& type, const nlohmann::json& data) {
    if (!meter_.handle_message(type, data)) {
        log_unhandled(link_.host(), type);
    }
}

double BatteryDevice::power() const {
    return meter_.power();
}

PhaseValues BatteryDevice::phase_powers(int phases) const {
    return meter_.phase_powers(phases);
}

double BatteryDevice::total_energy() const {
    return meter_.measurement().energy_import_kwh;
}

double BatteryDevice::state_of_charge() const {
    return meter_.measurement().state_of_charge_pct;
}

int BatteryDevice::cycles() const {
    return meter_.measurement().cycles;
}

} // namespace homewizard

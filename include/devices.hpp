// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "battery_control.hpp"
#include "device_link.hpp"
#include "measurement.hpp"
#include "meter.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace homewizard {

/// \brief HWE-P1 grid meter. Subscribes to measurement and batteries, and controls the
/// battery group behind it. Power is always reported as measured (grid convention).
class P1MeterDevice {
public:
    explicit P1MeterDevice(DeviceOptions options);

    DeviceLink& link() {
        return link_;
    }

    P1Measurement measurement() const {
        return meter_.measurement();
    }
    double power() const;
    PhaseValues phase_powers(int phases) const;
    PhaseValues phase_voltages(int phases) const;
    PhaseValues phase_currents(int phases) const;
    /// Import over both tariffs (T1 + T2).
    double total_energy() const;

    BatteryPowerLimits battery_power_limits() const;
    void set_battery_mode(BatteryMode mode);

    void handle_message(const std::string& type, const nlohmann::json& data);

private:
    // The link is declared last: it is torn down first, so the receive thread is gone
    // before the caches it writes to.
    Meter<P1Measurement> meter_;
    BatteryControl battery_;
    DeviceLink link_;
};

/// \brief HWE-KWH1/KWH3 and SDM230/SDM630 kWh meters.
class KwhMeterDevice {
public:
    explicit KwhMeterDevice(DeviceOptions options);

    DeviceLink& link() {
        return link_;
    }

    KwhMeasurement measurement() const {
        return meter_.measurement();
    }
    /// \p invert flips the sign, e.g. for a PV meter that reports production as negative.
    double power(bool invert = false) const;
    PhaseValues phase_powers(int phases, bool invert = false) const;
    PhaseValues phase_voltages(int phases) const;
    PhaseValues phase_currents(int phases) const;
    double total_energy(bool use_export = false) const;

    void handle_message(const std::string& type, const nlohmann::json& data);

private:
    Meter<KwhMeasurement> meter_;
    DeviceLink link_;
};

/// \brief HWE-BAT plug-in battery.
class BatteryDevice {
public:
    explicit BatteryDevice(DeviceOptions options);

    DeviceLink& link() {
        return link_;
    }

    BatteryMeasurement measurement() const {
        return meter_.measurement();
    }
    double power() const;
    PhaseValues phase_powers(int phases) const;
    double total_energy() const;
    double state_of_charge() const;
    int cycles() const;

    double capacity_kwh() const {
        return DEFAULT_BATTERY_CAPACITY_KWH;
    }
    double max_charge_power_w() const {
        return DEFAULT_MAX_CHARGE_W;
    }
    double max_discharge_power_w() const {
        return DEFAULT_MAX_DISCHARGE_W;
    }

    void handle_message(const std::string& type, const nlohmann::json& data);

private:
    Meter<BatteryMeasurement> meter_;
    DeviceLink link_;
};

} // namespace homewizard

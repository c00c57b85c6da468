// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include "freshness_cache.hpp"
#include "measurement.hpp"

#include <chrono>
#include <string>

#include <everest/logging.hpp>
#include <nlohmann/json.hpp>

namespace homewizard {

/// \brief Measurement engine shared by every meter type.
///
/// Owns the freshness cache for M. handle_message() is called from the connection's
/// receive thread; the accessors may be called from any thread and never block on I/O.
template <typename M> class Meter {
public:
    Meter(std::string host, std::chrono::milliseconds max_age) : host_(std::move(host)), cache_(max_age) {}

    /// \brief Route one inbound message. Returns true if it was consumed.
    /// Throws DecodeError for a malformed measurement payload.
    bool handle_message(const std::string& type, const nlohmann::json& data) {
        if (type == "measurement") {
            cache_.set(decode_payload<M>(data, "measurement"));
            return true;
        }
        if (type == "device" || type == "system") {
            EVLOG_debug << "Ignoring '" << type << "' message from " << host_;
            return true;
        }
        return false;
    }

    /// \brief Latest fresh measurement or TimeoutError.
    M measurement() const {
        try {
            return cache_.get();
        } catch (const StaleValueError& e) {
            throw TimeoutError("no fresh measurement from " + host_ + ": " + e.what());
        }
    }

    double power(bool invert = false) const {
        const auto m = measurement();
        return invert ? -m.common.power_w : m.common.power_w;
    }

    PhaseValues phase_powers(int phases, bool invert = false) const {
        const auto c = measurement().common;
        const double sign = invert ? -1.0 : 1.0;
        if (phases == 1) {
            return {sign * c.power_w, 0.0, 0.0};
        }
        return {sign * c.power_l1_w, sign * c.power_l2_w, sign * c.power_l3_w};
    }

    PhaseValues phase_voltages(int phases) const {
        const auto c = measurement().common;
        if (phases == 1) {
            return {c.voltage_v, 0.0, 0.0};
        }
        return {c.voltage_l1_v, c.voltage_l2_v, c.voltage_l3_v};
    }

    PhaseValues phase_currents(int phases) const {
        const auto c = measurement().common;
        if (phases == 1) {
            return {c.current_a, 0.0, 0.0};
        }
        return {c.current_l1_a, c.current_l2_a, c.current_l3_a};
    }

    FreshnessCache<M>& cache() {
        return cache_;
    }
    const FreshnessCache<M>& cache() const {
        return cache_;
    }

private:
    std::string host_;
    FreshnessCache<M> cache_;
};

} // namespace homewizard

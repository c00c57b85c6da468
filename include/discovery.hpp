// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_types.hpp"
#include "stop_signal.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace homewizard {

/// mDNS service type every HomeWizard Energy device announces.
constexpr const char* HOMEWIZARD_SERVICE_TYPE = "_homewizard._tcp";

struct DiscoveredDevice {
    std::string instance;     // advertised instance name
    std::string host;         // address or resolvable host name
    DeviceType type{DeviceType::P1Meter};
    std::string product_type; // e.g. HWE-P1
    std::string serial;
};

using DeviceFoundCallback = std::function<void(const DiscoveredDevice&)>;

/// \brief Network discovery seam.
class DiscoveryService {
public:
    virtual ~DiscoveryService() = default;

    /// \brief Report devices through \p on_found until \p deadline or \p stop.
    /// Blocks the calling thread; may report the same device more than once.
    virtual void discover(std::chrono::steady_clock::time_point deadline, const StopSignal& stop,
                          const DeviceFoundCallback& on_found) = 0;
};

/// \brief DNS-SD browser for HomeWizard devices. Throws std::runtime_error when the
/// binary was built without DNS-SD support.
std::unique_ptr<DiscoveryService> make_dnssd_discovery();

struct DiscoveryOptions {
    std::chrono::milliseconds scan_window{30000};
    std::chrono::milliseconds quiet_period{3000}; // stop once nothing new arrived for this long
    std::chrono::milliseconds tick_interval{100};
};

struct DiscoveryHooks {
    std::function<void(std::size_t count, const DiscoveredDevice&)> on_found; // count is 1-based
    std::function<void()> on_tick;
};

/// \brief Run \p service until the quiet period or the scan window ends, whichever comes first.
///
/// Devices are deduplicated by host and returned in arrival order. Hooks run on the
/// calling thread; an exception from a hook ends the scan and reaches the caller. A
/// discovery failure is rethrown only if nothing was found. Once \p cancel is requested
/// the scan ends within one tick and returns what was found so far.
std::vector<DiscoveredDevice> collect_devices(DiscoveryService& service, const DiscoveryOptions& options,
                                              const DiscoveryHooks& hooks = {}, const StopSignal* cancel = nullptr);

} // namespace homewizard

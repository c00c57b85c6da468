// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_link.hpp"
#include "device_types.hpp"
#include "discovery.hpp"
#include "http_client.hpp"
#include "pairing.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace homewizard {

namespace fs = std::filesystem;

struct DeviceConfig {
    std::string name;
    DeviceType type{DeviceType::P1Meter};
    std::string host;
    std::string token;
    int phases{1};                  // 1 or 3
    bool invert_power{false};       // kWh meter used for PV
    bool use_export_energy{false};  // kWh meter reports export as total energy
};

struct TimeoutConfig {
    int device_s{30};
    int reconnect_s{5};
    int handshake_s{10};
    int http_connect_s{10};
    int http_transfer_s{10};
};

struct PairingConfig {
    std::string name{"homewizard-bridge"};
    int poll_interval_s{5};
    int max_attempts{36};
    int timeout_s{180};
};

struct DiscoveryConfig {
    int scan_s{30};
    int quiet_s{3};
};

struct BridgeConfig {
    std::vector<DeviceConfig> devices;
    TimeoutConfig timeouts;
    PairingConfig pairing;
    DiscoveryConfig discovery;
    fs::path logging_config;
    int monitor_interval_s{5};
};

/// \brief Load bridge.json. Missing keys take defaults, out-of-range values are clamped
/// back to them, relative paths resolve against the file's directory.
/// \throws std::runtime_error for a missing file or an unusable device entry
BridgeConfig load_bridge_config(const fs::path& config_path);

/// Defaults used when no config file is given.
BridgeConfig default_bridge_config();

HttpClientOptions http_options(const BridgeConfig& cfg);
PairingOptions pairing_options(const BridgeConfig& cfg);
DiscoveryOptions discovery_options(const BridgeConfig& cfg);
DeviceOptions device_options(const BridgeConfig& cfg, const DeviceConfig& device, std::shared_ptr<HttpClient> http);

/// \brief Paired devices under their meter names: the first P1 meter is "grid", kWh
/// meters are "pv", "pv2", ..., batteries "battery", "battery2", ...
std::vector<DeviceConfig> name_paired_devices(const std::vector<PairedDevice>& paired);

/// \brief The multi-meter YAML block printed after pairing. Batteries reference the grid
/// meter as their controller when one was paired.
std::string render_meter_config(const std::vector<PairedDevice>& paired);

/// \brief bridge.json content for \p paired on top of the settings in \p base.
nlohmann::json bridge_config_json(const std::vector<PairedDevice>& paired, const BridgeConfig& base);
void write_bridge_config(const fs::path& path, const std::vector<PairedDevice>& paired, const BridgeConfig& base);

} // namespace homewizard

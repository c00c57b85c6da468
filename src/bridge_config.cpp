// SPDX-License-Identifier: Apache-2.0
#include "bridge_config.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include <everest/logging.hpp>

namespace homewizard {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

void ensure_parent_dir(const fs::path& file_path) {
    const auto parent = file_path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

int positive_or(int value, int fallback) {
    return value > 0 ? value : fallback;
}

DeviceConfig parse_device(const nlohmann::json& device_json, std::size_t index) {
    DeviceConfig device;
    device.name = device_json.value("name", "device" + std::to_string(index + 1));
    const auto type_name = device_json.value("type", "");
    const auto type = device_type_from_string(type_name);
    if (!type.has_value()) {
        throw std::runtime_error("Device '" + device.name + "': unknown type '" + type_name +
                                 "' (expected p1meter, kwhmeter or battery)");
    }
    device.type = *type;
    device.host = device_json.value("host", "");
    if (device.host.empty()) {
        throw std::runtime_error("Device '" + device.name + "': host is required");
    }
    device.token = device_json.value("token", "");
    device.phases = device_json.value("phases", 1);
    device.invert_power = device_json.value("invertPower", false);
    device.use_export_energy = device_json.value("useExportEnergy", false);
    return device;
}

std::string meter_type_name(DeviceType type) {
    switch (type) {
    case DeviceType::P1Meter:
        return "homewizard-p1";
    case DeviceType::KwhMeter:
        return "homewizard-kwh";
    case DeviceType::Battery:
        return "homewizard-battery";
    }
    return "homewizard";
}

std::string numbered(const std::string& base, std::size_t ordinal) {
    return ordinal == 0 ? base : base + std::to_string(ordinal + 1);
}
} // namespace

BridgeConfig default_bridge_config() {
    BridgeConfig cfg{};
    cfg.logging_config = fs::current_path() / "config" / "logging.ini";
    return cfg;
}

BridgeConfig load_bridge_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    const auto json = nlohmann::json::parse(file);
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    BridgeConfig cfg{};
    const auto timeouts = json.value("timeouts", nlohmann::json::object());
    cfg.timeouts.device_s = timeouts.value("deviceSeconds", cfg.timeouts.device_s);
    cfg.timeouts.reconnect_s = timeouts.value("reconnectSeconds", cfg.timeouts.reconnect_s);
    cfg.timeouts.handshake_s = timeouts.value("handshakeSeconds", cfg.timeouts.handshake_s);
    cfg.timeouts.http_connect_s = timeouts.value("httpConnectSeconds", cfg.timeouts.http_connect_s);
    cfg.timeouts.http_transfer_s = timeouts.value("httpTransferSeconds", cfg.timeouts.http_transfer_s);

    const auto pairing = json.value("pairing", nlohmann::json::object());
    cfg.pairing.name = pairing.value("name", cfg.pairing.name);
    cfg.pairing.poll_interval_s = pairing.value("pollIntervalSeconds", cfg.pairing.poll_interval_s);
    cfg.pairing.max_attempts = pairing.value("maxAttempts", cfg.pairing.max_attempts);
    cfg.pairing.timeout_s = pairing.value("timeoutSeconds", cfg.pairing.timeout_s);

    const auto discovery = json.value("discovery", nlohmann::json::object());
    cfg.discovery.scan_s = discovery.value("scanSeconds", cfg.discovery.scan_s);
    cfg.discovery.quiet_s = discovery.value("quietSeconds", cfg.discovery.quiet_s);

    cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "logging.ini"));
    cfg.monitor_interval_s = json.value("monitorIntervalSeconds", cfg.monitor_interval_s);

    const TimeoutConfig default_timeouts{};
    cfg.timeouts.device_s = positive_or(cfg.timeouts.device_s, default_timeouts.device_s);
    cfg.timeouts.reconnect_s = positive_or(cfg.timeouts.reconnect_s, default_timeouts.reconnect_s);
    cfg.timeouts.handshake_s = positive_or(cfg.timeouts.handshake_s, default_timeouts.handshake_s);
    cfg.timeouts.http_connect_s = positive_or(cfg.timeouts.http_connect_s, default_timeouts.http_connect_s);
    cfg.timeouts.http_transfer_s = positive_or(cfg.timeouts.http_transfer_s, default_timeouts.http_transfer_s);
    const PairingConfig default_pairing{};
    cfg.pairing.poll_interval_s = positive_or(cfg.pairing.poll_interval_s, default_pairing.poll_interval_s);
    cfg.pairing.max_attempts = positive_or(cfg.pairing.max_attempts, default_pairing.max_attempts);
    cfg.pairing.timeout_s = positive_or(cfg.pairing.timeout_s, default_pairing.timeout_s);
    const DiscoveryConfig default_discovery{};
    cfg.discovery.scan_s = positive_or(cfg.discovery.scan_s, default_discovery.scan_s);
    cfg.discovery.quiet_s = positive_or(cfg.discovery.quiet_s, default_discovery.quiet_s);
    cfg.monitor_interval_s = positive_or(cfg.monitor_interval_s, 5);

    if (json.contains("devices") && json["devices"].is_array()) {
        std::size_t index = 0;
        for (const auto& device_json : json["devices"]) {
            cfg.devices.push_back(parse_device(device_json, index++));
        }
    }

    std::set<std::string> names;
    for (auto& d : cfg.devices) {
        if (!names.insert(d.name).second) {
            throw std::runtime_error("Duplicate device name '" + d.name + "'. Use a unique name per device.");
        }
        if (d.phases != 1 && d.phases != 3) {
            EVLOG_warning << "Device '" << d.name << "': phases must be 1 or 3, using 1";
            d.phases = 1;
        }
        if (d.type == DeviceType::P1Meter && d.invert_power) {
            // grid meters are never inverted
            d.invert_power = false;
        }
    }

    return cfg;
}

HttpClientOptions http_options(const BridgeConfig& cfg) {
    HttpClientOptions options;
    options.connect_timeout_s = cfg.timeouts.http_connect_s;
    options.transfer_timeout_s = cfg.timeouts.http_transfer_s;
    return options;
}

PairingOptions pairing_options(const BridgeConfig& cfg) {
    PairingOptions options;
    options.poll_interval = std::chrono::seconds(cfg.pairing.poll_interval_s);
    options.max_attempts = cfg.pairing.max_attempts;
    options.timeout = std::chrono::seconds(cfg.pairing.timeout_s);
    return options;
}

DiscoveryOptions discovery_options(const BridgeConfig& cfg) {
    DiscoveryOptions options;
    options.scan_window = std::chrono::seconds(cfg.discovery.scan_s);
    options.quiet_period = std::chrono::seconds(cfg.discovery.quiet_s);
    return options;
}

DeviceOptions device_options(const BridgeConfig& cfg, const DeviceConfig& device, std::shared_ptr<HttpClient> http) {
    DeviceOptions options;
    options.host = device.host;
    options.token = device.token;
    options.timeout = std::chrono::seconds(cfg.timeouts.device_s);
    options.reconnect_delay = std::chrono::seconds(cfg.timeouts.reconnect_s);
    options.handshake_timeout = std::chrono::seconds(cfg.timeouts.handshake_s);
    CurlWebSocketOptions ws;
    ws.connect_timeout_s = cfg.timeouts.http_connect_s;
    options.transport_factory = make_curl_websocket_factory(ws);
    options.http = std::move(http);
    return options;
}

std::vector<DeviceConfig> name_paired_devices(const std::vector<PairedDevice>& paired) {
    const PairedDevice* grid = nullptr;
    std::vector<const PairedDevice*> kwh_meters;
    std::vector<const PairedDevice*> batteries;
    for (const auto& device : paired) {
        switch (device.type) {
        case DeviceType::P1Meter:
            if (!grid) {
                grid = &device;
            } else {
                EVLOG_warning << "Only one grid meter is supported, ignoring P1 meter at " << device.host;
            }
            break;
        case DeviceType::KwhMeter:
            kwh_meters.push_back(&device);
            break;
        case DeviceType::Battery:
            batteries.push_back(&device);
            break;
        }
    }

    auto entry = [](const std::string& name, const PairedDevice& device) {
        DeviceConfig cfg;
        cfg.name = name;
        cfg.type = device.type;
        cfg.host = device.host;
        cfg.token = device.token;
        cfg.invert_power = device.type == DeviceType::KwhMeter;
        return cfg;
    };

    std::vector<DeviceConfig> named;
    if (grid) {
        named.push_back(entry("grid", *grid));
    }
    for (std::size_t i = 0; i < kwh_meters.size(); ++i) {
        named.push_back(entry(numbered("pv", i), *kwh_meters[i]));
    }
    for (std::size_t i = 0; i < batteries.size(); ++i) {
        named.push_back(entry(numbered("battery", i), *batteries[i]));
    }
    return named;
}

std::string render_meter_config(const std::vector<PairedDevice>& paired) {
    const auto named = name_paired_devices(paired);
    bool have_grid = false;
    for (const auto& d : named) {
        have_grid = have_grid || d.type == DeviceType::P1Meter;
    }

    std::ostringstream out;
    out << "meters:\n";
    for (const auto& d : named) {
        out << "- name: " << d.name << "\n";
        out << "  type: " << meter_type_name(d.type) << "\n";
        out << "  host: " << d.host << "\n";
        out << "  token: " << d.token << "\n";
        if (d.type == DeviceType::Battery) {
            if (have_grid) {
                out << "  controller: grid  # Reference to the grid meter above\n";
            } else {
                out << "  # controller: grid  # Reference to the grid meter\n";
            }
        }
        out << "\n";
    }
    if (!named.empty()) {
        out << "# Notes:\n";
        out << "# - Each meter entry configures ONE device\n";
        out << "# - homewizard-p1: P1 meter for grid monitoring\n";
        out << "# - homewizard-kwh: kWh meter for PV monitoring\n";
        out << "# - homewizard-battery: Battery device for SoC and power\n";
        out << "# - Battery requires 'controller' parameter (name of the P1 meter)\n";
    }
    return out.str();
}

nlohmann::json bridge_config_json(const std::vector<PairedDevice>& paired, const BridgeConfig& base) {
    nlohmann::json json;
    json["devices"] = nlohmann::json::array();
    for (const auto& d : name_paired_devices(paired)) {
        json["devices"].push_back({{"name", d.name},
                                   {"type", to_string(d.type)},
                                   {"host", d.host},
                                   {"token", d.token},
                                   {"phases", d.phases},
                                   {"invertPower", d.invert_power},
                                   {"useExportEnergy", d.use_export_energy}});
    }
    json["timeouts"] = {{"deviceSeconds", base.timeouts.device_s},
                        {"reconnectSeconds", base.timeouts.reconnect_s},
                        {"handshakeSeconds", base.timeouts.handshake_s},
                        {"httpConnectSeconds", base.timeouts.http_connect_s},
                        {"httpTransferSeconds", base.timeouts.http_transfer_s}};
    json["pairing"] = {{"name", base.pairing.name},
                       {"pollIntervalSeconds", base.pairing.poll_interval_s},
                       {"maxAttempts", base.pairing.max_attempts},
                       {"timeoutSeconds", base.pairing.timeout_s}};
    json["discovery"] = {{"scanSeconds", base.discovery.scan_s}, {"quietSeconds", base.discovery.quiet_s}};
    if (!base.logging_config.empty()) {
        json["loggingConfig"] = base.logging_config.string();
    }
    json["monitorIntervalSeconds"] = base.monitor_interval_s;
    return json;
}

void write_bridge_config(const fs::path& path, const std::vector<PairedDevice>& paired, const BridgeConfig& base) {
    ensure_parent_dir(path);
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write config file: " + path.string());
    }
    out << bridge_config_json(paired, base).dump(2) << "\n";
    EVLOG_info << "Wrote " << path.string();
}

} // namespace homewizard

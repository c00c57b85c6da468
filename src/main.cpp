// SPDX-License-Identifier: Apache-2.0
#include "bridge_config.hpp"
#include "devices.hpp"
#include "discovery.hpp"
#include "errors.hpp"
#include "pairing.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <everest/logging.hpp>

namespace {

using namespace homewizard;

std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

struct CommandLine {
    std::string command;
    std::map<std::string, std::string> options;

    bool has(const std::string& key) const {
        return options.count(key) != 0;
    }
    std::string get(const std::string& key, const std::string& fallback = "") const {
        const auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }
    int get_int(const std::string& key, int fallback) const {
        const auto it = options.find(key);
        if (it == options.end()) {
            return fallback;
        }
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            throw std::invalid_argument("--" + key + " expects a number, got '" + it->second + "'");
        }
    }
};

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c") {
            arg = "--config";
        }
        if (arg == "-h" || arg == "--help") {
            cl.command = "help";
            return cl;
        }
        if (arg.rfind("--", 0) == 0) {
            const auto key = arg.substr(2);
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            cl.options[key] = argv[++i];
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            throw std::invalid_argument("unexpected argument '" + arg + "'");
        }
    }
    return cl;
}

void print_usage() {
    std::cout << "Usage: homewizard-bridge <command> [options]\n"
                 "\n"
                 "Commands:\n"
                 "  pair --name <name> [--host <host> [--type p1meter|kwhmeter|battery]] [--timeout <s>]\n"
                 "       [--output <bridge.json>] [--config <bridge.json>]\n"
                 "  discover [--timeout <s>] [--config <bridge.json>]\n"
                 "  monitor --config <bridge.json> [--interval <s>]\n"
                 "  battery-mode --config <bridge.json> --mode zero|to_full|standby [--device <name>]\n";
}

BridgeConfig load_config(const CommandLine& cl, bool required) {
    if (cl.has("config")) {
        return load_bridge_config(cl.get("config"));
    }
    if (required) {
        throw std::invalid_argument("--config is required for '" + cl.command + "'");
    }
    return default_bridge_config();
}

void init_logging(const BridgeConfig& cfg) {
    if (!cfg.logging_config.empty() && fs::exists(cfg.logging_config)) {
        Everest::Logging::init(cfg.logging_config.string(), "homewizard-bridge");
    }
}

/// Runs \p on_interrupt once when SIGINT/SIGTERM arrives while the watcher is alive.
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::function<void()> on_interrupt) : on_interrupt_(std::move(on_interrupt)) {
        thread_ = std::thread([this]() {
            while (!done_.wait_for(std::chrono::milliseconds(100))) {
                if (!keep_running) {
                    on_interrupt_();
                    return;
                }
            }
        });
    }
    ~InterruptWatcher() {
        done_.request();
        thread_.join();
    }

private:
    std::function<void()> on_interrupt_;
    StopSignal done_;
    std::thread thread_;
};

class Spinner {
public:
    void tick() {
        idx_ = (idx_ + 1) % FRAMES.size();
        draw();
    }
    void draw() const {
        std::cout << "\r" << FRAMES[idx_] << " Searching..." << std::flush;
    }
    static void clear() {
        std::cout << "\r\033[K" << std::flush;
    }

private:
    static constexpr std::array<const char*, 10> FRAMES{"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
    std::size_t idx_{0};
};

void print_discovered(std::size_t count, const DiscoveredDevice& device) {
    std::cout << "  " << count << ". " << device.instance << " (" << to_string(device.type) << ") at " << device.host
              << "\n";
}

DiscoveryHooks interactive_discovery_hooks(Spinner& spinner) {
    DiscoveryHooks hooks;
    hooks.on_found = [&spinner](std::size_t count, const DiscoveredDevice& device) {
        Spinner::clear();
        print_discovered(count, device);
        spinner.draw();
    };
    hooks.on_tick = [&spinner]() { spinner.tick(); };
    return hooks;
}

bool confirm_devices_found(const std::vector<DiscoveredDevice>&) {
    std::cout << "\nIs this everything? [Y/n]: " << std::flush;
    std::string response;
    std::getline(std::cin, response);
    response.erase(std::remove_if(response.begin(), response.end(), [](unsigned char c) { return std::isspace(c); }),
                   response.end());
    std::transform(response.begin(), response.end(), response.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (response == "n" || response == "no") {
        std::cout << "\nDiscovery aborted.\n"
                     "Please ensure all devices are powered on and on the same network, then try again.\n";
        return false;
    }
    return true;
}

void print_banner(const std::string& title) {
    std::cout << title << "\n" << std::string(title.size(), '=') << "\n\n";
}

void print_configuration(const std::vector<PairedDevice>& paired) {
    std::cout << "\n========================================\n"
                 "Configuration Complete!\n"
                 "========================================\n\n"
                 "Add this to your meter configuration:\n\n"
              << render_meter_config(paired) << std::endl;
}

void write_output(const CommandLine& cl, const BridgeConfig& cfg, const std::vector<PairedDevice>& paired) {
    if (cl.has("output")) {
        write_bridge_config(cl.get("output"), paired, cfg);
        std::cout << "Bridge config written to " << cl.get("output") << "\n";
    }
}

/// Cursor-addressed redraw of the batch status table.
class StatusTable {
public:
    void begin(const std::vector<PairingStatus>& statuses) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_ = statuses.size();
        for (std::size_t i = 0; i < statuses.size(); ++i) {
            std::cout << line(i, statuses[i]) << "\n";
        }
        std::cout << std::flush;
    }
    void update(std::size_t index, const PairingStatus& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto up = lines_ - index;
        std::cout << "\033[" << up << "A\r\033[K" << line(index, status) << "\033[" << up << "B\r" << std::flush;
    }

private:
    static std::string line(std::size_t index, const PairingStatus& status) {
        std::string marker;
        if (status.phase == PairingPhase::Paired) {
            marker = "✓ ";
        } else if (status.phase == PairingPhase::Failed) {
            marker = "✗ ";
        }
        return "[" + std::to_string(index + 1) + "] " + status.device.host + ": " + marker + status.status;
    }

    std::mutex mutex_;
    std::size_t lines_{0};
};

int run_pair_single(const CommandLine& cl, const BridgeConfig& cfg, const std::string& name,
                    std::shared_ptr<HttpClient> http) {
    const auto host = cl.get("host");
    const auto type_name = cl.get("type", "p1meter");
    const auto type = device_type_from_string(type_name);
    if (!type.has_value()) {
        throw std::invalid_argument("unknown device type '" + type_name + "'");
    }
    validate_device_name(name);

    const auto options = pairing_options(cfg);
    print_banner("HomeWizard Device Pairing");
    std::cout << "Device: " << host << "\n\nPress the button on your device NOW!\n\n" << std::flush;

    StopSignal cancel;
    std::string token;
    {
        InterruptWatcher watcher([&cancel]() { cancel.request(); });
        try {
            token = pair_device(
                *http, host, name, options,
                [&options](int attempt) {
                    std::cout << "\rWaiting for button press (attempt " << attempt << "/" << options.max_attempts
                              << ")..." << std::flush;
                },
                &cancel);
        } catch (const std::exception& e) {
            std::cout << std::endl;
            throw std::runtime_error(std::string("pairing failed: ") + e.what());
        }
    }

    std::cout << "\n\n========================================\n"
                 "Pairing Successful!\n"
                 "========================================\n\n"
              << "Token: " << token << "\n";

    const std::vector<PairedDevice> paired{PairedDevice{host, token, *type, host}};
    print_configuration(paired);
    write_output(cl, cfg, paired);
    return 0;
}

int run_pair_discovered(const CommandLine& cl, BridgeConfig cfg, const std::string& name,
                        std::shared_ptr<HttpClient> http) {
    auto disc_options = discovery_options(cfg);
    disc_options.scan_window = std::chrono::seconds(cl.get_int("timeout", cfg.discovery.scan_s));
    validate_device_name(name);

    print_banner("HomeWizard Device Discovery");
    std::cout << "Scanning network (max " << disc_options.scan_window.count() / 1000 << "s)...\n\n";

    auto discovery = make_dnssd_discovery();
    Spinner spinner;
    StatusTable table;
    StopSignal interrupted;

    DiscoverAndPairHooks hooks;
    hooks.discovery = interactive_discovery_hooks(spinner);
    hooks.confirm = [](const std::vector<DiscoveredDevice>& devices) {
        Spinner::clear();
        return confirm_devices_found(devices);
    };
    hooks.on_pairing_start = [&table](const PairingBatch& batch) {
        std::cout << "\n";
        print_banner("HomeWizard Device Pairing");
        std::cout << "Press the button on ALL devices NOW!\n\n";
        table.begin(batch.snapshot());
    };
    hooks.observer = [&table](std::size_t index, const PairingStatus& status) { table.update(index, status); };
    hooks.cancel = &interrupted;

    spinner.draw();
    DiscoverAndPairResult result;
    {
        InterruptWatcher watcher([&interrupted]() { interrupted.request(); });
        try {
            result = discover_and_pair(*discovery, std::move(http), name, disc_options, pairing_options(cfg), hooks);
        } catch (const std::exception&) {
            Spinner::clear();
            throw;
        }
    }
    if (result.aborted) {
        if (interrupted.requested()) {
            Spinner::clear();
            std::cout << "\nCancelled.\n";
        }
        return 1;
    }

    std::cout << "\n";
    if (!result.pairing.failed.empty()) {
        std::cout << "\nWarning: " << result.pairing.failed.size() << " device(s) failed to pair\n";
    }
    print_configuration(result.pairing.paired);
    write_output(cl, cfg, result.pairing.paired);
    return result.pairing.paired.empty() ? 1 : 0;
}

int run_pair(const CommandLine& cl) {
    auto cfg = load_config(cl, false);
    init_logging(cfg);
    const auto name = cl.get("name", cfg.pairing.name);
    auto http = std::make_shared<CurlHttpClient>(http_options(cfg));
    if (cl.has("host")) {
        return run_pair_single(cl, cfg, name, http);
    }
    return run_pair_discovered(cl, cfg, name, http);
}

int run_discover(const CommandLine& cl) {
    const auto cfg = load_config(cl, false);
    init_logging(cfg);
    auto options = discovery_options(cfg);
    options.scan_window = std::chrono::seconds(cl.get_int("timeout", cfg.discovery.scan_s));

    print_banner("HomeWizard Device Discovery");
    auto discovery = make_dnssd_discovery();
    Spinner spinner;
    spinner.draw();
    StopSignal interrupted;
    std::vector<DiscoveredDevice> devices;
    {
        InterruptWatcher watcher([&interrupted]() { interrupted.request(); });
        try {
            devices = collect_devices(*discovery, options, interactive_discovery_hooks(spinner), &interrupted);
        } catch (const std::exception&) {
            Spinner::clear();
            throw;
        }
    }
    Spinner::clear();
    if (devices.empty()) {
        std::cout << "No HomeWizard devices found on network\n";
        return 1;
    }
    std::cout << "\n" << devices.size() << " device(s) found\n";
    for (const auto& d : devices) {
        std::cout << "  " << d.instance << ": " << d.product_type << " serial " << d.serial << " host " << d.host
                  << "\n";
    }
    return 0;
}

std::string format_phases(const PhaseValues& values, const char* unit) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << values[0] << "/" << values[1] << "/" << values[2] << " " << unit;
    return out.str();
}

/// One configured device in the monitor loop; exactly one adapter is set.
struct MonitoredDevice {
    DeviceConfig cfg;
    std::unique_ptr<P1MeterDevice> p1;
    std::unique_ptr<KwhMeterDevice> kwh;
    std::unique_ptr<BatteryDevice> battery;

    DeviceLink& link() {
        if (p1) {
            return p1->link();
        }
        if (kwh) {
            return kwh->link();
        }
        return battery->link();
    }

    std::string describe() const {
        std::ostringstream out;
        out << std::fixed << std::setprecision(1);
        if (p1) {
            out << "power " << p1->power() << " W, phases " << format_phases(p1->phase_powers(cfg.phases), "W")
                << ", import " << p1->total_energy() << " kWh";
            try {
                const auto limits = p1->battery_power_limits();
                out << ", battery limits " << limits.max_consumption_w << "/" << limits.max_production_w << " W";
            } catch (const TimeoutError&) {
                out << ", no battery data";
            }
        } else if (kwh) {
            out << "power " << kwh->power(cfg.invert_power) << " W, phases "
                << format_phases(kwh->phase_powers(cfg.phases, cfg.invert_power), "W") << ", energy "
                << kwh->total_energy(cfg.use_export_energy) << " kWh";
        } else {
            out << "power " << battery->power() << " W, SoC " << battery->state_of_charge() << " %, cycles "
                << battery->cycles();
        }
        return out.str();
    }
};

int run_monitor(const CommandLine& cl) {
    const auto cfg = load_config(cl, true);
    init_logging(cfg);
    if (cfg.devices.empty()) {
        throw std::runtime_error("no devices configured");
    }
    const auto interval = std::chrono::seconds(cl.get_int("interval", cfg.monitor_interval_s));
    auto http = std::make_shared<CurlHttpClient>(http_options(cfg));

    std::vector<MonitoredDevice> devices;
    for (const auto& device_cfg : cfg.devices) {
        MonitoredDevice d;
        d.cfg = device_cfg;
        const auto options = device_options(cfg, device_cfg, http);
        switch (device_cfg.type) {
        case DeviceType::P1Meter:
            d.p1 = std::make_unique<P1MeterDevice>(options);
            break;
        case DeviceType::KwhMeter:
            d.kwh = std::make_unique<KwhMeterDevice>(options);
            break;
        case DeviceType::Battery:
            d.battery = std::make_unique<BatteryDevice>(options);
            break;
        }
        devices.push_back(std::move(d));
    }
    for (auto& d : devices) {
        // Keeps retrying in the background; the first handshake is not awaited.
        d.link().start();
    }

    StopSignal stop;
    InterruptWatcher watcher([&stop]() { stop.request(); });
    do {
        for (auto& d : devices) {
            std::cout << d.cfg.name << " (" << to_string(d.cfg.type) << ", " << to_string(d.link().state()) << "): ";
            try {
                std::cout << d.describe() << "\n";
            } catch (const TimeoutError& e) {
                std::cout << "no fresh data\n";
                EVLOG_debug << d.cfg.name << ": " << e.what();
            }
        }
        std::cout << std::endl;
    } while (!stop.wait_for(interval));

    for (auto& d : devices) {
        d.link().stop();
    }
    return 0;
}

int run_battery_mode(const CommandLine& cl) {
    const auto cfg = load_config(cl, true);
    init_logging(cfg);
    const auto mode_name = cl.get("mode");
    const auto mode = battery_mode_from_string(mode_name);
    if (!mode.has_value()) {
        throw std::invalid_argument("--mode must be zero, to_full or standby");
    }

    const DeviceConfig* target = nullptr;
    for (const auto& d : cfg.devices) {
        if (d.type == DeviceType::P1Meter && (!cl.has("device") || d.name == cl.get("device"))) {
            target = &d;
            break;
        }
    }
    if (!target) {
        throw std::runtime_error("no P1 meter configured to control the batteries");
    }

    auto http = std::make_shared<CurlHttpClient>(http_options(cfg));
    P1MeterDevice meter(device_options(cfg, *target, http));
    try {
        meter.link().start_and_wait(std::chrono::seconds(cfg.timeouts.handshake_s));
    } catch (const std::exception& e) {
        EVLOG_warning << "Streaming connection to " << target->host << " unavailable: " << e.what();
    }
    meter.set_battery_mode(*mode);
    meter.link().stop();
    std::cout << "Battery mode set to " << to_string(*mode) << " via " << target->name << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const auto cl = parse_command_line(argc, argv);
        if (cl.command == "pair") {
            return run_pair(cl);
        }
        if (cl.command == "discover") {
            return run_discover(cl);
        }
        if (cl.command == "monitor") {
            return run_monitor(cl);
        }
        if (cl.command == "battery-mode") {
            return run_battery_mode(cl);
        }
        print_usage();
        return cl.command == "help" ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

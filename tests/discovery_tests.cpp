#include "discovery.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace homewizard;
using namespace homewizard::testing;
using namespace std::chrono_literals;

namespace {

DiscoveryOptions options(std::chrono::milliseconds window, std::chrono::milliseconds quiet) {
    DiscoveryOptions o;
    o.scan_window = window;
    o.quiet_period = quiet;
    o.tick_interval = 10ms;
    return o;
}

} // namespace

int main() {
    // Quiet period: two devices, then silence ends the scan well before the window
    {
        FakeDiscovery discovery({{10ms, make_discovered("192.0.2.1", DeviceType::P1Meter)},
                                 {40ms, make_discovered("192.0.2.2", DeviceType::KwhMeter, "HWE-KWH1")}});
        std::vector<std::size_t> counts;
        DiscoveryHooks hooks;
        hooks.on_found = [&](std::size_t count, const DiscoveredDevice&) { counts.push_back(count); };

        const auto start = std::chrono::steady_clock::now();
        const auto found = collect_devices(discovery, options(10s, 150ms), hooks);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        assert(found.size() == 2);
        assert(found[0].host == "192.0.2.1");
        assert(found[1].type == DeviceType::KwhMeter);
        assert(found[1].product_type == "HWE-KWH1");
        assert((counts == std::vector<std::size_t>{1, 2}));
        assert(elapsed >= 150ms);
        assert(elapsed < 5s);
        assert(discovery.stopped_early);
    }

    // Scan window caps the search even when devices keep arriving
    {
        std::vector<FakeDiscovery::Announcement> schedule;
        for (int i = 0; i < 50; ++i) {
            schedule.push_back({std::chrono::milliseconds(20 * (i + 1)),
                                make_discovered("192.0.2." + std::to_string(100 + i), DeviceType::Battery, "HWE-BAT")});
        }
        FakeDiscovery discovery(schedule);
        const auto start = std::chrono::steady_clock::now();
        const auto found = collect_devices(discovery, options(200ms, 1s));
        const auto elapsed = std::chrono::steady_clock::now() - start;
        assert(!found.empty());
        assert(found.size() < 50);
        assert(elapsed >= 200ms);
        assert(elapsed < 2s);
    }

    // Nothing found: the whole window elapses, progress ticks keep firing
    {
        FakeDiscovery discovery(std::vector<FakeDiscovery::Announcement>{});
        int ticks = 0;
        DiscoveryHooks hooks;
        hooks.on_tick = [&]() { ++ticks; };
        const auto found = collect_devices(discovery, options(120ms, 30ms), hooks);
        assert(found.empty());
        assert(ticks >= 3);
    }

    // Repeated announcements of one host are reported once
    {
        auto again = make_discovered("192.0.2.7", DeviceType::P1Meter);
        again.instance = "p1meter-renamed";
        FakeDiscovery discovery({{5ms, make_discovered("192.0.2.7", DeviceType::P1Meter)},
                                 {10ms, again},
                                 {15ms, make_discovered("192.0.2.8", DeviceType::Battery, "HWE-BAT")},
                                 {20ms, make_discovered("192.0.2.7", DeviceType::P1Meter)}});
        int reported = 0;
        DiscoveryHooks hooks;
        hooks.on_found = [&](std::size_t, const DiscoveredDevice&) { ++reported; };
        const auto found = collect_devices(discovery, options(2s, 80ms), hooks);
        assert(found.size() == 2);
        assert(found[0].instance == "hw-192.0.2.7");
        assert(found[1].host == "192.0.2.8");
        assert(reported == 2);
    }

    // Browser failure with nothing found is an error
    {
        FakeDiscovery discovery(std::vector<FakeDiscovery::Announcement>{}, std::string("mDNS socket unavailable"));
        bool failed = false;
        try {
            collect_devices(discovery, options(2s, 50ms));
        } catch (const std::runtime_error& e) {
            failed = std::string(e.what()) == "mDNS socket unavailable";
        }
        assert(failed);
    }

    // Browser failure after some devices were found keeps what was found
    {
        FakeDiscovery discovery({{5ms, make_discovered("192.0.2.9", DeviceType::P1Meter)}},
                                std::string("browse interrupted"));
        const auto found = collect_devices(discovery, options(2s, 1s));
        assert(found.size() == 1);
        assert(found[0].host == "192.0.2.9");
    }

    // A throwing hook reaches the caller after the browser thread has been stopped and joined
    {
        FakeDiscovery discovery({{5ms, make_discovered("192.0.2.41", DeviceType::P1Meter)}});
        DiscoveryHooks hooks;
        hooks.on_found = [](std::size_t, const DiscoveredDevice&) { throw std::runtime_error("display failed"); };
        bool failed = false;
        try {
            collect_devices(discovery, options(10s, 5s), hooks);
        } catch (const std::runtime_error& e) {
            failed = std::string(e.what()) == "display failed";
        }
        assert(failed);
        assert(discovery.calls == 1);
        assert(discovery.stopped_early);
    }

    // Cancelling ends the scan within a tick and keeps what was found
    {
        FakeDiscovery discovery({{5ms, make_discovered("192.0.2.42", DeviceType::Battery, "HWE-BAT")}});
        StopSignal cancel;
        std::thread interrupter([&cancel]() {
            std::this_thread::sleep_for(50ms);
            cancel.request();
        });
        const auto start = std::chrono::steady_clock::now();
        const auto found = collect_devices(discovery, options(10s, 5s), {}, &cancel);
        const auto elapsed = std::chrono::steady_clock::now() - start;
        interrupter.join();
        assert(found.size() == 1);
        assert(found[0].host == "192.0.2.42");
        assert(elapsed < 2s);
        assert(discovery.stopped_early);
    }

    std::cout << "discovery_tests passed\n";
    return 0;
}

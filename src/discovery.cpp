// SPDX-License-Identifier: Apache-2.0
#include "discovery.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <set>
#include <thread>

#include <everest/logging.hpp>

namespace homewizard {

std::vector<DiscoveredDevice> collect_devices(DiscoveryService& service, const DiscoveryOptions& options,
                                              const DiscoveryHooks& hooks, const StopSignal* cancel) {
    using Clock = std::chrono::steady_clock;

    const auto start = Clock::now();
    const auto deadline = start + options.scan_window;
    const auto tick = options.tick_interval.count() > 0 ? options.tick_interval : std::chrono::milliseconds(100);

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<DiscoveredDevice> arrivals;
    bool done = false;
    std::exception_ptr failure;
    StopSignal scan_stop;

    std::thread listener([&]() {
        try {
            service.discover(deadline, scan_stop, [&](const DiscoveredDevice& device) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    arrivals.push_back(device);
                }
                cv.notify_all();
            });
        } catch (const std::exception& e) {
            EVLOG_warning << "Discovery failed: " << e.what();
            std::lock_guard<std::mutex> lock(mutex);
            failure = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            done = true;
        }
        cv.notify_all();
    });

    // Ends the scan and joins the listener on every exit path, including a throwing hook.
    struct ListenerJoin {
        StopSignal& scan_stop;
        std::thread& listener;
        ~ListenerJoin() {
            scan_stop.request();
            if (listener.joinable()) {
                listener.join();
            }
        }
    } join_listener{scan_stop, listener};

    std::vector<DiscoveredDevice> found;
    std::set<std::string> hosts;
    auto quiet_deadline = Clock::time_point::max();
    auto next_tick = start + tick;
    bool listener_done = false;

    while (true) {
        std::deque<DiscoveredDevice> batch;
        {
            std::unique_lock<std::mutex> lock(mutex);
            const auto wake = std::min({next_tick, quiet_deadline, deadline});
            cv.wait_until(lock, wake, [&]() { return !arrivals.empty() || done; });
            batch.swap(arrivals);
            listener_done = done;
        }

        for (auto& device : batch) {
            if (!hosts.insert(device.host).second) {
                EVLOG_debug << "Ignoring repeated announcement of " << device.host;
                continue;
            }
            found.push_back(std::move(device));
            EVLOG_info << "Discovered " << to_string(found.back().type) << " '" << found.back().instance << "' at "
                       << found.back().host;
            if (hooks.on_found) {
                hooks.on_found(found.size(), found.back());
            }
            quiet_deadline = Clock::now() + options.quiet_period;
        }

        const auto now = Clock::now();
        if (listener_done) {
            break;
        }
        if (cancel && cancel->requested()) {
            EVLOG_info << "Discovery cancelled after " << found.size() << " device(s)";
            break;
        }
        if (now >= quiet_deadline) {
            EVLOG_debug << "Discovery quiet for " << options.quiet_period.count() << " ms, stopping";
            break;
        }
        if (now >= deadline) {
            break;
        }
        if (now >= next_tick) {
            if (hooks.on_tick) {
                hooks.on_tick();
            }
            next_tick += tick;
            if (next_tick < now) {
                next_tick = now + tick;
            }
        }
    }

    scan_stop.request();
    listener.join();

    if (failure && found.empty()) {
        std::rethrow_exception(failure);
    }
    return found;
}

} // namespace homewizard

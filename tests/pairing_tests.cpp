#include "errors.hpp"
#include "pairing.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace homewizard;
using namespace homewizard::testing;
using namespace std::chrono_literals;

namespace {

PairingOptions fast_options() {
    PairingOptions options;
    options.poll_interval = 5ms;
    options.max_attempts = 36;
    options.timeout = 180ms;
    return options;
}

/// Answers 403 until a host has been polled \p presses[host] times, then issues a token.
/// Hosts listed in \p errors answer with that status instead.
std::shared_ptr<FakeHttpClient> button_device(std::map<std::string, int> presses, std::map<std::string, int> errors = {}) {
    auto polls = std::make_shared<std::map<std::string, int>>();
    auto mutex = std::make_shared<std::mutex>();
    return std::make_shared<FakeHttpClient>([=](const HttpRequest& req) -> nlohmann::json {
        const auto begin = req.url.find("//") + 2;
        const auto host = req.url.substr(begin, req.url.find('/', begin) - begin);
        int poll = 0;
        {
            std::lock_guard<std::mutex> lock(*mutex);
            poll = ++(*polls)[host];
        }
        const auto error = errors.find(host);
        if (error != errors.end()) {
            throw HttpError(error->second, R"({"error":"internal"})");
        }
        const auto press = presses.find(host);
        if (press != presses.end() && poll >= press->second) {
            return {{"token", "TOKEN-" + host}, {"name", req.body.value()["name"]}};
        }
        throw HttpError(403, R"({"error":"user:creation-not-enabled"})");
    });
}

template <typename E, typename Fn> bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

template <typename E, typename Fn> std::string error_of(Fn&& fn) {
    try {
        fn();
    } catch (const E& e) {
        return e.what();
    }
    return {};
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

int main() {
    // Name validation
    {
        assert(is_valid_device_name("homewizard-bridge"));
        assert(is_valid_device_name("Home Bridge #2 a/b\\c_d"));
        assert(is_valid_device_name(std::string(40, 'x')));
        assert(!is_valid_device_name(""));
        assert(!is_valid_device_name(std::string(41, 'x')));
        assert(!is_valid_device_name("bridge!"));
        assert(!is_valid_device_name("me@home"));
        assert(!is_valid_device_name("caf\xc3\xa9"));
        const auto message = error_of<InvalidNameError>([]() { validate_device_name("no.dots"); });
        assert(message == "invalid name: must be 1-40 characters (a-z, A-Z, 0-9, -, _, \\, /, #, spaces)");
    }

    // Pairing a single device rejects a bad name before any request goes out
    {
        auto http = button_device({{"192.0.2.39", 1}});
        for (const auto& name : {std::string("bad@name"), std::string(), std::string(41, 'x')}) {
            assert(throws<InvalidNameError>([&]() { pair_device(*http, "192.0.2.39", name, fast_options()); }));
        }
        assert(http->count() == 0);
        assert(pair_device(*http, "192.0.2.39", "bridge", fast_options()) == "TOKEN-192.0.2.39");
    }

    // Token request wire format
    {
        auto http = std::make_shared<FakeHttpClient>(
            [](const HttpRequest&) -> nlohmann::json { return {{"token", "ABCDEF0123"}, {"name", "local/bridge"}}; });
        assert(request_token(*http, "192.0.2.30", "bridge") == "ABCDEF0123");
        const auto req = http->requests().at(0);
        assert(req.method == "POST");
        assert(req.url == "https://192.0.2.30/api/user");
        assert(req.body.value() == (nlohmann::json{{"name", "local/bridge"}}));
        assert(req.headers.at("X-Api-Version") == "2");
        assert(req.headers.at("Content-Type") == "application/json");
        assert(req.headers.count("Authorization") == 0);

        auto odd = std::make_shared<FakeHttpClient>(
            [](const HttpRequest&) -> nlohmann::json { return {{"token", 12}}; });
        assert(throws<DecodeError>([&]() { request_token(*odd, "192.0.2.30", "bridge"); }));
    }

    // Button pressed just before the last attempt: paired on attempt 36
    {
        auto http = button_device({{"192.0.2.31", 36}});
        std::vector<int> attempts;
        const auto token = pair_device(*http, "192.0.2.31", "bridge", fast_options(),
                                       [&](int attempt) { attempts.push_back(attempt); });
        assert(token == "TOKEN-192.0.2.31");
        assert(http->count() == 36);
        assert(attempts.size() == 36 && attempts.front() == 1 && attempts.back() == 36);
    }

    // Button never pressed: exactly max_attempts polls spread over the window, then TimeoutError
    {
        auto http = button_device({});
        const auto start = std::chrono::steady_clock::now();
        const auto message = error_of<TimeoutError>([&]() { pair_device(*http, "192.0.2.32", "bridge", fast_options()); });
        const auto elapsed = std::chrono::steady_clock::now() - start;
        assert(contains(message, "192.0.2.32"));
        assert(http->count() == 36);
        assert(elapsed >= 180ms);
    }

    // A window shorter than max_attempts intervals ends polling early
    {
        auto http = button_device({});
        auto options = fast_options();
        options.timeout = 50ms;
        const auto message = error_of<TimeoutError>([&]() { pair_device(*http, "192.0.2.33", "bridge", options); });
        assert(contains(message, "timeout waiting for button press"));
        assert(http->count() == 10);
    }

    // Anything other than 403 stops at once with PairingError
    {
        auto http = button_device({}, {{"192.0.2.34", 500}});
        const auto message = error_of<PairingError>([&]() { pair_device(*http, "192.0.2.34", "bridge", fast_options()); });
        assert(contains(message, "500"));
        assert(http->count() == 1);

        auto unreachable = std::make_shared<FakeHttpClient>(
            [](const HttpRequest&) -> nlohmann::json { throw HttpTransportError("Couldn't connect to server"); });
        assert(throws<PairingError>([&]() { pair_device(*unreachable, "192.0.2.35", "bridge", fast_options()); }));
        assert(unreachable->count() == 1);
    }

    // Cancellation ends the wait between polls
    {
        auto http = button_device({});
        auto options = fast_options();
        options.poll_interval = 20ms;
        options.timeout = 10s;
        StopSignal cancel;
        std::thread canceller([&]() {
            std::this_thread::sleep_for(70ms);
            cancel.request();
        });
        const auto message =
            error_of<TimeoutError>([&]() { pair_device(*http, "192.0.2.36", "bridge", options, {}, &cancel); });
        canceller.join();
        assert(contains(message, "cancelled"));
        assert(http->count() >= 1 && http->count() < 10);
    }

    // Batch: an invalid name fails before any network call
    {
        auto http = button_device({});
        assert(throws<InvalidNameError>([&]() {
            PairingBatch batch(http, {make_discovered("192.0.2.40", DeviceType::P1Meter)}, "bad name!", fast_options());
        }));
        assert(http->count() == 0);
    }

    // Batch: one device failing does not affect the others; results keep input order
    {
        auto http = button_device({{"192.0.2.41", 3}, {"192.0.2.43", 5}}, {{"192.0.2.42", 500}});
        PairingBatch batch(http,
                           {make_discovered("192.0.2.41", DeviceType::P1Meter),
                            make_discovered("192.0.2.42", DeviceType::KwhMeter, "HWE-KWH3"),
                            make_discovered("192.0.2.43", DeviceType::Battery, "HWE-BAT")},
                           "bridge", fast_options());

        const auto initial = batch.snapshot();
        assert(initial.size() == 3);
        for (const auto& s : initial) {
            assert(s.phase == PairingPhase::Initializing);
            assert(s.status == "initializing...");
        }

        std::mutex seen_mutex;
        std::vector<std::pair<std::size_t, PairingStatus>> seen;
        batch.set_observer([&](std::size_t index, const PairingStatus& status) {
            std::lock_guard<std::mutex> lock(seen_mutex);
            seen.emplace_back(index, status);
        });

        const auto result = batch.run();
        assert(result.paired.size() == 2);
        assert(result.paired[0].host == "192.0.2.41");
        assert(result.paired[0].token == "TOKEN-192.0.2.41");
        assert(result.paired[0].type == DeviceType::P1Meter);
        assert(result.paired[1].host == "192.0.2.43");
        assert(result.paired[1].type == DeviceType::Battery);
        assert(result.failed.size() == 1);
        assert(result.failed[0].host == "192.0.2.42");
        assert(contains(result.failed[0].error, "500"));

        const auto final_state = batch.snapshot();
        assert(final_state[0].phase == PairingPhase::Paired && final_state[0].status == "SUCCESS");
        assert(final_state[0].attempt == 3);
        assert(final_state[1].phase == PairingPhase::Failed);
        assert(final_state[1].status.rfind("FAILED: ", 0) == 0);
        assert(final_state[2].phase == PairingPhase::Paired && final_state[2].attempt == 5);

        assert(http->count_for("192.0.2.41") == 3);
        assert(http->count_for("192.0.2.42") == 1);
        assert(http->count_for("192.0.2.43") == 5);

        // observer saw "waiting" lines with the attempt counter, and one terminal status per device
        std::lock_guard<std::mutex> lock(seen_mutex);
        bool saw_waiting = false;
        std::map<std::size_t, int> terminal;
        for (const auto& [index, status] : seen) {
            if (status.phase == PairingPhase::Waiting && index == 2 && status.attempt == 4) {
                saw_waiting = status.status == "waiting for button press (attempt 4/36)...";
            }
            if (status.phase == PairingPhase::Paired || status.phase == PairingPhase::Failed) {
                ++terminal[index];
            }
        }
        assert(saw_waiting);
        assert(terminal.size() == 3);
        for (const auto& [index, count] : terminal) {
            assert(count == 1);
        }

        assert(throws<std::logic_error>([&]() { batch.run(); }));
    }

    // Batch: cancelling one device leaves the others pairing
    {
        auto http = button_device({{"192.0.2.51", 4}});
        auto options = fast_options();
        options.poll_interval = 10ms;
        options.timeout = 2s;
        options.max_attempts = 200;
        PairingBatch batch(http,
                           {make_discovered("192.0.2.50", DeviceType::KwhMeter, "HWE-KWH1"),
                            make_discovered("192.0.2.51", DeviceType::P1Meter)},
                           "bridge", options);
        assert(throws<std::out_of_range>([&]() { batch.cancel(2); }));
        batch.cancel(0);
        const auto result = batch.run();
        assert(result.paired.size() == 1);
        assert(result.paired[0].host == "192.0.2.51");
        assert(result.failed.size() == 1);
        assert(contains(result.failed[0].error, "cancelled"));
        assert(http->count_for("192.0.2.50") == 0);
    }

    // Batch: an empty device list is a no-op
    {
        auto http = button_device({});
        PairingBatch batch(http, {}, "bridge", fast_options());
        const auto result = batch.run();
        assert(result.paired.empty() && result.failed.empty());
        assert(http->count() == 0);
    }

    // Batch: a throwing observer does not take down the pairing threads
    {
        auto http = button_device({{"192.0.2.52", 2}});
        PairingBatch batch(http, {make_discovered("192.0.2.52", DeviceType::P1Meter)}, "bridge", fast_options());
        std::atomic<int> notified{0};
        batch.set_observer([&](std::size_t, const PairingStatus&) {
            ++notified;
            throw std::runtime_error("display failed");
        });
        const auto result = batch.run();
        assert(result.paired.size() == 1);
        assert(result.paired[0].token == "TOKEN-192.0.2.52");
        assert(result.failed.empty());
        assert(batch.snapshot()[0].phase == PairingPhase::Paired);
        assert(notified >= 2);
    }

    DiscoveryOptions discovery_options;
    discovery_options.scan_window = 2s;
    discovery_options.quiet_period = 100ms;
    discovery_options.tick_interval = 10ms;

    // Discover and pair: everything found inside the window gets paired
    {
        FakeDiscovery discovery({{10ms, make_discovered("192.0.2.60", DeviceType::P1Meter)},
                                 {30ms, make_discovered("192.0.2.61", DeviceType::Battery, "HWE-BAT")}});
        auto http = button_device({{"192.0.2.60", 1}, {"192.0.2.61", 2}});
        std::vector<std::string> confirmed;
        std::size_t rows = 0;
        DiscoverAndPairHooks hooks;
        hooks.confirm = [&](const std::vector<DiscoveredDevice>& devices) {
            for (const auto& d : devices) {
                confirmed.push_back(d.host);
            }
            return true;
        };
        hooks.on_pairing_start = [&](const PairingBatch& batch) { rows = batch.snapshot().size(); };

        const auto result = discover_and_pair(discovery, http, "bridge", discovery_options, fast_options(), hooks);
        assert(!result.aborted);
        assert(result.discovered.size() == 2);
        assert((confirmed == std::vector<std::string>{"192.0.2.60", "192.0.2.61"}));
        assert(rows == 2);
        assert(result.pairing.paired.size() == 2);
        assert(result.pairing.paired[1].token == "TOKEN-192.0.2.61");
        assert(result.pairing.failed.empty());
        assert(discovery.stopped_early);
    }

    // Discover and pair: the operator declines; nothing is contacted
    {
        FakeDiscovery discovery({{5ms, make_discovered("192.0.2.62", DeviceType::P1Meter)}});
        auto http = button_device({{"192.0.2.62", 1}});
        DiscoverAndPairHooks hooks;
        hooks.confirm = [](const std::vector<DiscoveredDevice>&) { return false; };
        const auto result = discover_and_pair(discovery, http, "bridge", discovery_options, fast_options(), hooks);
        assert(result.aborted);
        assert(result.discovered.size() == 1);
        assert(result.pairing.paired.empty());
        assert(http->count() == 0);
    }

    // Discover and pair: nothing on the network
    {
        FakeDiscovery discovery(std::vector<FakeDiscovery::Announcement>{});
        auto http = button_device({});
        auto options = discovery_options;
        options.scan_window = 60ms;
        const auto message = error_of<std::runtime_error>(
            [&]() { discover_and_pair(discovery, http, "bridge", options, fast_options()); });
        assert(message == "no HomeWizard devices found on network");
    }

    // Discover and pair: an invalid name is rejected before discovery starts
    {
        FakeDiscovery discovery({{5ms, make_discovered("192.0.2.63", DeviceType::P1Meter)}});
        auto http = button_device({});
        assert(throws<InvalidNameError>(
            [&]() { discover_and_pair(discovery, http, "", discovery_options, fast_options()); }));
        assert(discovery.calls == 0);
        assert(http->count() == 0);
    }

    // Discover and pair: a cancel request aborts every pending pairing
    {
        FakeDiscovery discovery({{5ms, make_discovered("192.0.2.64", DeviceType::P1Meter)},
                                 {10ms, make_discovered("192.0.2.65", DeviceType::KwhMeter, "SDM630-wifi")}});
        auto http = button_device({});
        auto options = fast_options();
        options.poll_interval = 20ms;
        options.timeout = 30s;
        options.max_attempts = 1000;
        StopSignal interrupted;
        std::thread interrupter;
        DiscoverAndPairHooks hooks;
        hooks.cancel = &interrupted;
        hooks.on_pairing_start = [&](const PairingBatch&) {
            interrupter = std::thread([&interrupted]() {
                std::this_thread::sleep_for(80ms);
                interrupted.request();
            });
        };
        const auto start = std::chrono::steady_clock::now();
        const auto result = discover_and_pair(discovery, http, "bridge", discovery_options, options, hooks);
        interrupter.join();
        assert(std::chrono::steady_clock::now() - start < 5s);
        assert(result.pairing.paired.empty());
        assert(result.pairing.failed.size() == 2);
        for (const auto& f : result.pairing.failed) {
            assert(contains(f.error, "cancelled"));
        }
    }

    // Discover and pair: cancelling during the scan aborts before anything is contacted
    {
        FakeDiscovery discovery({{5ms, make_discovered("192.0.2.66", DeviceType::P1Meter)}});
        auto http = button_device({{"192.0.2.66", 1}});
        auto options = discovery_options;
        options.scan_window = 10s;
        options.quiet_period = 5s;
        StopSignal interrupted;
        bool confirm_called = false;
        DiscoverAndPairHooks hooks;
        hooks.cancel = &interrupted;
        hooks.confirm = [&](const std::vector<DiscoveredDevice>&) {
            confirm_called = true;
            return true;
        };
        std::thread interrupter([&interrupted]() {
            std::this_thread::sleep_for(50ms);
            interrupted.request();
        });
        const auto start = std::chrono::steady_clock::now();
        const auto result = discover_and_pair(discovery, http, "bridge", options, fast_options(), hooks);
        interrupter.join();
        assert(std::chrono::steady_clock::now() - start < 2s);
        assert(result.aborted);
        assert(result.discovered.size() == 1);
        assert(!confirm_called);
        assert(result.pairing.paired.empty());
        assert(http->count() == 0);
    }

    std::cout << "pairing_tests passed\n";
    return 0;
}

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_types.hpp"
#include "discovery.hpp"
#include "http_client.hpp"
#include "stop_signal.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace homewizard {

struct PairingOptions {
    std::chrono::milliseconds poll_interval{5000};
    int max_attempts{36};
    std::chrono::milliseconds timeout{std::chrono::minutes(3)};
};

/// 1-40 characters of [A-Za-z0-9], '-', '_', '/', '\', '#' and space.
bool is_valid_device_name(const std::string& name);
/// \throws InvalidNameError
void validate_device_name(const std::string& name);

/// \brief One POST /api/user. Returns the token; HTTP 403 (button not pressed yet)
/// surfaces as HttpError like any other status.
std::string request_token(HttpClient& http, const std::string& host, const std::string& name);

using AttemptCallback = std::function<void(int attempt)>;

/// \brief Poll the device until its button is pressed and it issues a token.
///
/// An invalid \p name throws InvalidNameError before the first request.
/// Attempt k is made at start + k * poll_interval, where start is \p started_at (a batch
/// shares one) or now. 403 retries; any other failure throws PairingError. Throws
/// TimeoutError after max_attempts, when the next attempt would fall after
/// start + options.timeout, or when \p cancel is requested.
std::string pair_device(HttpClient& http, const std::string& host, const std::string& name,
                        const PairingOptions& options, const AttemptCallback& on_attempt = {},
                        const StopSignal* cancel = nullptr,
                        std::optional<std::chrono::steady_clock::time_point> started_at = std::nullopt);

enum class PairingPhase { Initializing, Waiting, Paired, Failed };

const char* to_string(PairingPhase phase);

struct PairingStatus {
    DiscoveredDevice device;
    PairingPhase phase{PairingPhase::Initializing};
    int attempt{0};
    std::string status{"initializing..."}; // human-readable line
    std::string token;
    std::string error;
};

struct PairedDevice {
    std::string host;
    std::string token;
    DeviceType type{DeviceType::P1Meter};
    std::string instance;
};

struct PairingFailure {
    std::string host;
    std::string error;
};

struct BatchPairingResult {
    std::vector<PairedDevice> paired; // in input order, failed devices left out
    std::vector<PairingFailure> failed;
};

/// Called after every status change, outside the status lock, possibly from several
/// pairing threads at once.
using BatchObserver = std::function<void(std::size_t index, const PairingStatus& status)>;

/// \brief Pairs several devices concurrently under one shared deadline.
///
/// One thread per device. The status table is guarded by a single mutex that is never
/// held across a network call; per-device failures are isolated.
class PairingBatch {
public:
    /// \throws InvalidNameError before anything else happens
    PairingBatch(std::shared_ptr<HttpClient> http, std::vector<DiscoveredDevice> devices, std::string name,
                 PairingOptions options = {});

    PairingBatch(const PairingBatch&) = delete;
    PairingBatch& operator=(const PairingBatch&) = delete;

    void set_observer(BatchObserver observer);

    /// \brief Pair every device and wait for all of them. May be called once.
    BatchPairingResult run();

    std::vector<PairingStatus> snapshot() const;
    std::size_t size() const {
        return devices_.size();
    }

    /// \brief Stop pairing one device; the others keep going.
    void cancel(std::size_t index);
    void cancel_all();

private:
    void pair_one(std::size_t index, std::chrono::steady_clock::time_point started_at);
    template <typename Fn> void update(std::size_t index, Fn&& fn);

    std::shared_ptr<HttpClient> http_;
    std::vector<DiscoveredDevice> devices_;
    std::string name_;
    PairingOptions options_;
    BatchObserver observer_;
    std::atomic<bool> ran_{false};

    std::vector<std::unique_ptr<StopSignal>> stops_;
    mutable std::mutex status_mutex_;
    std::vector<PairingStatus> statuses_;
};

struct DiscoverAndPairHooks {
    DiscoveryHooks discovery;
    /// Operator confirmation of the discovered list. Empty means yes.
    std::function<bool(const std::vector<DiscoveredDevice>&)> confirm;
    /// Called right before the batch runs, e.g. to render snapshot().
    std::function<void(const PairingBatch&)> on_pairing_start;
    BatchObserver observer;
    /// Once requested, the scan ends early (the result is aborted) or every pending
    /// pairing attempt is cancelled.
    const StopSignal* cancel{nullptr};
};

struct DiscoverAndPairResult {
    std::vector<DiscoveredDevice> discovered;
    BatchPairingResult pairing;
    bool aborted{false}; // operator rejected the discovered list, or cancelled during the scan
};

/// \brief Validate the name, discover, confirm, then pair everything found.
/// Throws std::runtime_error when discovery finds nothing.
DiscoverAndPairResult discover_and_pair(DiscoveryService& discovery, std::shared_ptr<HttpClient> http,
                                        const std::string& name, const DiscoveryOptions& discovery_options,
                                        const PairingOptions& pairing_options, const DiscoverAndPairHooks& hooks = {});

} // namespace homewizard

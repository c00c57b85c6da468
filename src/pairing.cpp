// SPDX-License-Identifier: Apache-2.0
#include "pairing.hpp"

#include "errors.hpp"

#include <cctype>
#include <stdexcept>
#include <thread>

#include <everest/logging.hpp>

namespace homewizard {

namespace {

constexpr std::size_t MAX_NAME_LENGTH = 40;
constexpr int FORBIDDEN = 403;
constexpr std::chrono::milliseconds CANCEL_POLL(100);

bool allowed_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '/' || c == '\\' ||
           c == '#' || c == ' ';
}

std::string waiting_line(int attempt, int max_attempts) {
    return "waiting for button press (attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
           ")...";
}

} // namespace

bool is_valid_device_name(const std::string& name) {
    if (name.empty() || name.size() > MAX_NAME_LENGTH) {
        return false;
    }
    for (const char c : name) {
        if (!allowed_name_char(c)) {
            return false;
        }
    }
    return true;
}

void validate_device_name(const std::string& name) {
    if (!is_valid_device_name(name)) {
        throw InvalidNameError("invalid name: must be 1-40 characters (a-z, A-Z, 0-9, -, _, \\, /, #, spaces)");
    }
}

std::string request_token(HttpClient& http, const std::string& host, const std::string& name) {
    HttpRequest req;
    req.method = "POST";
    req.url = "https://" + host + "/api/user";
    req.body = nlohmann::json{{"name", "local/" + name}};
    req.headers[API_VERSION_HEADER] = API_VERSION;
    req.headers["Content-Type"] = "application/json";

    const auto response = http.request(req);
    if (!response.is_object() || !response.contains("token") || !response["token"].is_string()) {
        throw DecodeError("unexpected token response from " + host);
    }
    return response["token"].get<std::string>();
}

std::string pair_device(HttpClient& http, const std::string& host, const std::string& name,
                        const PairingOptions& options, const AttemptCallback& on_attempt, const StopSignal* cancel,
                        std::optional<std::chrono::steady_clock::time_point> started_at) {
    validate_device_name(name);
    const auto start = started_at.value_or(std::chrono::steady_clock::now());
    const auto end = start + options.timeout;

    StopSignal never;
    const StopSignal& stop = cancel ? *cancel : never;

    for (int attempt = 1; attempt <= options.max_attempts; ++attempt) {
        const auto tick = start + attempt * options.poll_interval;
        if (tick > end) {
            throw TimeoutError("timeout waiting for button press on " + host);
        }
        if (stop.wait_until(tick)) {
            throw TimeoutError("pairing with " + host + " cancelled");
        }
        if (on_attempt) {
            on_attempt(attempt);
        }
        try {
            const auto token = request_token(http, host, name);
            EVLOG_info << "Paired with " << host << " after " << attempt << " attempt(s)";
            return token;
        } catch (const HttpError& e) {
            if (e.status() != FORBIDDEN) {
                throw PairingError("pairing with " + host + " failed: " + e.what());
            }
            EVLOG_debug << "Button not pressed yet on " << host << " (attempt " << attempt << ")";
        } catch (const HttpTransportError& e) {
            throw PairingError("pairing with " + host + " failed: " + e.what());
        } catch (const DecodeError& e) {
            throw PairingError("pairing with " + host + " failed: " + e.what());
        }
    }
    throw TimeoutError("no button press on " + host + " after " + std::to_string(options.max_attempts) +
                       " attempts");
}

const char* to_string(PairingPhase phase) {
    switch (phase) {
    case PairingPhase::Initializing:
        return "initializing";
    case PairingPhase::Waiting:
        return "waiting";
    case PairingPhase::Paired:
        return "paired";
    case PairingPhase::Failed:
        return "failed";
    }
    return "unknown";
}

// PairingBatch

PairingBatch::PairingBatch(std::shared_ptr<HttpClient> http, std::vector<DiscoveredDevice> devices, std::string name,
                           PairingOptions options) :
    http_(std::move(http)), devices_(std::move(devices)), name_(std::move(name)), options_(options) {
    validate_device_name(name_);
    if (!http_) {
        http_ = std::make_shared<CurlHttpClient>();
    }
    statuses_.reserve(devices_.size());
    for (const auto& device : devices_) {
        stops_.push_back(std::make_unique<StopSignal>());
        PairingStatus status;
        status.device = device;
        statuses_.push_back(status);
    }
}

void PairingBatch::set_observer(BatchObserver observer) {
    observer_ = std::move(observer);
}

template <typename Fn> void PairingBatch::update(std::size_t index, Fn&& fn) {
    PairingStatus copy;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        fn(statuses_[index]);
        copy = statuses_[index];
    }
    if (!observer_) {
        return;
    }
    try {
        observer_(index, copy);
    } catch (const std::exception& e) {
        EVLOG_warning << "Pairing status observer failed for " << copy.device.host << ": " << e.what();
    }
}

std::vector<PairingStatus> PairingBatch::snapshot() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return statuses_;
}

void PairingBatch::cancel(std::size_t index) {
    if (index >= stops_.size()) {
        throw std::out_of_range("no device at index " + std::to_string(index));
    }
    stops_[index]->request();
}

void PairingBatch::cancel_all() {
    for (auto& stop : stops_) {
        stop->request();
    }
}

void PairingBatch::pair_one(std::size_t index, std::chrono::steady_clock::time_point started_at) {
    const auto& host = devices_[index].host;
    try {
        const auto token = pair_device(
            *http_, host, name_, options_,
            [this, index](int attempt) {
                update(index, [&](PairingStatus& s) {
                    s.phase = PairingPhase::Waiting;
                    s.attempt = attempt;
                    s.status = waiting_line(attempt, options_.max_attempts);
                });
            },
            stops_[index].get(), started_at);
        update(index, [&](PairingStatus& s) {
            s.phase = PairingPhase::Paired;
            s.token = token;
            s.status = "SUCCESS";
        });
    } catch (const std::exception& e) {
        EVLOG_warning << "Pairing " << host << " failed: " << e.what();
        const std::string error = e.what();
        update(index, [&](PairingStatus& s) {
            s.phase = PairingPhase::Failed;
            s.error = error;
            s.status = "FAILED: " + error;
        });
    }
}

BatchPairingResult PairingBatch::run() {
    if (ran_.exchange(true)) {
        throw std::logic_error("pairing batch already ran");
    }
    const auto started_at = std::chrono::steady_clock::now();
    EVLOG_info << "Pairing " << devices_.size() << " device(s) as '" << name_ << "'";

    std::vector<std::thread> workers;
    workers.reserve(devices_.size());
    for (std::size_t i = 0; i < devices_.size(); ++i) {
        workers.emplace_back([this, i, started_at]() { pair_one(i, started_at); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    BatchPairingResult result;
    for (const auto& status : snapshot()) {
        if (status.phase == PairingPhase::Paired) {
            result.paired.push_back(
                PairedDevice{status.device.host, status.token, status.device.type, status.device.instance});
        } else {
            result.failed.push_back(PairingFailure{status.device.host, status.error});
        }
    }
    if (!result.failed.empty()) {
        EVLOG_warning << result.failed.size() << " device(s) failed to pair";
    }
    return result;
}

// Discovery then pairing

DiscoverAndPairResult discover_and_pair(DiscoveryService& discovery, std::shared_ptr<HttpClient> http,
                                        const std::string& name, const DiscoveryOptions& discovery_options,
                                        const PairingOptions& pairing_options, const DiscoverAndPairHooks& hooks) {
    validate_device_name(name);

    DiscoverAndPairResult result;
    result.discovered = collect_devices(discovery, discovery_options, hooks.discovery, hooks.cancel);
    if (hooks.cancel && hooks.cancel->requested()) {
        EVLOG_info << "Discovery cancelled, nothing paired";
        result.aborted = true;
        return result;
    }
    if (result.discovered.empty()) {
        throw std::runtime_error("no HomeWizard devices found on network");
    }
    if (hooks.confirm && !hooks.confirm(result.discovered)) {
        EVLOG_info << "Discovery aborted by operator";
        result.aborted = true;
        return result;
    }

    PairingBatch batch(std::move(http), result.discovered, name, pairing_options);
    batch.set_observer(hooks.observer);
    if (hooks.on_pairing_start) {
        hooks.on_pairing_start(batch);
    }

    StopSignal finished;
    std::thread relay;
    if (hooks.cancel) {
        relay = std::thread([&]() {
            while (!finished.wait_for(CANCEL_POLL)) {
                if (hooks.cancel->requested()) {
                    EVLOG_info << "Pairing cancelled";
                    batch.cancel_all();
                    return;
                }
            }
        });
    }
    struct RelayJoin {
        StopSignal& finished;
        std::thread& relay;
        ~RelayJoin() {
            finished.request();
            if (relay.joinable()) {
                relay.join();
            }
        }
    } join_relay{finished, relay};

    result.pairing = batch.run();
    return result;
}

} // namespace homewizard

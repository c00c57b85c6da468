// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace homewizard {

/// \brief Single-slot store for the latest value of a continuously updated quantity.
///
/// A read succeeds only while `now - last_write <= max_age`. Never-written and expired
/// are the same failure (StaleValueError). Value and timestamp are guarded together so
/// concurrent set/get never observe a torn record.
template <typename T> class FreshnessCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit FreshnessCache(Clock::duration max_age) : max_age_(max_age) {}

    FreshnessCache(const FreshnessCache&) = delete;
    FreshnessCache& operator=(const FreshnessCache&) = delete;

    void set(T value, Clock::time_point now = Clock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(value);
        updated_at_ = now;
    }

    T get(Clock::time_point now = Clock::now()) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!value_.has_value()) {
            throw StaleValueError("no value received yet");
        }
        const auto age = now - updated_at_;
        if (age > max_age_) {
            const auto age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
            throw StaleValueError("value is stale (age " + std::to_string(age_ms) + " ms)");
        }
        return *value_;
    }

    /// \brief Time since the last write, or nullopt if nothing was written yet.
    std::optional<Clock::duration> age(Clock::time_point now = Clock::now()) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!value_.has_value()) {
            return std::nullopt;
        }
        return now - updated_at_;
    }

    Clock::duration max_age() const {
        return max_age_;
    }

private:
    const Clock::duration max_age_;
    mutable std::mutex mutex_;
    std::optional<T> value_;
    Clock::time_point updated_at_{};
};

} // namespace homewizard

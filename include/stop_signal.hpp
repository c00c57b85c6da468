// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace homewizard {

/// \brief One-way stop flag with interruptible waits. Scoped to a single task tree
/// (one connection, one pairing attempt, one discovery scan).
class StopSignal {
public:
    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    /// \brief Sleep for \p duration unless stopped first. Returns true if stopped.
    template <typename Rep, typename Period> bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this]() { return stopped_; });
    }

    template <typename Clock, typename Duration>
    bool wait_until(std::chrono::time_point<Clock, Duration> deadline) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [this]() { return stopped_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool stopped_{false};
};

} // namespace homewizard

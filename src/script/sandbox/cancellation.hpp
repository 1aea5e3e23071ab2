/*
 * cancellation.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_CANCELLATION_HPP
#define CODEPAGE_SCRIPT_SANDBOX_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace codepage::sandbox {

/**
 * @brief One-shot cancellation flag that interrupts timed waits
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isCancelled() const {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    /**
     * @brief Sleep for the given duration unless cancelled first
     * @return false if the wait was cut short by cancellation
     */
    template <typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
};

}  // namespace codepage::sandbox

#endif  // CODEPAGE_SCRIPT_SANDBOX_CANCELLATION_HPP

// include/order_ngin/execution/cancellation_token.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace order_ngin {

/**
 * @brief Cooperative cancellation signal with interruptible timed waits
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep until the deadline or until cancelled
     * @return true if cancelled
     */
    bool wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [this] {
            return cancelled_.load(std::memory_order_acquire);
        });
    }

    bool wait_for(std::chrono::milliseconds timeout) {
        return wait_until(std::chrono::steady_clock::now() + timeout);
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace order_ngin

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared stop signal for every blocking wait of a source. Waiters poll the
// flag at least every kPollInterval, so request_cancel() is observed without
// a notification.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Sets the flag and wakes every waiter
    void cancel() noexcept;

    // Sets the flag only, safe to call from a signal handler
    void request_cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Returns true when the deadline was reached, false if cancelled first
    bool sleep_until(Clock::time_point deadline) const;

    template <typename Rep, typename Period>
    bool sleep_for(const std::chrono::duration<Rep, Period>& duration) const {
        return sleep_until(Clock::now() + std::chrono::duration_cast<Clock::duration>(duration));
    }

    // Blocks until cancel() is called
    void wait() const;

    static constexpr std::chrono::milliseconds kPollInterval{50};

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cond_;
};

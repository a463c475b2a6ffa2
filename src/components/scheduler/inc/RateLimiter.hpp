#pragma once

#include "CancellationToken.hpp"
#include "WaitStatus.hpp"
#include <chrono>
#include <memory>
#include <mutex>

// Token bucket with a capacity of one token, refilled at `rate` tokens per
// second. The bucket starts full. A rate of 0 disables limiting.
class RateLimiter {
public:
    using Clock = CancellationToken::Clock;

    // Throws std::invalid_argument for a negative rate
    explicit RateLimiter(double rate);

    // Limiter allowing one record per delay, a zero delay disables limiting
    static std::unique_ptr<RateLimiter> from_delay(std::chrono::nanoseconds delay);

    // Takes one token, blocking until it is available. A cancelled wait gives
    // its reserved token back.
    WaitStatus wait(const CancellationToken& cancel);

    double rate() const noexcept { return rate_; }

    static constexpr double kCapacity = 1.0;

private:
    void refill(Clock::time_point now);

    const double rate_;
    std::mutex mutex_;
    double tokens_ = kCapacity;
    Clock::time_point last_refill_;
};

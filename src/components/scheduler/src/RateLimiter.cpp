#include "RateLimiter.hpp"
#include <algorithm>
#include <stdexcept>

RateLimiter::RateLimiter(double rate)
    : rate_(rate), last_refill_(Clock::now()) {
    if (rate_ < 0) {
        throw std::invalid_argument("Rate limit must be greater or equal to 0");
    }
}

std::unique_ptr<RateLimiter> RateLimiter::from_delay(std::chrono::nanoseconds delay) {
    if (delay.count() < 0) {
        throw std::invalid_argument("Delay must be greater or equal to 0");
    }
    if (delay.count() == 0) {
        return std::make_unique<RateLimiter>(0.0);
    }
    return std::make_unique<RateLimiter>(1.0 / std::chrono::duration<double>(delay).count());
}

void RateLimiter::refill(Clock::time_point now) {
    if (now > last_refill_) {
        const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
        tokens_ = std::min(kCapacity, tokens_ + elapsed * rate_);
        last_refill_ = now;
    }
}

WaitStatus RateLimiter::wait(const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return WaitStatus::Cancelled;
    }
    if (rate_ == 0.0) {
        return WaitStatus::Ready;
    }

    Clock::time_point ready_at;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        refill(now);

        // Reserve the token now, the balance may go negative
        tokens_ -= 1.0;
        if (tokens_ >= 0.0) {
            return WaitStatus::Ready;
        }
        ready_at = now + std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(-tokens_ / rate_));
    }

    if (cancel.sleep_until(ready_at)) {
        return WaitStatus::Ready;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    refill(Clock::now());
    tokens_ = std::min(kCapacity, tokens_ + 1.0);
    return WaitStatus::Cancelled;
}

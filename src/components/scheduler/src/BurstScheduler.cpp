#include "BurstScheduler.hpp"
#include <stdexcept>

BurstScheduler::BurstScheduler(std::chrono::nanoseconds sleep_time, std::chrono::nanoseconds generate_time)
    : BurstScheduler(sleep_time, generate_time, Clock::now()) {}

BurstScheduler::BurstScheduler(std::chrono::nanoseconds sleep_time, std::chrono::nanoseconds generate_time,
                               Clock::time_point start)
    : sleep_time_(sleep_time), generate_time_(generate_time) {

    if (sleep_time_.count() < 0) {
        throw std::invalid_argument("Burst sleep time must be greater or equal to 0");
    }
    if (enabled() && generate_time_.count() <= 0) {
        throw std::invalid_argument("Burst generate time must be greater than 0 when sleep time is set");
    }

    if (enabled()) {
        window_end_ = start + std::chrono::duration_cast<Clock::duration>(generate_time_);
    }
}

WaitStatus BurstScheduler::wait(const CancellationToken& cancel) {
    return wait(Clock::now(), cancel);
}

WaitStatus BurstScheduler::wait(Clock::time_point now, const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return WaitStatus::Cancelled;
    }
    if (!enabled() || now < window_end_) {
        return WaitStatus::Ready;
    }

    // Skip whole periods until the window ends in the future
    const auto period = std::chrono::duration_cast<Clock::duration>(sleep_time_ + generate_time_);
    const auto periods = (now - window_end_) / period + 1;
    window_end_ += period * periods;

    const auto wake_at = window_end_ - std::chrono::duration_cast<Clock::duration>(generate_time_);
    if (wake_at <= now) {
        return WaitStatus::Ready;
    }

    return cancel.sleep_until(wake_at) ? WaitStatus::Ready : WaitStatus::Cancelled;
}

#pragma once

#include "CancellationToken.hpp"
#include "WaitStatus.hpp"
#include <chrono>

// Alternates between a generate phase of generate_time and a silent phase of
// sleep_time. The first generate phase starts at construction. A zero
// sleep_time disables bursting and wait() only checks for cancellation.
class BurstScheduler {
public:
    using Clock = CancellationToken::Clock;

    // Throws std::invalid_argument for a negative sleep_time, or a non-positive
    // generate_time while bursting is enabled
    BurstScheduler(std::chrono::nanoseconds sleep_time, std::chrono::nanoseconds generate_time);
    BurstScheduler(std::chrono::nanoseconds sleep_time, std::chrono::nanoseconds generate_time,
                   Clock::time_point start);

    // Returns immediately during a generate phase, otherwise blocks until the
    // next one begins or the token is cancelled
    WaitStatus wait(const CancellationToken& cancel);
    WaitStatus wait(Clock::time_point now, const CancellationToken& cancel);

    bool enabled() const noexcept { return sleep_time_.count() > 0; }

    // End of the current (or most recently computed) generate phase
    Clock::time_point window_end() const noexcept { return window_end_; }

private:
    std::chrono::nanoseconds sleep_time_;
    std::chrono::nanoseconds generate_time_;
    Clock::time_point window_end_;
};

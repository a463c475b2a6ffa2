#include "CancellationToken.hpp"
#include <algorithm>

void CancellationToken::cancel() noexcept {
    request_cancel();
    cond_.notify_all();
}

bool CancellationToken::sleep_until(Clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!is_cancelled()) {
        auto now = Clock::now();
        if (now >= deadline) {
            return true;
        }
        auto slice_end = std::min(deadline, now + kPollInterval);
        cond_.wait_until(lock, slice_end, [this] { return is_cancelled(); });
    }
    return false;
}

void CancellationToken::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!is_cancelled()) {
        cond_.wait_for(lock, kPollInterval, [this] { return is_cancelled(); });
    }
}

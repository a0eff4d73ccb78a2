#include "bulkfetch/rate_limiter.hpp"

#include <algorithm>
#include <cmath>

namespace bulkfetch {

namespace {

constexpr std::chrono::hours kMaxInterval{24};

} // namespace

RateLimiter::RateLimiter(double rate_per_second)
    : rate_(std::isfinite(rate_per_second) ? rate_per_second : 0.0) {
    if (rate_ > 0.0) {
        const double seconds = 1.0 / rate_;
        if (!std::isfinite(seconds) || seconds >= std::chrono::duration<double>(kMaxInterval).count()) {
            interval_ = kMaxInterval;
        } else {
            interval_ = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
        }
    }
}

AcquireStatus RateLimiter::acquire(const CancellationToken& token) {
    if (token.isCancelled()) {
        return AcquireStatus::Cancelled;
    }
    if (rate_ <= 0.0) {
        return AcquireStatus::Acquired;
    }

    Clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        slot = started_ ? std::max(now, next_slot_) : now;
        next_slot_ = slot + interval_;
        started_ = true;
    }

    if (token.waitUntil(slot)) {
        return AcquireStatus::Acquired;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Only the most recent reservation can be returned without
        // disturbing the spacing of later waiters.
        if (next_slot_ == slot + interval_) {
            next_slot_ = slot;
        }
    }
    return AcquireStatus::Cancelled;
}

} // namespace bulkfetch

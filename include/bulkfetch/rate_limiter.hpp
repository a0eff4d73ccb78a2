#pragma once

#include "cancellation.hpp"

#include <chrono>
#include <mutex>

namespace bulkfetch {

enum class AcquireStatus { Acquired, Cancelled };

// Token bucket with a burst of one: admits at most `rate_per_second` starts per
// second, spaced evenly. A rate <= 0 or a non-finite rate disables limiting;
// very small rates are capped at one start per day. Thread-safe.
class RateLimiter {
public:
    explicit RateLimiter(double rate_per_second);

    // Blocks until a start is admitted or the token is cancelled. A cancelled
    // waiter hands its reserved slot back.
    [[nodiscard]] AcquireStatus acquire(const CancellationToken& token);

    [[nodiscard]] double rate() const { return rate_; }
    [[nodiscard]] std::chrono::steady_clock::duration interval() const { return interval_; }

private:
    using Clock = std::chrono::steady_clock;

    double rate_;
    Clock::duration interval_{};
    std::mutex mutex_;
    Clock::time_point next_slot_{};
    bool started_{false};
};

} // namespace bulkfetch

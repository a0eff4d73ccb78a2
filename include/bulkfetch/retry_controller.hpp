#pragma once

#include "cancellation.hpp"
#include "fetch_strategy.hpp"
#include "rate_limiter.hpp"
#include "work_item.hpp"

#include <chrono>

namespace bulkfetch {

struct RetryPolicy {
    int max_retries{3};
    // Wait after failed attempt N is N * backoff_step.
    std::chrono::milliseconds backoff_step{std::chrono::seconds(1)};
};

class RetryController {
public:
    RetryController(RateLimiter& limiter, RetryPolicy policy);

    // Runs up to max_retries + 1 attempts of `strategy` for `item`. Every
    // attempt first takes a rate limiter slot. Always returns an outcome.
    FetchOutcome run(const CancellationToken& token,
                     const WorkItem& item,
                     FetchStrategy& strategy,
                     const ByteProgressFn& on_bytes = {}) const;

    [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

private:
    RateLimiter& limiter_;
    RetryPolicy policy_;
};

} // namespace bulkfetch

#include "bulkfetch/retry_controller.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace bulkfetch {

namespace {

struct RetryState {
    int attempt{0};
    FetchError last_error;
};

} // namespace

RetryController::RetryController(RateLimiter& limiter, RetryPolicy policy)
    : limiter_(limiter), policy_(std::move(policy)) {
    policy_.max_retries = std::max(0, policy_.max_retries);
}

FetchOutcome RetryController::run(const CancellationToken& token,
                                  const WorkItem& item,
                                  FetchStrategy& strategy,
                                  const ByteProgressFn& on_bytes) const {
    const auto started = std::chrono::steady_clock::now();
    FetchOutcome outcome;
    outcome.work_item_id = item.id;
    outcome.local_path = item.destination;

    auto finish = [&](FetchOutcome& out) -> FetchOutcome {
        out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return std::move(out);
    };

    const int max_attempts = policy_.max_retries + 1;
    RetryState state;

    while (state.attempt < max_attempts) {
        if (limiter_.acquire(token) == AcquireStatus::Cancelled) {
            outcome.attempts = state.attempt;
            outcome.error = cancelledError(ErrorKind::RateLimitCancelled, "rate limit wait cancelled");
            return finish(outcome);
        }

        ++state.attempt;
        FetchResult result;
        try {
            result = strategy.fetch(token, item.id, item.destination, on_bytes);
        } catch (const std::exception& ex) {
            result = FetchResult{};
            result.error = networkError(std::string{strategy.name()} + " strategy error: " + ex.what());
        }

        if (result.ok) {
            outcome.succeeded = true;
            outcome.attempts = state.attempt;
            outcome.content_hash = std::move(result.content_hash);
            outcome.bytes_transferred = result.bytes_written;
            return finish(outcome);
        }

        state.last_error = std::move(result.error);
        outcome.attempts = state.attempt;

        if (isCancellation(state.last_error.kind)) {
            outcome.error = state.last_error;
            return finish(outcome);
        }

        spdlog::warn("Attempt {}/{} for {} failed: {}", state.attempt, max_attempts, item.id,
                     state.last_error.message);

        if (!state.last_error.retryable) {
            outcome.error = state.last_error;
            return finish(outcome);
        }
        if (state.attempt >= max_attempts) {
            break;
        }

        const auto backoff = policy_.backoff_step * state.attempt;
        spdlog::debug("Retrying {} in {} ms", item.id, backoff.count());
        if (!token.waitFor(backoff)) {
            outcome.error = cancelledError(ErrorKind::BatchCancelled, "cancelled during backoff");
            return finish(outcome);
        }
    }

    outcome.error = retriesExhausted(state.last_error, state.attempt);
    return finish(outcome);
}

} // namespace bulkfetch

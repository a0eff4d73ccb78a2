#include "bulkfetch/result_sink.hpp"

#include <utility>

namespace bulkfetch {

ResultSink::ResultSink(OutcomeListener listener) : listener_(std::move(listener)) {}

void ResultSink::record(FetchOutcome outcome) {
    if (listener_) {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener_(outcome);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(std::move(outcome));
}

std::size_t ResultSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size();
}

std::vector<FetchOutcome> ResultSink::outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

std::vector<FetchOutcome> ResultSink::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FetchOutcome> out;
    out.swap(outcomes_);
    return out;
}

BatchSummary summarize(const std::vector<FetchOutcome>& outcomes) {
    BatchSummary summary;
    summary.total = outcomes.size();
    for (const auto& outcome : outcomes) {
        summary.bytes += outcome.bytes_transferred;
        if (outcome.succeeded) {
            ++summary.succeeded;
            if (outcome.skipped) {
                ++summary.skipped;
            }
            continue;
        }

        const FetchError error = outcome.error.value_or(FetchError{});
        if (isCancellation(error.kind)) {
            ++summary.cancelled;
        } else {
            ++summary.failed;
        }
        summary.failures.push_back(FailureLine{outcome.work_item_id, describe(error)});
    }
    return summary;
}

} // namespace bulkfetch

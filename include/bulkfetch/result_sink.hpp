#pragma once

#include "work_item.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace bulkfetch {

using OutcomeListener = std::function<void(const FetchOutcome&)>;

// Collects outcomes from all workers in completion order. The listener, if
// set, sees every outcome exactly once; calls to it are serialized.
class ResultSink {
public:
    ResultSink() = default;
    explicit ResultSink(OutcomeListener listener);

    void record(FetchOutcome outcome);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<FetchOutcome> outcomes() const;
    std::vector<FetchOutcome> take();

private:
    OutcomeListener listener_;
    std::mutex listener_mutex_;
    mutable std::mutex mutex_;
    std::vector<FetchOutcome> outcomes_;
};

struct FailureLine {
    std::string source;
    std::string reason;
};

struct BatchSummary {
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    std::size_t skipped{0};
    std::uint64_t bytes{0};
    std::vector<FailureLine> failures;

    [[nodiscard]] bool allSucceeded() const { return failed == 0 && cancelled == 0; }
};

BatchSummary summarize(const std::vector<FetchOutcome>& outcomes);

} // namespace bulkfetch

#pragma once

#include "cancellation.hpp"
#include "fetch_strategy.hpp"
#include "progress.hpp"
#include "rate_limiter.hpp"
#include "result_sink.hpp"
#include "retry_controller.hpp"
#include "work_item.hpp"

#include <chrono>
#include <filesystem>
#include <vector>

namespace bulkfetch {

// What to do when an item's destination already exists before the batch
// touches it.
enum class ExistingFilePolicy { Skip, Overwrite };

struct DispatcherOptions {
    std::filesystem::path output_dir{"downloads"};
    int concurrency{5};
    double rate_limit{5.0};
    RetryPolicy retry{};
    ExistingFilePolicy existing{ExistingFilePolicy::Skip};
    std::chrono::milliseconds progress_interval{500};
};

// Runs one batch on a fixed pool of worker threads.
class Dispatcher {
public:
    Dispatcher(DispatcherOptions options, FetchStrategyRegistry registry);

    // Must be set before run(); called once per outcome from worker threads.
    void setOutcomeListener(OutcomeListener listener);

    // Blocks until every item has exactly one outcome. Throws BatchSetupError
    // for an empty batch or an unusable output directory, before any work
    // starts. Outcomes are in completion order.
    std::vector<FetchOutcome> run(const CancellationToken& token, std::vector<WorkItem> items);

    [[nodiscard]] ProgressSnapshot progress() const { return progress_.snapshot(); }
    [[nodiscard]] std::vector<ProgressEvent> progressEvents() { return channel_.drain(); }
    [[nodiscard]] const DispatcherOptions& options() const { return options_; }

private:
    void prepareOutputDirectory() const;
    FetchOutcome processItem(const CancellationToken& token, const WorkItem& item);

    DispatcherOptions options_;
    FetchStrategyRegistry registry_;
    RateLimiter limiter_;
    RetryController retry_;
    ProgressAggregator progress_;
    ProgressChannel channel_;
    OutcomeListener listener_;
};

} // namespace bulkfetch

#include "bulkfetch/dispatcher.hpp"

#include "bulkfetch/content_hash.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace bulkfetch {

namespace {

// Hands every item out exactly once; pop() returns nullopt once exhausted.
class WorkQueue {
public:
    explicit WorkQueue(std::vector<WorkItem> items) : items_(std::move(items)) {}

    std::optional<WorkItem> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (next_ >= items_.size()) {
            return std::nullopt;
        }
        return std::move(items_[next_++]);
    }

private:
    std::mutex mutex_;
    std::vector<WorkItem> items_;
    std::size_t next_{0};
};

FetchOutcome makeFailure(const WorkItem& item, FetchError error) {
    FetchOutcome outcome;
    outcome.work_item_id = item.id;
    outcome.local_path = item.destination;
    outcome.error = std::move(error);
    return outcome;
}

} // namespace

Dispatcher::Dispatcher(DispatcherOptions options, FetchStrategyRegistry registry)
    : options_(std::move(options)),
      registry_(std::move(registry)),
      limiter_(options_.rate_limit),
      retry_(limiter_, options_.retry) {}

void Dispatcher::setOutcomeListener(OutcomeListener listener) {
    listener_ = std::move(listener);
}

void Dispatcher::prepareOutputDirectory() const {
    namespace fs = std::filesystem;

    std::error_code ec;
    const bool created = fs::create_directories(options_.output_dir, ec);
    if (ec) {
        throw BatchSetupError("Failed to create output directory: "
                              + options_.output_dir.string() + " - " + ec.message());
    }
    if (!fs::is_directory(options_.output_dir, ec)) {
        throw BatchSetupError("Output path is not a directory: " + options_.output_dir.string());
    }
    if (created) {
        fs::permissions(options_.output_dir,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec
                            | fs::perms::others_read | fs::perms::others_exec,
                        ec);
        if (ec) {
            spdlog::warn("Cannot set permissions on {}: {}", options_.output_dir.string(), ec.message());
        }
    }
}

std::vector<FetchOutcome> Dispatcher::run(const CancellationToken& token, std::vector<WorkItem> items) {
    if (items.empty()) {
        throw BatchSetupError("No sources to download");
    }
    if (registry_.empty()) {
        throw BatchSetupError("No fetch strategies registered");
    }
    prepareOutputDirectory();

    const std::size_t total = items.size();
    const std::size_t worker_count =
        std::min<std::size_t>(total, static_cast<std::size_t>(std::max(1, options_.concurrency)));

    spdlog::info("Starting batch: {} items, {} workers, {} req/s, {} retries",
                 total, worker_count, options_.rate_limit, retry_.policy().max_retries);

    progress_.start(total);
    ResultSink sink(listener_);
    WorkQueue queue(std::move(items));

    auto worker = [this, &token, &queue, &sink]() {
        while (auto item = queue.pop()) {
            FetchOutcome outcome = processItem(token, *item);
            if (progress_.report(outcome)) {
                spdlog::debug("Last outcome recorded");
            }
            sink.record(std::move(outcome));
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    try {
        for (std::size_t i = 0; i < worker_count; ++i) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error& ex) {
        // The workers already running drain the whole queue.
        spdlog::error("Started only {} of {} workers: {}", threads.size(), worker_count, ex.what());
        if (threads.empty()) {
            throw BatchSetupError(std::string{"Cannot start worker threads: "} + ex.what());
        }
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    auto outcomes = sink.take();
    const auto snapshot = progress_.snapshot();
    spdlog::info("Batch finished: {} succeeded, {} failed, {} cancelled",
                 snapshot.succeeded, snapshot.failed, snapshot.cancelled);
    return outcomes;
}

FetchOutcome Dispatcher::processItem(const CancellationToken& token, const WorkItem& item) {
    if (token.isCancelled()) {
        return makeFailure(item, cancelledError(ErrorKind::BatchCancelled, "batch cancelled before start"));
    }

    FetchStrategy* strategy = registry_.select(item.id);
    if (!strategy) {
        spdlog::warn("No fetch strategy for {}", item.id);
        return makeFailure(item, unsupportedSource(item.id));
    }

    std::error_code ec;
    if (options_.existing == ExistingFilePolicy::Skip && std::filesystem::exists(item.destination, ec)) {
        try {
            FetchOutcome outcome;
            outcome.work_item_id = item.id;
            outcome.local_path = item.destination;
            outcome.succeeded = true;
            outcome.skipped = true;
            outcome.content_hash = sha256File(item.destination);
            spdlog::info("File already exists, skipping: {}", item.destination.string());
            return outcome;
        } catch (const std::exception& ex) {
            return makeFailure(item, filesystemError(ex.what()));
        }
    }

    ProgressThrottle throttle(channel_, item.id, item.size_hint, options_.progress_interval);
    const ByteProgressFn on_bytes = [&throttle](std::uint64_t downloaded, std::optional<std::uint64_t> total) {
        throttle.update(downloaded, total);
    };

    FetchOutcome outcome = retry_.run(token, item, *strategy, on_bytes);
    if (outcome.succeeded) {
        spdlog::info("Downloaded {} -> {} ({} bytes, sha256 {})", item.id, outcome.local_path.string(),
                     outcome.bytes_transferred, outcome.content_hash.value_or(""));
    } else if (outcome.error) {
        spdlog::warn("Failed {}: {}", item.id, describe(*outcome.error));
    }
    return outcome;
}

} // namespace bulkfetch

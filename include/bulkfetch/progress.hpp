#pragma once

#include "work_item.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bulkfetch {

struct ProgressSnapshot {
    std::size_t total{0};
    std::size_t completed{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    std::size_t skipped{0};

    [[nodiscard]] bool done() const { return total > 0 && completed == total; }
};

// Batch-wide counters, one report() per finished item.
class ProgressAggregator {
public:
    void start(std::size_t total);

    // Returns true for the report that brings `completed` up to `total`.
    bool report(const FetchOutcome& outcome);

    [[nodiscard]] ProgressSnapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    ProgressSnapshot state_;
};

struct ProgressEvent {
    std::string item_id;
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    std::optional<double> percent;
};

// Bounded, lossy hand-off between transfer threads and a reporter. offer()
// never blocks: a newer event for a queued item replaces the older one, and
// events for new items are dropped while the channel is full.
class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity = 256);

    // Returns false if the event was dropped.
    bool offer(ProgressEvent event);
    [[nodiscard]] std::vector<ProgressEvent> drain();

    [[nodiscard]] std::size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::size_t capacity_;
    std::vector<ProgressEvent> pending_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t dropped_{0};
};

// Per-item rate limit in front of a ProgressChannel. Not thread-safe; each
// transfer owns its own throttle.
class ProgressThrottle {
public:
    ProgressThrottle(ProgressChannel& channel,
                     std::string item_id,
                     std::optional<std::uint64_t> size_hint,
                     std::chrono::milliseconds min_interval = std::chrono::milliseconds(500));

    void update(std::uint64_t downloaded, std::optional<std::uint64_t> total);

private:
    ProgressChannel& channel_;
    std::string item_id_;
    std::optional<std::uint64_t> size_hint_;
    std::chrono::milliseconds min_interval_;
    std::optional<std::chrono::steady_clock::time_point> last_emit_;
};

} // namespace bulkfetch

#include "bulkfetch/progress.hpp"

#include <algorithm>
#include <utility>

namespace bulkfetch {

void ProgressAggregator::start(std::size_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ProgressSnapshot{};
    state_.total = total;
}

bool ProgressAggregator::report(const FetchOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.completed >= state_.total) {
        return false;
    }

    ++state_.completed;
    if (outcome.succeeded) {
        ++state_.succeeded;
        if (outcome.skipped) {
            ++state_.skipped;
        }
    } else if (outcome.error && isCancellation(outcome.error->kind)) {
        ++state_.cancelled;
    } else {
        ++state_.failed;
    }
    return state_.completed == state_.total;
}

ProgressSnapshot ProgressAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ProgressChannel::ProgressChannel(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

bool ProgressChannel::offer(ProgressEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = index_.find(event.item_id);
    if (it != index_.end()) {
        pending_[it->second] = std::move(event);
        return true;
    }
    if (pending_.size() >= capacity_) {
        ++dropped_;
        return false;
    }
    index_.emplace(event.item_id, pending_.size());
    pending_.push_back(std::move(event));
    return true;
}

std::vector<ProgressEvent> ProgressChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> out;
    out.swap(pending_);
    index_.clear();
    return out;
}

std::size_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

ProgressThrottle::ProgressThrottle(ProgressChannel& channel,
                                   std::string item_id,
                                   std::optional<std::uint64_t> size_hint,
                                   std::chrono::milliseconds min_interval)
    : channel_(channel),
      item_id_(std::move(item_id)),
      size_hint_(size_hint),
      min_interval_(min_interval) {}

void ProgressThrottle::update(std::uint64_t downloaded, std::optional<std::uint64_t> total) {
    if (!total || *total == 0) {
        total = size_hint_;
    }

    const bool finished = total && *total > 0 && downloaded >= *total;
    const auto now = std::chrono::steady_clock::now();
    if (!finished && last_emit_ && now - *last_emit_ < min_interval_) {
        return;
    }
    last_emit_ = now;

    ProgressEvent event;
    event.item_id = item_id_;
    event.downloaded_bytes = downloaded;
    event.total_bytes = total;
    if (total && *total > 0) {
        event.percent = std::min(100.0, 100.0 * static_cast<double>(downloaded) / static_cast<double>(*total));
    }
    channel_.offer(std::move(event));
}

} // namespace bulkfetch

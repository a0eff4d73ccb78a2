#include "bulkfetch/cancellation.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace bulkfetch {

struct CancellationToken::State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
};

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

bool CancellationToken::isCancelled() const {
    return state_->cancelled.load();
}

bool CancellationToken::waitFor(std::chrono::steady_clock::duration duration) const {
    return waitUntil(std::chrono::steady_clock::now() + duration);
}

bool CancellationToken::waitUntil(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    const bool cancelled = state_->cv.wait_until(lock, deadline, [this] {
        return state_->cancelled.load();
    });
    return !cancelled;
}

} // namespace bulkfetch

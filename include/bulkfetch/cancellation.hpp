#pragma once

#include <chrono>
#include <memory>

namespace bulkfetch {

// Shared cancellation flag for one batch. Copies refer to the same state, so a
// token can be handed to every worker while the caller keeps one to cancel.
class CancellationToken {
public:
    CancellationToken();

    void cancel() const;
    [[nodiscard]] bool isCancelled() const;

    // Sleeps for `duration` unless cancelled first.
    // Returns true if the full duration elapsed, false on cancellation.
    bool waitFor(std::chrono::steady_clock::duration duration) const;
    bool waitUntil(std::chrono::steady_clock::time_point deadline) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};

} // namespace bulkfetch

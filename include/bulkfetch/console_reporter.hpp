#pragma once

#include "progress.hpp"
#include "result_sink.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace bulkfetch {

// Redrawing terminal panel for a running batch plus the final report.
class ConsoleReporter {
public:
    explicit ConsoleReporter(std::ostream& out);

    void update(const ProgressSnapshot& snapshot, std::vector<ProgressEvent> events);
    void markFinished(const FetchOutcome& outcome);
    void redraw();

    [[nodiscard]] std::string buildProgressPanel() const;

    static std::string formatTaskLine(const ProgressEvent& event);
    static std::string formatSize(std::uint64_t bytes);
    static std::string formatOutcome(const FetchOutcome& outcome);
    static std::string formatSummary(const BatchSummary& summary);

private:
    static constexpr std::size_t kMaxTaskLines = 10;

    std::ostream& out_;
    mutable std::mutex mutex_;
    ProgressSnapshot snapshot_;
    std::map<std::string, ProgressEvent> active_;
    // Late progress events for these ids are dropped.
    std::set<std::string> finished_;
    std::size_t previous_lines_{0};
};

} // namespace bulkfetch

#include "bulkfetch/console_reporter.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include <fmt/format.h>

namespace bulkfetch {

ConsoleReporter::ConsoleReporter(std::ostream& out) : out_(out) {}

void ConsoleReporter::update(const ProgressSnapshot& snapshot, std::vector<ProgressEvent> events) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = snapshot;
    for (auto& event : events) {
        if (finished_.count(event.item_id) != 0) {
            continue;
        }
        auto id = event.item_id;
        active_[id] = std::move(event);
    }
}

void ConsoleReporter::markFinished(const FetchOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(outcome.work_item_id);
    finished_.insert(outcome.work_item_id);
}

std::string ConsoleReporter::buildProgressPanel() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string panel;
    panel.reserve(kMaxTaskLines * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("bulkfetch: {}/{} done ({} ok, {} failed, {} cancelled)\n",
                         snapshot_.completed, snapshot_.total,
                         snapshot_.succeeded, snapshot_.failed, snapshot_.cancelled);
    panel.append("--------------------------------------------------\n");

    std::size_t shown = 0;
    for (const auto& entry : active_) {
        if (shown == kMaxTaskLines) {
            panel += fmt::format("... and {} more\n", active_.size() - shown);
            break;
        }
        panel += formatTaskLine(entry.second);
        panel.push_back('\n');
        ++shown;
    }

    panel.append("--------------------------------------------------\n");
    if (snapshot_.total > 0) {
        const double ratio = static_cast<double>(snapshot_.completed) / static_cast<double>(snapshot_.total);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ConsoleReporter::formatTaskLine(const ProgressEvent& event) {
    std::string display_name = std::filesystem::path{event.item_id}.filename().string();
    if (display_name.empty()) {
        display_name = event.item_id;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (!event.percent || !event.total_bytes) {
        return fmt::format("{:<20} [{}]", display_name, formatSize(event.downloaded_bytes));
    }

    const double ratio = *event.percent / 100.0;
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    return fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                       display_name,
                       bar,
                       static_cast<int>(*event.percent),
                       formatSize(event.downloaded_bytes),
                       formatSize(*event.total_bytes));
}

std::string ConsoleReporter::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string ConsoleReporter::formatOutcome(const FetchOutcome& outcome) {
    if (outcome.succeeded && outcome.skipped) {
        return fmt::format("Skipped existing: {} -> {} (SHA256: {})", outcome.work_item_id,
                           outcome.local_path.string(), outcome.content_hash.value_or("?"));
    }
    if (outcome.succeeded) {
        return fmt::format("Successfully downloaded: {} -> {} (SHA256: {})", outcome.work_item_id,
                           outcome.local_path.string(), outcome.content_hash.value_or("?"));
    }
    const FetchError error = outcome.error.value_or(FetchError{});
    return fmt::format("Failed to download {}: {} ({})", outcome.work_item_id, describe(error), error.message);
}

std::string ConsoleReporter::formatSummary(const BatchSummary& summary) {
    std::string text = "Download summary:\n";
    text += fmt::format("Total: {}\n", summary.total);
    text += fmt::format("Successful: {} ({} skipped)\n", summary.succeeded, summary.skipped);
    text += fmt::format("Failed: {}\n", summary.failed);
    text += fmt::format("Cancelled: {}\n", summary.cancelled);
    text += fmt::format("Transferred: {}\n", formatSize(summary.bytes));
    for (const auto& failure : summary.failures) {
        text += fmt::format("  {}: {}\n", failure.source, failure.reason);
    }
    return text;
}

void ConsoleReporter::redraw() {
    const auto panel = buildProgressPanel();
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace bulkfetch

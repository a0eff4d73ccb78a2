#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bulkfetch {

struct WorkItem {
    std::string id;
    std::filesystem::path destination;
    std::optional<std::uint64_t> size_hint;
};

struct FetchOutcome {
    std::string work_item_id;
    std::filesystem::path local_path;
    bool succeeded{false};
    bool skipped{false};
    std::optional<FetchError> error;
    std::optional<std::string> content_hash;
    std::uint64_t bytes_transferred{0};
    int attempts{0};
    std::chrono::milliseconds elapsed{0};
};

// Pairs every source identifier with a destination under `output_dir`,
// named by deriveFilename().
std::vector<WorkItem> makeWorkItems(const std::vector<std::string>& sources,
                                    const std::filesystem::path& output_dir);

} // namespace bulkfetch

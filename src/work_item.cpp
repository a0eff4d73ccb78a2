#include "bulkfetch/work_item.hpp"

#include "bulkfetch/filename.hpp"

namespace bulkfetch {

std::vector<WorkItem> makeWorkItems(const std::vector<std::string>& sources,
                                    const std::filesystem::path& output_dir) {
    std::vector<WorkItem> items;
    items.reserve(sources.size());
    for (const auto& source : sources) {
        items.push_back(WorkItem{source, output_dir / deriveFilename(source), std::nullopt});
    }
    return items;
}

} // namespace bulkfetch

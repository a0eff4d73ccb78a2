#include "bulkfetch/fetch_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace bulkfetch {

void FetchStrategyRegistry::add(FetchStrategyPtr strategy) {
    if (strategy) {
        strategies_.push_back(std::move(strategy));
    }
}

FetchStrategy* FetchStrategyRegistry::select(const std::string& source) const {
    for (const auto& strategy : strategies_) {
        if (strategy->accepts(source)) {
            return strategy.get();
        }
    }
    return nullptr;
}

std::string sourceScheme(const std::string& source) {
    const auto pos = source.find("://");
    if (pos == std::string::npos || pos == 0) {
        return {};
    }

    std::string scheme = source.substr(0, pos);
    const bool valid = std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
    if (!valid) {
        return {};
    }
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme;
}

} // namespace bulkfetch

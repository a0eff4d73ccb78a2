#include "bulkfetch/filename.hpp"

#include "bulkfetch/content_hash.hpp"

#include <algorithm>
#include <string_view>

namespace bulkfetch {

namespace {

constexpr std::string_view kUnsafeChars = "/\\:*?\"<>|";

std::string lastPathElement(const std::string& source) {
    std::string trimmed = source;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    if (trimmed.empty() || trimmed == "/") {
        return trimmed;
    }

    const auto slash = trimmed.find_last_of('/');
    if (slash == std::string::npos) {
        return trimmed;
    }
    return trimmed.substr(slash + 1);
}

} // namespace

std::string sanitizeFilename(std::string name) {
    std::replace_if(name.begin(), name.end(),
                    [](char c) { return kUnsafeChars.find(c) != std::string_view::npos; },
                    '_');
    return name;
}

std::string deriveFilename(const std::string& source) {
    const std::string base = lastPathElement(source);
    if (base.empty() || base == "/" || base == "." || base == "..") {
        return "downloaded_file_" + sha256Hex(source);
    }
    return sanitizeFilename(base);
}

} // namespace bulkfetch

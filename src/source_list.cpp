#include "bulkfetch/source_list.hpp"

#include <fstream>
#include <stdexcept>

namespace bulkfetch {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(first, last - first + 1);
}

} // namespace

std::vector<std::string> parseSourceList(std::istream& in) {
    std::vector<std::string> sources;
    std::string line;
    while (std::getline(in, line)) {
        std::string source = trim(line);
        if (source.empty() || source.front() == '#') {
            continue;
        }
        sources.push_back(std::move(source));
    }
    return sources;
}

std::vector<std::string> readSourceList(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open URL file: " + path.string());
    }

    auto sources = parseSourceList(in);
    if (in.bad()) {
        throw std::runtime_error("Error reading URLs from " + path.string());
    }
    return sources;
}

} // namespace bulkfetch

#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace bulkfetch {

// One identifier per line; surrounding whitespace is trimmed, blank lines and
// lines starting with '#' are ignored.
std::vector<std::string> parseSourceList(std::istream& in);

// Throws std::runtime_error if the file cannot be opened or read.
std::vector<std::string> readSourceList(const std::filesystem::path& path);

} // namespace bulkfetch

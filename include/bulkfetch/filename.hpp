#pragma once

#include <string>

namespace bulkfetch {

// Replaces / \ : * ? " < > | with '_'.
std::string sanitizeFilename(std::string name);

// Last path element of the identifier, sanitized. Empty, ".", ".." or "/"
// elements fall back to "downloaded_file_<sha256 of the identifier>".
std::string deriveFilename(const std::string& source);

} // namespace bulkfetch

#pragma once

#include <string>

namespace bulkfetch {

// Installs a colored stderr logger named "bulkfetch" as the spdlog default.
// `level` is one of trace, debug, info, warn, error, critical, off; anything
// else throws std::runtime_error.
void initLogging(const std::string& level);

} // namespace bulkfetch

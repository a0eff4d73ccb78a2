#include "bulkfetch/logging.hpp"

#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace bulkfetch {

void initLogging(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw std::runtime_error("Unknown log level: " + level);
    }

    auto logger = spdlog::get("bulkfetch");
    if (!logger) {
        logger = spdlog::stderr_color_mt("bulkfetch");
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(parsed);
    spdlog::set_default_logger(logger);
}

} // namespace bulkfetch

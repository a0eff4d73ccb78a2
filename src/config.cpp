#include "bulkfetch/config.hpp"

#include <cmath>
#include <iostream>

#include <fmt/format.h>

namespace bulkfetch {

namespace {

constexpr int kMaxConcurrency = 64;
constexpr double kMinRateLimit = 0.001;

template <typename T, typename Convert>
T parseNumber(const std::string& option, const std::string& value, Convert convert) {
    try {
        std::size_t consumed = 0;
        const T result = convert(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(fmt::format("Invalid value for {}: {}", option, value));
        }
        return result;
    } catch (const std::logic_error&) {
        throw ConfigError(fmt::format("Invalid value for {}: {}", option, value));
    }
}

int parseInt(const std::string& option, const std::string& value) {
    return parseNumber<int>(option, value,
                            [](const std::string& s, std::size_t* pos) { return std::stoi(s, pos); });
}

double parseDouble(const std::string& option, const std::string& value) {
    return parseNumber<double>(option, value,
                               [](const std::string& s, std::size_t* pos) { return std::stod(s, pos); });
}

} // namespace

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] [<url> ...]\n"
              << "Options:\n"
              << "  -d <directory>     Output directory (default: ./downloads)\n"
              << "  -f <file>          File with one URL per line (default: urls.txt)\n"
              << "  -c <workers>       Parallel downloads (default: 5)\n"
              << "  -r <rate>          Request starts per second, 0 = unlimited (default: 5)\n"
              << "  -n <retries>       Retries per URL after the first attempt (default: 3)\n"
              << "  -T <seconds>       Per-attempt timeout (default: 30)\n"
              << "  --overwrite        Re-download files that already exist\n"
              << "  --log-level <lvl>  trace, debug, info, warn, error or off (default: info)\n"
              << "  -h, --help         Show this message" << std::endl;
}

Config parseArguments(int argc, const char* const* argv) {
    Config config;
    int arg_index = 1;

    auto requireValue = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw ConfigError("Missing value for " + option);
        }
        arg_index += 2;
        return argv[arg_index - 1];
    };

    while (arg_index < argc) {
        const std::string option = argv[arg_index];
        if (option.empty() || option[0] != '-') {
            config.sources.push_back(option);
            ++arg_index;
            continue;
        }

        if (option == "-d") {
            config.output_dir = requireValue(option);
        } else if (option == "-f") {
            config.source_file = requireValue(option);
            config.source_file_given = true;
        } else if (option == "-c") {
            config.concurrency = parseInt(option, requireValue(option));
            if (config.concurrency <= 0 || config.concurrency > kMaxConcurrency) {
                throw ConfigError(fmt::format("Concurrency must be between 1 and {}", kMaxConcurrency));
            }
        } else if (option == "-r") {
            config.rate_limit = parseDouble(option, requireValue(option));
            if (!std::isfinite(config.rate_limit) || config.rate_limit < 0.0) {
                throw ConfigError("Rate limit must be a non-negative number");
            }
            if (config.rate_limit > 0.0 && config.rate_limit < kMinRateLimit) {
                throw ConfigError(fmt::format("Rate limit must be 0 or at least {}", kMinRateLimit));
            }
        } else if (option == "-n") {
            config.max_retries = parseInt(option, requireValue(option));
            if (config.max_retries < 0) {
                throw ConfigError("Retry count cannot be negative");
            }
        } else if (option == "-T") {
            const int seconds = parseInt(option, requireValue(option));
            if (seconds <= 0) {
                throw ConfigError("Timeout must be positive");
            }
            config.timeout = std::chrono::seconds(seconds);
        } else if (option == "--overwrite") {
            config.existing = ExistingFilePolicy::Overwrite;
            ++arg_index;
        } else if (option == "--log-level") {
            config.log_level = requireValue(option);
        } else if (option == "-h" || option == "--help") {
            config.show_help = true;
            ++arg_index;
        } else {
            throw ConfigError("Unknown option: " + option);
        }
    }

    return config;
}

DispatcherOptions toDispatcherOptions(const Config& config) {
    DispatcherOptions options;
    options.output_dir = config.output_dir;
    options.concurrency = config.concurrency;
    options.rate_limit = config.rate_limit;
    options.retry.max_retries = config.max_retries;
    options.existing = config.existing;
    return options;
}

HttpFetchOptions toHttpOptions(const Config& config) {
    HttpFetchOptions options;
    options.timeout = config.timeout;
    return options;
}

} // namespace bulkfetch

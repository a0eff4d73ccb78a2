#pragma once

#include "dispatcher.hpp"
#include "http_fetch_strategy.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace bulkfetch {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    std::filesystem::path output_dir{"./downloads"};
    double rate_limit{5.0};
    int max_retries{3};
    int concurrency{5};
    std::filesystem::path source_file{"urls.txt"};
    bool source_file_given{false};
    std::chrono::seconds timeout{30};
    ExistingFilePolicy existing{ExistingFilePolicy::Skip};
    std::string log_level{"info"};
    std::vector<std::string> sources;
    bool show_help{false};
};

// Parses command line flags. Throws ConfigError on unknown flags, missing
// values or out-of-range numbers.
Config parseArguments(int argc, const char* const* argv);

void printUsage(const char* program_name);

DispatcherOptions toDispatcherOptions(const Config& config);
HttpFetchOptions toHttpOptions(const Config& config);

} // namespace bulkfetch

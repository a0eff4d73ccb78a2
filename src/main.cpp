#include "bulkfetch/config.hpp"
#include "bulkfetch/console_reporter.hpp"
#include "bulkfetch/detail/curl_utils.hpp"
#include "bulkfetch/dispatcher.hpp"
#include "bulkfetch/http_fetch_strategy.hpp"
#include "bulkfetch/logging.hpp"
#include "bulkfetch/source_list.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onSignal(int) { g_interrupted = 1; }

std::vector<std::string> collectSources(const bulkfetch::Config& config) {
    std::vector<std::string> sources;
    // urls.txt is only required when nothing was given on the command line.
    if (config.source_file_given || config.sources.empty()) {
        sources = bulkfetch::readSourceList(config.source_file);
    }
    sources.insert(sources.end(), config.sources.begin(), config.sources.end());
    return sources;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const bulkfetch::Config config = bulkfetch::parseArguments(argc, argv);
        if (config.show_help) {
            bulkfetch::printUsage(argv[0]);
            return 0;
        }

        bulkfetch::initLogging(config.log_level);
        bulkfetch::detail::ensureCurlInitialized();

        const auto sources = collectSources(config);
        if (sources.empty()) {
            std::cout << "No URLs to download" << std::endl;
            return 0;
        }

        bulkfetch::FetchStrategyRegistry registry;
        registry.add(std::make_shared<bulkfetch::HttpFetchStrategy>(bulkfetch::toHttpOptions(config)));

        bulkfetch::Dispatcher dispatcher(bulkfetch::toDispatcherOptions(config), std::move(registry));
        bulkfetch::ConsoleReporter reporter(std::cout);
        dispatcher.setOutcomeListener([&reporter](const bulkfetch::FetchOutcome& outcome) {
            reporter.markFinished(outcome);
        });

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        bulkfetch::CancellationToken token;
        auto items = bulkfetch::makeWorkItems(sources, config.output_dir);
        auto batch = std::async(std::launch::async, [&dispatcher, &token, items = std::move(items)]() mutable {
            return dispatcher.run(token, std::move(items));
        });

        while (batch.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
            if (g_interrupted && !token.isCancelled()) {
                spdlog::warn("Interrupted, cancelling remaining downloads");
                token.cancel();
            }
            reporter.update(dispatcher.progress(), dispatcher.progressEvents());
            reporter.redraw();
        }
        reporter.update(dispatcher.progress(), {});
        reporter.redraw();

        const auto outcomes = batch.get();
        std::cout << '\n';
        for (const auto& outcome : outcomes) {
            std::cout << bulkfetch::ConsoleReporter::formatOutcome(outcome) << '\n';
        }

        const auto summary = bulkfetch::summarize(outcomes);
        std::cout << '\n' << bulkfetch::ConsoleReporter::formatSummary(summary) << std::flush;
        return summary.allSucceeded() ? 0 : 1;
    } catch (const bulkfetch::ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        bulkfetch::printUsage(argv[0]);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}

#include <catch2/catch.hpp>

#include "bulkfetch/content_hash.hpp"
#include "bulkfetch/dispatcher.hpp"
#include "bulkfetch/http_fetch_strategy.hpp"
#include "loopback_http_server.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <thread>

using namespace std::chrono_literals;
using bulkfetch::testing::CannedResponse;
using bulkfetch::testing::LoopbackHttpServer;
using bulkfetch::testing::TempDir;

namespace {

bulkfetch::FetchStrategyRegistry httpRegistry() {
    bulkfetch::FetchStrategyRegistry registry;
    registry.add(std::make_shared<bulkfetch::HttpFetchStrategy>());
    return registry;
}

bulkfetch::DispatcherOptions fastOptions(const std::filesystem::path& output_dir) {
    bulkfetch::DispatcherOptions options;
    options.output_dir = output_dir;
    options.concurrency = 4;
    options.rate_limit = 0.0;
    options.retry = bulkfetch::RetryPolicy{1, 10ms};
    return options;
}

std::map<std::string, bulkfetch::FetchOutcome> byId(const std::vector<bulkfetch::FetchOutcome>& outcomes) {
    std::map<std::string, bulkfetch::FetchOutcome> map;
    for (const auto& outcome : outcomes) {
        map.emplace(outcome.work_item_id, outcome);
    }
    return map;
}

} // namespace

TEST_CASE("mixed batch: one success and one exhausted 500") {
    const std::string a_body = "0123456789";
    LoopbackHttpServer server([&](const std::string& path, int) {
        if (path == "/a.bin") {
            return CannedResponse{200, a_body};
        }
        return CannedResponse{500, "nope"};
    });
    TempDir dir;

    auto options = fastOptions(dir.path());
    options.concurrency = 2;
    bulkfetch::Dispatcher dispatcher(options, httpRegistry());

    const auto items = bulkfetch::makeWorkItems({server.url("/a.bin"), server.url("/b.bin")}, dir.path());
    const auto outcomes = dispatcher.run(bulkfetch::CancellationToken{}, items);

    REQUIRE(outcomes.size() == 2);
    const auto results = byId(outcomes);

    const auto& a = results.at(server.url("/a.bin"));
    REQUIRE(a.succeeded);
    REQUIRE(a.local_path == dir.path() / "a.bin");
    REQUIRE(a.content_hash == bulkfetch::sha256Hex(a_body));
    REQUIRE(a.bytes_transferred == 10);
    REQUIRE(bulkfetch::sha256File(a.local_path) == *a.content_hash);

    const auto& b = results.at(server.url("/b.bin"));
    REQUIRE_FALSE(b.succeeded);
    REQUIRE(b.error.has_value());
    REQUIRE(b.error->kind == bulkfetch::ErrorKind::RetriesExhausted);
    REQUIRE(b.error->attempts == 2);
    REQUIRE(b.error->http_status == 500);
    REQUIRE(server.hits("/b.bin") == 2);
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "b.bin"));

    const auto progress = dispatcher.progress();
    REQUIRE(progress.total == 2);
    REQUIRE(progress.completed == 2);
    REQUIRE(progress.succeeded == 1);
    REQUIRE(progress.failed == 1);
}

TEST_CASE("every item yields exactly one outcome") {
    LoopbackHttpServer server([](const std::string& path, int) { return CannedResponse{200, "body of " + path}; });
    TempDir dir;

    std::vector<std::string> sources;
    for (int i = 0; i < 25; ++i) {
        sources.push_back(server.url("/file" + std::to_string(i) + ".bin"));
    }

    std::atomic<int> listened{0};
    bulkfetch::Dispatcher dispatcher(fastOptions(dir.path()), httpRegistry());
    dispatcher.setOutcomeListener([&listened](const bulkfetch::FetchOutcome&) { ++listened; });
    const auto outcomes = dispatcher.run(bulkfetch::CancellationToken{}, bulkfetch::makeWorkItems(sources, dir.path()));

    REQUIRE(outcomes.size() == sources.size());
    REQUIRE(listened.load() == static_cast<int>(sources.size()));
    std::set<std::string> ids;
    for (const auto& outcome : outcomes) {
        REQUIRE(outcome.succeeded);
        ids.insert(outcome.work_item_id);
    }
    REQUIRE(ids == std::set<std::string>(sources.begin(), sources.end()));
    REQUIRE(server.totalHits() == static_cast<int>(sources.size()));
    REQUIRE(dispatcher.progress().done());
}

TEST_CASE("setup errors are fatal before any worker starts") {
    TempDir dir;
    bulkfetch::Dispatcher dispatcher(fastOptions(dir.path()), httpRegistry());
    REQUIRE_THROWS_AS(dispatcher.run(bulkfetch::CancellationToken{}, {}), bulkfetch::BatchSetupError);

    const auto blocker = dir.path() / "not-a-dir";
    bulkfetch::testing::writeFile(blocker, "x");
    bulkfetch::Dispatcher blocked(fastOptions(blocker / "out"), httpRegistry());
    const auto items = bulkfetch::makeWorkItems({"http://127.0.0.1:1/a.bin"}, blocker / "out");
    REQUIRE_THROWS_AS(blocked.run(bulkfetch::CancellationToken{}, items), bulkfetch::BatchSetupError);
}

TEST_CASE("the output directory is created with its parents") {
    LoopbackHttpServer server([](const std::string&, int) { return CannedResponse{200, "hi"}; });
    TempDir dir;
    const auto nested = dir.path() / "x" / "y" / "z";

    bulkfetch::Dispatcher dispatcher(fastOptions(nested), httpRegistry());
    const auto outcomes = dispatcher.run(bulkfetch::CancellationToken{},
                                         bulkfetch::makeWorkItems({server.url("/hi.txt")}, nested));

    REQUIRE(std::filesystem::is_directory(nested));
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].succeeded);
    REQUIRE(bulkfetch::testing::readFile(nested / "hi.txt") == "hi");
}

TEST_CASE("existing files are skipped by default") {
    LoopbackHttpServer server([](const std::string&, int) { return CannedResponse{200, "new"}; });
    TempDir dir;
    bulkfetch::testing::writeFile(dir.path() / "keep.bin", "old");

    bulkfetch::Dispatcher dispatcher(fastOptions(dir.path()), httpRegistry());
    const auto outcomes = dispatcher.run(bulkfetch::CancellationToken{},
                                         bulkfetch::makeWorkItems({server.url("/keep.bin")}, dir.path()));

    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].succeeded);
    REQUIRE(outcomes[0].skipped);
    REQUIRE(outcomes[0].content_hash == bulkfetch::sha256Hex("old"));
    REQUIRE(outcomes[0].bytes_transferred == 0);
    REQUIRE(server.totalHits() == 0);
    REQUIRE(bulkfetch::testing::readFile(dir.path() / "keep.bin") == "old");
    REQUIRE(dispatcher.progress().skipped == 1);
}

TEST_CASE("overwrite policy downloads over existing files") {
    LoopbackHttpServer server([](const std::string&, int) { return CannedResponse{200, "new"}; });
    TempDir dir;
    bulkfetch::testing::writeFile(dir.path() / "keep.bin", "old");

    auto options = fastOptions(dir.path());
    options.existing = bulkfetch::ExistingFilePolicy::Overwrite;
    bulkfetch::Dispatcher dispatcher(options, httpRegistry());
    const auto outcomes = dispatcher.run(bulkfetch::CancellationToken{},
                                         bulkfetch::makeWorkItems({server.url("/keep.bin")}, dir.path()));

    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].succeeded);
    REQUIRE_FALSE(outcomes[0].skipped);
    REQUIRE(outcomes[0].content_hash == bulkfetch::sha256Hex("new"));
    REQUIRE(server.hits("/keep.bin") == 1);
    REQUIRE(bulkfetch::testing::readFile(dir.path() / "keep.bin") == "new");
}

TEST_CASE("identifiers without a matching strategy fail without stopping the batch") {
    LoopbackHttpServer server([](const std::string&, int) { return CannedResponse{200, "ok"}; });
    TempDir dir;

    bulkfetch::Dispatcher dispatcher(fastOptions(dir.path()), httpRegistry());
    const auto outcomes = dispatcher.run(
        bulkfetch::CancellationToken{},
        bulkfetch::makeWorkItems({"sftp://host/archive.zip", server.url("/ok.bin")}, dir.path()));

    const auto results = byId(outcomes);
    REQUIRE(results.size() == 2);
    REQUIRE(results.at("sftp://host/archive.zip").error->kind == bulkfetch::ErrorKind::UnsupportedSource);
    REQUIRE(results.at(server.url("/ok.bin")).succeeded);
    REQUIRE(dispatcher.progress().failed == 1);
}

TEST_CASE("cancelling mid-batch reports every item and leaves no partial files") {
    LoopbackHttpServer server([](const std::string&, int) {
        CannedResponse response{200, std::string(8192, 'q')};
        response.stall = 10s;
        return response;
    });
    TempDir dir;

    std::vector<std::string> sources;
    for (int i = 0; i < 6; ++i) {
        sources.push_back(server.url("/slow" + std::to_string(i) + ".bin"));
    }

    auto options = fastOptions(dir.path());
    options.concurrency = 2;
    options.retry = bulkfetch::RetryPolicy{3, 10s};
    bulkfetch::Dispatcher dispatcher(options, httpRegistry());

    bulkfetch::CancellationToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(300ms);
        token.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    const auto outcomes = dispatcher.run(token, bulkfetch::makeWorkItems(sources, dir.path()));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(outcomes.size() == sources.size());
    for (const auto& outcome : outcomes) {
        REQUIRE_FALSE(outcome.succeeded);
        REQUIRE(outcome.error.has_value());
        REQUIRE(bulkfetch::isCancellation(outcome.error->kind));
    }
    REQUIRE(elapsed < 8s);
    REQUIRE(server.totalHits() <= 2);
    REQUIRE(bulkfetch::testing::countFiles(dir.path()) == 0);
    REQUIRE(dispatcher.progress().cancelled == sources.size());
}

TEST_CASE("a batch started after cancellation issues no requests") {
    LoopbackHttpServer server([](const std::string&, int) { return CannedResponse{200, "never"}; });
    TempDir dir;

    bulkfetch::CancellationToken token;
    token.cancel();
    bulkfetch::Dispatcher dispatcher(fastOptions(dir.path()), httpRegistry());
    const auto outcomes = dispatcher.run(
        token, bulkfetch::makeWorkItems({server.url("/a.bin"), server.url("/b.bin"), server.url("/c.bin")}, dir.path()));

    REQUIRE(outcomes.size() == 3);
    for (const auto& outcome : outcomes) {
        REQUIRE(outcome.error->kind == bulkfetch::ErrorKind::BatchCancelled);
    }
    REQUIRE(server.totalHits() == 0);
}

TEST_CASE("request starts respect the global rate limit") {
    LoopbackHttpServer server([](const std::string&, int) { return CannedResponse{200, "r"}; });
    TempDir dir;

    constexpr int kItems = 5;
    constexpr double kRate = 10.0;
    std::vector<std::string> sources;
    for (int i = 0; i < kItems; ++i) {
        sources.push_back(server.url("/r" + std::to_string(i)));
    }

    auto options = fastOptions(dir.path());
    options.concurrency = kItems;
    options.rate_limit = kRate;
    bulkfetch::Dispatcher dispatcher(options, httpRegistry());
    const auto outcomes = dispatcher.run(bulkfetch::CancellationToken{}, bulkfetch::makeWorkItems(sources, dir.path()));

    REQUIRE(outcomes.size() == kItems);
    auto times = server.requestTimes();
    REQUIRE(times.size() == kItems);
    std::sort(times.begin(), times.end());
    const double spread = std::chrono::duration<double>(times.back() - times.front()).count();
    REQUIRE(spread >= (kItems - 1) / kRate - 0.02);
}

TEST_CASE("byte progress reaches the progress channel") {
    LoopbackHttpServer server([](const std::string&, int) { return CannedResponse{200, std::string(1000, 'p')}; });
    TempDir dir;

    bulkfetch::Dispatcher dispatcher(fastOptions(dir.path()), httpRegistry());
    const auto outcomes = dispatcher.run(bulkfetch::CancellationToken{},
                                         bulkfetch::makeWorkItems({server.url("/p.bin")}, dir.path()));
    REQUIRE(outcomes.size() == 1);

    const auto events = dispatcher.progressEvents();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].item_id == server.url("/p.bin"));
    REQUIRE(events[0].downloaded_bytes == 1000);
    REQUIRE(events[0].percent.has_value());
    REQUIRE(*events[0].percent == Approx(100.0));
}

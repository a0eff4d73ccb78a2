#pragma once

#include "fetch_strategy.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace bulkfetch {

struct HttpFetchOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
    bool follow_redirects{true};
};

// Plain HTTP(S) GET through libcurl. The body goes to "<destination>.part"
// and into a SHA-256 accumulator in a single pass; the staging file is
// renamed onto the destination only after a complete 2xx transfer.
class HttpFetchStrategy final : public FetchStrategy {
public:
    explicit HttpFetchStrategy(HttpFetchOptions options = {});
    ~HttpFetchStrategy() override;

    [[nodiscard]] const char* name() const override { return "http"; }
    [[nodiscard]] bool accepts(const std::string& source) const override;

    FetchResult fetch(const CancellationToken& token,
                      const std::string& source,
                      const std::filesystem::path& destination,
                      const ByteProgressFn& on_bytes) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bulkfetch

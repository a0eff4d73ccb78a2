#pragma once

#include "cancellation.hpp"
#include "errors.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bulkfetch {

struct FetchResult {
    bool ok{false};
    std::string content_hash;
    std::uint64_t bytes_written{0};
    FetchError error;
};

// Called from the transfer loop with bytes written so far and the total size
// when the transport knows it.
using ByteProgressFn = std::function<void(std::uint64_t downloaded, std::optional<std::uint64_t> total)>;

// One transport. fetch() performs a single attempt: it either leaves a
// complete file at `destination` or no file at all.
class FetchStrategy {
public:
    virtual ~FetchStrategy() = default;

    [[nodiscard]] virtual const char* name() const = 0;
    [[nodiscard]] virtual bool accepts(const std::string& source) const = 0;

    virtual FetchResult fetch(const CancellationToken& token,
                              const std::string& source,
                              const std::filesystem::path& destination,
                              const ByteProgressFn& on_bytes) = 0;
};

using FetchStrategyPtr = std::shared_ptr<FetchStrategy>;

// Picks the strategy for an identifier, first registered match wins.
class FetchStrategyRegistry {
public:
    void add(FetchStrategyPtr strategy);

    [[nodiscard]] FetchStrategy* select(const std::string& source) const;
    [[nodiscard]] bool empty() const { return strategies_.empty(); }

private:
    std::vector<FetchStrategyPtr> strategies_;
};

// Lower-cased scheme of a URL-like identifier ("http" for "HTTP://x"), or an
// empty string when there is none.
std::string sourceScheme(const std::string& source);

} // namespace bulkfetch

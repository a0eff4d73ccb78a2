#include "bulkfetch/http_fetch_strategy.hpp"

#include "bulkfetch/content_hash.hpp"
#include "bulkfetch/detail/curl_utils.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace bulkfetch {

class HttpFetchStrategy::Impl {
public:
    explicit Impl(HttpFetchOptions options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    FetchResult fetch(const CancellationToken& token,
                      const std::string& source,
                      const std::filesystem::path& destination,
                      const ByteProgressFn& on_bytes) const {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        FetchResult result;
        std::filesystem::path staging = destination;
        staging += ".part";

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            result.error = networkError("Failed to allocate curl handle");
            return result;
        }

        TransferContext ctx;
        ctx.curl = curl.get();
        ctx.token = &token;
        ctx.on_bytes = &on_bytes;
        ctx.staging = staging;

        char error_buffer[CURL_ERROR_SIZE] = {};
        curl_easy_setopt(curl.get(), CURLOPT_URL, source.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        spdlog::debug("GET {} -> {}", source, destination.string());
        const CURLcode res = curl_easy_perform(curl.get());

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        if (ctx.cancelled || (res != CURLE_OK && token.isCancelled())) {
            discard(ctx);
            result.error = cancelledError(ErrorKind::BatchCancelled, "transfer cancelled");
            return result;
        }
        if (ctx.write_failed) {
            discard(ctx);
            result.error = filesystemError(ctx.error_message);
            return result;
        }
        if (ctx.bad_status || (res == CURLE_OK && (status < 200 || status >= 300))) {
            discard(ctx);
            result.error = unexpectedStatus(static_cast<int>(status));
            return result;
        }
        if (res != CURLE_OK) {
            discard(ctx);
            const std::string reason = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            result.error = networkError("curl error: " + reason);
            return result;
        }

        // A 2xx response with an empty body never reached the write callback.
        if (!ctx.file && !openStaging(ctx)) {
            discard(ctx);
            result.error = filesystemError(ctx.error_message);
            return result;
        }

        FILE* raw = ctx.file.release();
        const bool flushed = std::fflush(raw) == 0;
        const bool closed = std::fclose(raw) == 0;
        if (!flushed || !closed) {
            discard(ctx);
            result.error = filesystemError("Failed to flush " + staging.string());
            return result;
        }

        std::error_code ec;
        std::filesystem::rename(staging, destination, ec);
        if (ec) {
            discard(ctx);
            result.error = filesystemError("Cannot move " + staging.string() + " into place: " + ec.message());
            return result;
        }

        result.ok = true;
        result.bytes_written = ctx.written;
        result.content_hash = ctx.hasher.hexDigest();
        return result;
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct TransferContext {
        CURL* curl{nullptr};
        const CancellationToken* token{nullptr};
        const ByteProgressFn* on_bytes{nullptr};
        std::filesystem::path staging;
        std::unique_ptr<FILE, FileDeleter> file{};
        Sha256 hasher;
        std::uint64_t written{0};
        bool cancelled{false};
        bool bad_status{false};
        bool write_failed{false};
        std::string error_message;
    };

    static bool openStaging(TransferContext& ctx) {
        ctx.file.reset(std::fopen(ctx.staging.c_str(), "wb"));
        if (!ctx.file) {
            ctx.write_failed = true;
            ctx.error_message = "Cannot create destination file " + ctx.staging.string();
            return false;
        }
        return true;
    }

    static void discard(TransferContext& ctx) {
        ctx.file.reset();
        std::error_code ec;
        std::filesystem::remove(ctx.staging, ec);
        if (ec) {
            spdlog::warn("Failed to remove partial file {}: {}", ctx.staging.string(), ec.message());
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (ctx->token->isCancelled()) {
            ctx->cancelled = true;
            return 0;
        }

        if (!ctx->file) {
            long code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
            if (code < 200 || code >= 300) {
                ctx->bad_status = true;
                return 0;
            }
            if (!openStaging(*ctx)) {
                return 0;
            }
        }

        if (total == 0) {
            return 0;
        }

        const size_t written = std::fwrite(ptr, 1, total, ctx->file.get());
        if (written != total) {
            ctx->write_failed = true;
            ctx->error_message = "Failed to write output file " + ctx->staging.string();
            return 0;
        }

        try {
            ctx->hasher.update(ptr, written);
        } catch (const std::exception& ex) {
            ctx->write_failed = true;
            ctx->error_message = ex.what();
            return 0;
        }
        ctx->written += written;

        if (*ctx->on_bytes) {
            curl_off_t length = -1;
            curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
            std::optional<std::uint64_t> known_total;
            if (length >= 0) {
                known_total = static_cast<std::uint64_t>(length);
            }
            try {
                (*ctx->on_bytes)(ctx->written, known_total);
            } catch (const std::exception& ex) {
                ctx->write_failed = true;
                ctx->error_message = std::string{"Progress callback failed: "} + ex.what();
                return 0;
            }
        }

        return written;
    }

    static int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (ctx && ctx->token->isCancelled()) {
            ctx->cancelled = true;
            return 1;
        }
        return 0;
    }

    HttpFetchOptions options_;
};

HttpFetchStrategy::HttpFetchStrategy(HttpFetchOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpFetchStrategy::~HttpFetchStrategy() = default;

bool HttpFetchStrategy::accepts(const std::string& source) const {
    const std::string scheme = sourceScheme(source);
    return scheme == "http" || scheme == "https";
}

FetchResult HttpFetchStrategy::fetch(const CancellationToken& token,
                                     const std::string& source,
                                     const std::filesystem::path& destination,
                                     const ByteProgressFn& on_bytes) {
    return impl_->fetch(token, source, destination, on_bytes);
}

} // namespace bulkfetch

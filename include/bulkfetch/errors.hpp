#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace bulkfetch {

enum class ErrorKind {
    None,
    RateLimitCancelled,
    NetworkError,
    UnexpectedStatus,
    FilesystemError,
    RetriesExhausted,
    BatchCancelled,
    UnsupportedSource
};

// Per-item error value. For RetriesExhausted, `cause` and `http_status` describe
// the last failed attempt and `attempts` the number of attempts made.
struct FetchError {
    ErrorKind kind{ErrorKind::None};
    ErrorKind cause{ErrorKind::None};
    int http_status{0};
    int attempts{0};
    bool retryable{false};
    std::string message;
};

inline const char* errorKindLabel(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::RateLimitCancelled: return "RateLimitCancelled";
        case ErrorKind::NetworkError: return "NetworkError";
        case ErrorKind::UnexpectedStatus: return "UnexpectedStatus";
        case ErrorKind::FilesystemError: return "FilesystemError";
        case ErrorKind::RetriesExhausted: return "RetriesExhausted";
        case ErrorKind::BatchCancelled: return "BatchCancelled";
        case ErrorKind::UnsupportedSource: return "UnsupportedSource";
        default: return "Unknown";
    }
}

inline bool isCancellation(ErrorKind kind) {
    return kind == ErrorKind::RateLimitCancelled || kind == ErrorKind::BatchCancelled;
}

inline FetchError networkError(std::string message) {
    return FetchError{ErrorKind::NetworkError, ErrorKind::None, 0, 0, true, std::move(message)};
}

inline FetchError unexpectedStatus(int code) {
    return FetchError{ErrorKind::UnexpectedStatus, ErrorKind::None, code, 0, true,
                      "unexpected status code: " + std::to_string(code)};
}

inline FetchError filesystemError(std::string message) {
    return FetchError{ErrorKind::FilesystemError, ErrorKind::None, 0, 0, true, std::move(message)};
}

inline FetchError unsupportedSource(const std::string& source) {
    return FetchError{ErrorKind::UnsupportedSource, ErrorKind::None, 0, 0, false,
                      "no fetch strategy accepts " + source};
}

inline FetchError cancelledError(ErrorKind kind, std::string message) {
    return FetchError{kind, ErrorKind::None, 0, 0, false, std::move(message)};
}

// Wraps the last attempt's error once all attempts are spent.
inline FetchError retriesExhausted(const FetchError& last, int attempts) {
    FetchError error;
    error.kind = ErrorKind::RetriesExhausted;
    error.cause = last.kind;
    error.http_status = last.http_status;
    error.attempts = attempts;
    error.retryable = false;
    error.message = "failed after " + std::to_string(attempts) + " attempts: " + last.message;
    return error;
}

// One-line description used in summaries, e.g.
// "RetriesExhausted{attempts: 2, last: UnexpectedStatus 500}".
std::string describe(const FetchError& error);

// Thrown for problems that make a whole batch impossible to start.
class BatchSetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace bulkfetch

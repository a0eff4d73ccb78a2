#include "bulkfetch/errors.hpp"

#include <fmt/format.h>

namespace bulkfetch {

std::string describe(const FetchError& error) {
    switch (error.kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::UnexpectedStatus:
            return fmt::format("UnexpectedStatus {}", error.http_status);
        case ErrorKind::RetriesExhausted:
            if (error.cause == ErrorKind::UnexpectedStatus) {
                return fmt::format("RetriesExhausted{{attempts: {}, last: UnexpectedStatus {}}}",
                                   error.attempts, error.http_status);
            }
            return fmt::format("RetriesExhausted{{attempts: {}, last: {}}}",
                               error.attempts, errorKindLabel(error.cause));
        default:
            return errorKindLabel(error.kind);
    }
}

} // namespace bulkfetch

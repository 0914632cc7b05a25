#include "resumable/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace resumable {

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Network:
        return "network error";
    case ErrorKind::Server:
        return "server error";
    case ErrorKind::ResumeRejected:
        return "resume rejected";
    case ErrorKind::ValidatorMismatch:
        return "validator mismatch";
    case ErrorKind::SizeMismatch:
        return "size mismatch";
    case ErrorKind::Storage:
        return "storage error";
    case ErrorKind::InvalidRequest:
        return "invalid request";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown error";
}

std::string FailureCause::describe() const {
    if (http_status != 0) {
        return fmt::format("{} (HTTP {}): {}", toString(kind), http_status, message);
    }
    return fmt::format("{}: {}", toString(kind), message);
}

FailureCause FailureCause::network(std::string message, bool retryable) {
    return {ErrorKind::Network, std::move(message), 0, retryable};
}

FailureCause FailureCause::server(long status, std::string message) {
    // 5xx, request timeout and rate limiting are worth another attempt.
    const bool retryable = status >= 500 || status == 408 || status == 429;
    return {ErrorKind::Server, std::move(message), status, retryable};
}

FailureCause FailureCause::sizeMismatch(std::string message) {
    return {ErrorKind::SizeMismatch, std::move(message), 0, true};
}

FailureCause FailureCause::storage(std::string message) {
    return {ErrorKind::Storage, std::move(message), 0, false};
}

FailureCause FailureCause::invalidRequest(std::string message) {
    return {ErrorKind::InvalidRequest, std::move(message), 0, false};
}

} // namespace resumable

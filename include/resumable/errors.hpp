#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace resumable {

enum class ErrorKind {
    Network,
    Server,
    ResumeRejected,
    ValidatorMismatch,
    SizeMismatch,
    Storage,
    InvalidRequest,
    Cancelled
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

struct FailureCause {
    ErrorKind kind{ErrorKind::Network};
    std::string message;
    long http_status{0};
    bool retryable{false};

    [[nodiscard]] std::string describe() const;

    static FailureCause network(std::string message, bool retryable = true);
    static FailureCause server(long status, std::string message);
    static FailureCause sizeMismatch(std::string message);
    static FailureCause storage(std::string message);
    static FailureCause invalidRequest(std::string message);
};

// Thrown for failures that cannot be expressed as a fetch outcome:
// disk and state-store errors, misuse of the scheduler.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace resumable

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace resumable {

enum class TransferStatus {
    Pending,
    InProgress,
    Paused,
    Completed,
    Failed
};

[[nodiscard]] std::string_view toString(TransferStatus status) noexcept;
[[nodiscard]] std::optional<TransferStatus> parseStatus(std::string_view text) noexcept;
[[nodiscard]] bool isTerminal(TransferStatus status) noexcept;

struct TransferState {
    std::optional<std::uint64_t> total_size;
    std::uint64_t bytes_completed{0};
    std::optional<std::string> validator;
    TransferStatus status{TransferStatus::Pending};
    // Name the server announced for the destination file, if it is being used.
    std::optional<std::string> file_name;

    [[nodiscard]] bool resumable() const noexcept {
        return (status == TransferStatus::InProgress || status == TransferStatus::Paused) &&
               bytes_completed > 0;
    }
};

} // namespace resumable

#include "resumable/transfer_state.hpp"

namespace resumable {

std::string_view toString(TransferStatus status) noexcept {
    switch (status) {
    case TransferStatus::Pending:
        return "pending";
    case TransferStatus::InProgress:
        return "in_progress";
    case TransferStatus::Paused:
        return "paused";
    case TransferStatus::Completed:
        return "completed";
    case TransferStatus::Failed:
        return "failed";
    }
    return "pending";
}

std::optional<TransferStatus> parseStatus(std::string_view text) noexcept {
    for (const auto status : {TransferStatus::Pending, TransferStatus::InProgress, TransferStatus::Paused,
                              TransferStatus::Completed, TransferStatus::Failed}) {
        if (toString(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

bool isTerminal(TransferStatus status) noexcept {
    return status == TransferStatus::Completed || status == TransferStatus::Failed ||
           status == TransferStatus::Paused;
}

} // namespace resumable

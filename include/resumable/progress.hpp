#pragma once

#include "errors.hpp"
#include "transfer_state.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace resumable {

using TransferId = std::size_t;
using Clock = std::chrono::steady_clock;

struct ProgressEvent {
    TransferId transfer_id{0};
    std::uint64_t bytes_completed{0};
    std::optional<std::uint64_t> total_size;
    TransferStatus status{TransferStatus::Pending};
    Clock::time_point timestamp{};
    // Non-zero when the transfer threw away its partial bytes and restarted.
    std::uint64_t discarded_bytes{0};
    std::optional<FailureCause> cause;
};

struct AggregateProgress {
    std::uint64_t total_bytes_known{0};
    std::uint64_t total_bytes_completed{0};
    bool total_is_lower_bound{false};
    std::uint64_t bytes_discarded{0};
    std::size_t active_count{0};
    std::size_t completed_count{0};
    std::size_t failed_count{0};
    std::size_t paused_count{0};
    std::size_t pending_count{0};
};

struct ProgressUpdate {
    ProgressEvent event;
    AggregateProgress aggregate;
};

struct FailureReport {
    TransferId transfer_id{0};
    std::string url;
    FailureCause cause;
};

struct RunSummary {
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t paused{0};
    std::vector<FailureReport> failures;

    [[nodiscard]] bool anyFailed() const noexcept { return failed > 0; }
};

} // namespace resumable

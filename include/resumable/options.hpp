#pragma once

#include "transfer_request.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace resumable {

struct RetryPolicy {
    int max_retries{3};
    // Ceiling the backoff approaches; retry n waits max_delay * n / (n + 15).
    std::chrono::milliseconds max_delay{60000};

    [[nodiscard]] std::chrono::milliseconds delayFor(int retry) const {
        if (retry <= 0) {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::milliseconds{max_delay.count() * retry / (retry + 15)};
    }
};

struct TransferOptions {
    std::size_t chunk_size{65536};
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds stall_timeout{30};
    RetryPolicy retry{};
    std::uint64_t persist_interval_bytes{1024 * 1024};
    std::chrono::milliseconds persist_interval{500};
    bool allow_resume{true};
    bool overwrite_existing{true};
    std::string part_suffix{".part"};
    std::string user_agent{"resumable/1.0"};
    Headers default_headers;
};

} // namespace resumable

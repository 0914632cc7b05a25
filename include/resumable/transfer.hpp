#pragma once

#include "cancel_token.hpp"
#include "options.hpp"
#include "progress.hpp"
#include "range_fetcher.hpp"
#include "state_store.hpp"
#include "transfer_request.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace resumable {

struct TransferResult {
    TransferStatus status{TransferStatus::Pending};
    std::optional<FailureCause> cause;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// Lifecycle of one URL: Pending -> (resume validation) -> Fetching -> Completed | Failed | Paused.
// run() blocks the calling thread; cancel() may be called from any thread.
class Transfer {
public:
    Transfer(TransferId id, TransferRequest request, RangeFetcherPtr fetcher, StateStorePtr store,
             TransferOptions options = {}, ProgressCallback on_progress = {},
             CancelTokenPtr cancel_token = std::make_shared<CancelToken>());
    ~Transfer();

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    TransferResult run();
    void cancel();

    [[nodiscard]] TransferId id() const;
    [[nodiscard]] const TransferRequest& request() const;
    [[nodiscard]] TransferState state() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace resumable

#pragma once

#include "http_transport.hpp"
#include "options.hpp"
#include "progress.hpp"
#include "state_store.hpp"
#include "transfer_request.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace resumable {

namespace detail {
struct FeedChannel;
} // namespace detail

// Consumer end of a run: per-transfer events, each paired with the recomputed aggregate.
class ProgressFeed {
public:
    explicit ProgressFeed(std::shared_ptr<detail::FeedChannel> channel);

    // Blocks for the next update; std::nullopt once every transfer reached a terminal state.
    std::optional<ProgressUpdate> next();
    // Blocks until the run has finished.
    [[nodiscard]] RunSummary summary() const;

private:
    std::shared_ptr<detail::FeedChannel> channel_;
};

// Runs requests with at most concurrency_limit transfers in flight. A finished, failed or
// paused transfer frees its slot for the next queued request.
class Scheduler {
public:
    Scheduler(HttpTransportPtr transport, StateStorePtr store, TransferOptions options = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    ProgressFeed run(std::vector<TransferRequest> requests, std::size_t concurrency_limit);

    // Pauses every active transfer and stops admitting queued ones.
    void cancel();
    void cancel(TransferId id);

    RunSummary wait();
    // Meaningful once the run has finished.
    [[nodiscard]] bool anyFailed() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace resumable

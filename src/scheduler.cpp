#include "resumable/scheduler.hpp"

#include "resumable/cancel_token.hpp"
#include "resumable/range_fetcher.hpp"
#include "resumable/transfer.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace resumable {

namespace detail {

struct FeedChannel {
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    std::deque<ProgressUpdate> updates;
    bool closed{false};
    RunSummary summary;

    void push(ProgressUpdate update) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            updates.push_back(std::move(update));
        }
        cv.notify_all();
    }

    void close(RunSummary final_summary) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            summary = std::move(final_summary);
            closed = true;
        }
        cv.notify_all();
    }
};

} // namespace detail

ProgressFeed::ProgressFeed(std::shared_ptr<detail::FeedChannel> channel) : channel_(std::move(channel)) {}

std::optional<ProgressUpdate> ProgressFeed::next() {
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->cv.wait(lock, [this] { return !channel_->updates.empty() || channel_->closed; });
    if (channel_->updates.empty()) {
        return std::nullopt;
    }
    auto update = std::move(channel_->updates.front());
    channel_->updates.pop_front();
    return update;
}

RunSummary ProgressFeed::summary() const {
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->cv.wait(lock, [this] { return channel_->closed; });
    return channel_->summary;
}

class Scheduler::Impl {
public:
    Impl(HttpTransportPtr transport, StateStorePtr store, TransferOptions options)
        : fetcher_(std::make_shared<const RangeFetcher>(std::move(transport))),
          store_(std::move(store)),
          options_(std::move(options)) {}

    ~Impl() {
        cancel();
        if (dispatcher_.joinable()) {
            dispatcher_.join();
        }
    }

    ProgressFeed run(std::vector<TransferRequest> requests, std::size_t concurrency_limit) {
        if (concurrency_limit == 0) {
            throw TransferError(ErrorKind::InvalidRequest, "concurrency limit must be at least 1");
        }
        if (running_) {
            throw TransferError(ErrorKind::InvalidRequest, "a run is already in progress");
        }
        if (dispatcher_.joinable()) {
            dispatcher_.join();
        }

        limit_ = concurrency_limit;
        active_ = 0;
        discarded_ = 0;
        slots_.clear();
        queue_.clear();
        busy_.clear();
        {
            std::lock_guard<std::mutex> lock(tokens_mutex_);
            tokens_.clear();
            for (std::size_t id = 0; id < requests.size(); ++id) {
                Slot slot;
                slot.request = std::move(requests[id]);
                slot.destination = normalizedDestination(slot.request.destination);
                slot.token = std::make_shared<CancelToken>();
                if (cancelled_) {
                    slot.token->cancel();
                }
                tokens_.push_back(slot.token);
                slots_.push_back(std::move(slot));
                queue_.push_back(id);
            }
        }

        channel_ = std::make_shared<detail::FeedChannel>();
        running_ = true;
        dispatcher_ = std::thread([this] { dispatch(); });
        return ProgressFeed(channel_);
    }

    void cancel() {
        cancelled_ = true;
        std::lock_guard<std::mutex> lock(tokens_mutex_);
        for (const auto& token : tokens_) {
            token->cancel();
        }
    }

    void cancel(TransferId id) {
        std::lock_guard<std::mutex> lock(tokens_mutex_);
        if (id < tokens_.size()) {
            tokens_[id]->cancel();
        }
    }

    RunSummary wait() {
        if (dispatcher_.joinable()) {
            dispatcher_.join();
        }
        std::lock_guard<std::mutex> lock(summary_mutex_);
        return summary_;
    }

    [[nodiscard]] bool anyFailed() const {
        std::lock_guard<std::mutex> lock(summary_mutex_);
        return summary_.anyFailed();
    }

private:
    struct Slot {
        TransferRequest request;
        std::string destination;
        CancelTokenPtr token;
        std::unique_ptr<Transfer> transfer;
        std::thread thread;
        bool admitted{false};
        TransferStatus status{TransferStatus::Pending};
        std::uint64_t bytes{0};
        std::optional<std::uint64_t> total;
        std::optional<FailureCause> cause;
    };

    static std::string normalizedDestination(const std::filesystem::path& destination) {
        std::error_code ec;
        const auto absolute = std::filesystem::absolute(destination, ec);
        return (ec ? destination : absolute).lexically_normal().string();
    }

    void dispatch() {
        while (true) {
            admit();
            // admit() leaves nothing runnable only when the queue is drained or cancelled.
            if (active_ == 0) {
                break;
            }

            std::deque<ProgressEvent> batch;
            {
                std::unique_lock<std::mutex> lock(events_mutex_);
                events_cv_.wait(lock, [this] { return !events_.empty(); });
                batch.swap(events_);
            }
            for (const auto& event : batch) {
                apply(event);
            }
        }

        // Cancelled before admission: nothing was written, the next run starts them fresh.
        while (!queue_.empty()) {
            const TransferId id = queue_.front();
            queue_.pop_front();
            slots_[id].status = TransferStatus::Paused;
            publishSlot(id);
        }

        auto summary = buildSummary();
        {
            std::lock_guard<std::mutex> lock(summary_mutex_);
            summary_ = summary;
        }
        {
            // A cancel applies to the run it interrupted, not to the next one.
            std::lock_guard<std::mutex> lock(tokens_mutex_);
            cancelled_ = false;
        }
        running_ = false;
        spdlog::info("Run finished: {} completed, {} failed, {} paused", summary.completed, summary.failed,
                     summary.paused);
        channel_->close(std::move(summary));
    }

    void admit() {
        while (active_ < limit_ && !queue_.empty() && !cancelled_) {
            const TransferId id = queue_.front();
            queue_.pop_front();
            auto& slot = slots_[id];

            if (slot.token->isCancelled()) {
                slot.status = TransferStatus::Paused;
                publishSlot(id);
                continue;
            }
            if (!busy_.insert(slot.destination).second) {
                slot.status = TransferStatus::Failed;
                slot.cause = FailureCause::invalidRequest(
                    fmt::format("{} is already being written by another transfer", slot.destination));
                spdlog::error("{}: {}", slot.request.url, slot.cause->describe());
                publishSlot(id);
                continue;
            }

            slot.admitted = true;
            ++active_;
            slot.transfer = std::make_unique<Transfer>(
                id, slot.request, fetcher_, store_, options_, [this](const ProgressEvent& event) { post(event); },
                slot.token);
            Transfer* transfer = slot.transfer.get();
            slot.thread = std::thread([transfer] { transfer->run(); });
            spdlog::debug("Admitted transfer {} ({} active)", id, active_);
        }
    }

    void post(const ProgressEvent& event) {
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event);
        }
        events_cv_.notify_one();
    }

    void apply(const ProgressEvent& event) {
        auto& slot = slots_[event.transfer_id];

        // A restart from zero is the only way a transfer goes backwards; account for the lost bytes.
        if (event.bytes_completed < slot.bytes) {
            discarded_ += slot.bytes - event.bytes_completed;
        }
        slot.bytes = event.bytes_completed;
        slot.total = event.total_size;
        slot.status = event.status;
        if (event.cause) {
            slot.cause = event.cause;
        }

        channel_->push(ProgressUpdate{event, aggregate()});

        if (slot.admitted && isTerminal(slot.status) && slot.thread.joinable()) {
            slot.thread.join();
            slot.transfer.reset();
            busy_.erase(slot.destination);
            --active_;
        }
    }

    void publishSlot(TransferId id) {
        const auto& slot = slots_[id];
        ProgressEvent event{id, slot.bytes, slot.total, slot.status, Clock::now(), 0, slot.cause};
        channel_->push(ProgressUpdate{std::move(event), aggregate()});
    }

    [[nodiscard]] AggregateProgress aggregate() const {
        AggregateProgress progress;
        progress.bytes_discarded = discarded_;
        for (const auto& slot : slots_) {
            progress.total_bytes_completed += slot.bytes;
            if (slot.total) {
                progress.total_bytes_known += *slot.total;
            } else {
                progress.total_is_lower_bound = true;
            }

            switch (slot.status) {
            case TransferStatus::Pending:
                if (slot.admitted) {
                    ++progress.active_count;
                } else {
                    ++progress.pending_count;
                }
                break;
            case TransferStatus::InProgress:
                ++progress.active_count;
                break;
            case TransferStatus::Paused:
                ++progress.paused_count;
                break;
            case TransferStatus::Completed:
                ++progress.completed_count;
                break;
            case TransferStatus::Failed:
                ++progress.failed_count;
                break;
            }
        }
        return progress;
    }

    [[nodiscard]] RunSummary buildSummary() const {
        RunSummary summary;
        for (std::size_t id = 0; id < slots_.size(); ++id) {
            const auto& slot = slots_[id];
            switch (slot.status) {
            case TransferStatus::Completed:
                ++summary.completed;
                break;
            case TransferStatus::Failed:
                ++summary.failed;
                summary.failures.push_back(
                    {id, slot.request.url, slot.cause.value_or(FailureCause::network("unknown failure", false))});
                break;
            default:
                ++summary.paused;
                break;
            }
        }
        return summary;
    }

    RangeFetcherPtr fetcher_;
    StateStorePtr store_;
    TransferOptions options_;

    std::vector<Slot> slots_;
    std::deque<TransferId> queue_;
    std::unordered_set<std::string> busy_;
    std::size_t limit_{1};
    std::size_t active_{0};
    std::uint64_t discarded_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::mutex tokens_mutex_;
    std::vector<CancelTokenPtr> tokens_;

    std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::deque<ProgressEvent> events_;

    std::shared_ptr<detail::FeedChannel> channel_;
    std::thread dispatcher_;

    mutable std::mutex summary_mutex_;
    RunSummary summary_;
};

Scheduler::Scheduler(HttpTransportPtr transport, StateStorePtr store, TransferOptions options)
    : impl_(std::make_unique<Impl>(std::move(transport), std::move(store), std::move(options))) {}

Scheduler::~Scheduler() = default;

ProgressFeed Scheduler::run(std::vector<TransferRequest> requests, std::size_t concurrency_limit) {
    return impl_->run(std::move(requests), concurrency_limit);
}

void Scheduler::cancel() { impl_->cancel(); }

void Scheduler::cancel(TransferId id) { impl_->cancel(id); }

RunSummary Scheduler::wait() { return impl_->wait(); }

bool Scheduler::anyFailed() const { return impl_->anyFailed(); }

} // namespace resumable

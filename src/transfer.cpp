#include "resumable/transfer.hpp"

#include "resumable/detail/http_headers.hpp"

#include <algorithm>
#include <mutex>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace resumable {

namespace fs = std::filesystem;

class Transfer::Impl final : public FetchListener {
public:
    Impl(TransferId id, TransferRequest request, RangeFetcherPtr fetcher, StateStorePtr store,
         TransferOptions options, ProgressCallback on_progress, CancelTokenPtr cancel_token)
        : id_(id),
          request_(std::move(request)),
          fetcher_(std::move(fetcher)),
          store_(std::move(store)),
          options_(std::move(options)),
          on_progress_(std::move(on_progress)),
          token_(cancel_token ? std::move(cancel_token) : std::make_shared<CancelToken>()),
          key_(request_.key()) {
        part_path_ = request_.destination;
        part_path_ += options_.part_suffix;
    }

    TransferResult run() {
        try {
            return execute();
        } catch (const TransferError& ex) {
            return fail(FailureCause{ex.kind(), ex.what(), 0, false});
        } catch (const fs::filesystem_error& ex) {
            return fail(FailureCause::storage(ex.what()));
        }
    }

    void cancel() { token_->cancel(); }

    [[nodiscard]] TransferId id() const { return id_; }
    [[nodiscard]] const TransferRequest& request() const { return request_; }

    [[nodiscard]] TransferState snapshot() const {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        return snapshot_;
    }

    bool onResponse(const ResourceInfo& resource) override {
        if (range_offset_ > 0 && resourceChanged(resource)) {
            return false;
        }
        if (resource.total_size || range_offset_ == 0) {
            state_.total_size = resource.total_size;
        }
        if (resource.validator || range_offset_ == 0) {
            state_.validator = resource.validator;
        }
        if (request_.name_from_response && !state_.file_name && resource.file_name) {
            state_.file_name = resource.file_name;
        }

        // Range acquired: remember size and validator before the first byte lands.
        try {
            persist();
        } catch (const TransferError& ex) {
            storage_failure_ = FailureCause::storage(ex.what());
            return false;
        }
        emit();
        return true;
    }

    void onChunk(std::uint64_t bytes_completed) override {
        state_.bytes_completed = bytes_completed;
        emit();

        const auto now = Clock::now();
        if (bytes_completed >= last_persist_bytes_ + options_.persist_interval_bytes ||
            now - last_persist_time_ >= options_.persist_interval) {
            try {
                persist();
            } catch (const TransferError& ex) {
                storage_failure_ = FailureCause::storage(ex.what());
            }
        }
    }

    [[nodiscard]] bool cancelled() const override {
        return storage_failure_.has_value() || token_->isCancelled();
    }

private:
    TransferResult execute() {
        prepareDestinationDirectory();

        bool resuming = false;
        if (const auto persisted = store_->load(key_); persisted && persisted->resumable()) {
            if (options_.allow_resume) {
                state_ = *persisted;
                resuming = reconcilePartialFile();
            } else {
                spdlog::info("Resume disabled, downloading {} from the start", request_.url);
            }
        }
        if (!resuming) {
            state_ = TransferState{};
            if (auto early = inspectDestination()) {
                return *early;
            }
        }

        state_.status = TransferStatus::InProgress;
        emit();

        bool validated = !resuming;
        bool validator_restarted = false;
        bool resume_rejected_once = false;
        int retry = 0;

        while (true) {
            if (token_->isCancelled()) {
                return pause();
            }

            if (!validated) {
                const auto probe = fetcher_->probe(request_.url, requestHeaders(false), this);
                if (probe.cancelled) {
                    return pause();
                }
                if (!probe.ok()) {
                    if (retryAfter(*probe.cause, retry)) {
                        continue;
                    }
                    return fail(*probe.cause);
                }
                validated = true;
                const ResourceInfo& resource = *probe.resource;
                if (resourceChanged(resource)) {
                    spdlog::warn("{} changed since the last run, restarting from zero", request_.url);
                    validator_restarted = true;
                    restartFromZero(&resource, nullptr);
                } else if (!resource.accepts_ranges) {
                    spdlog::warn("{} does not accept range requests, restarting from zero", request_.url);
                    server_resumable_ = false;
                    restartFromZero(&resource, nullptr);
                } else if (resource.total_size && state_.total_size == resource.total_size &&
                           state_.bytes_completed == *resource.total_size) {
                    // Every byte arrived in an earlier run; only the rename is missing.
                    FileSink sink(part_path_, state_.bytes_completed);
                    return complete(sink);
                }
            }

            FileSink sink(part_path_, state_.bytes_completed);
            range_offset_ = state_.bytes_completed;
            durable_bytes_ = range_offset_;

            sink_ = &sink;
            const auto outcome =
                fetcher_->fetch(request_.url, requestHeaders(range_offset_ > 0), range_offset_, sink, *this);
            sink_ = nullptr;

            if (storage_failure_) {
                return fail(*storage_failure_);
            }

            switch (outcome.kind) {
            case FetchOutcome::Kind::Completed:
                return complete(sink);

            case FetchOutcome::Kind::Cancelled:
                persistFlushed(sink);
                return pause();

            case FetchOutcome::Kind::ResumeRejected: {
                server_resumable_ = false;
                if (resume_rejected_once) {
                    // Only the first rejection restarts for free.
                    FailureCause cause = *outcome.cause;
                    cause.retryable = true;
                    if (!retryAfter(cause, retry)) {
                        return fail(*outcome.cause);
                    }
                } else {
                    spdlog::warn("{}: {}, restarting from zero", request_.url, outcome.cause->message);
                }
                resume_rejected_once = true;
                restartFromZero(&outcome.resource, &sink);
                continue;
            }

            case FetchOutcome::Kind::Failed: {
                const FailureCause& cause = *outcome.cause;
                if (cause.kind == ErrorKind::ValidatorMismatch) {
                    if (validator_restarted) {
                        return fail(cause);
                    }
                    spdlog::warn("{}: {}, restarting from zero", request_.url, cause.message);
                    validator_restarted = true;
                    restartFromZero(&outcome.resource, &sink);
                    continue;
                }
                if (cause.kind == ErrorKind::Storage) {
                    return fail(cause);
                }

                persistFlushed(sink);
                if (!retryAfter(cause, retry)) {
                    return fail(cause);
                }
                if (!server_resumable_ && state_.bytes_completed > 0) {
                    restartFromZero(nullptr, &sink);
                }
                continue;
            }
            }
        }
    }

    void prepareDestinationDirectory() const {
        const auto parent = request_.destination.parent_path();
        if (parent.empty()) {
            return;
        }
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw TransferError(ErrorKind::Storage, fmt::format("Failed to create download directory: {} - {}",
                                                                parent.string(), ec.message()));
        }
    }

    // Bytes past the persisted count were never recorded; a short file lowers the offset.
    bool reconcilePartialFile() {
        std::error_code ec;
        std::uint64_t on_disk = 0;
        if (fs::is_regular_file(part_path_, ec)) {
            on_disk = fs::file_size(part_path_, ec);
            if (ec) {
                on_disk = 0;
            }
        }

        if (on_disk < state_.bytes_completed) {
            spdlog::warn("{} holds {} of {} recorded bytes", part_path_.string(), on_disk, state_.bytes_completed);
            state_.bytes_completed = on_disk;
        }
        if (state_.bytes_completed == 0) {
            return false;
        }

        durable_bytes_ = state_.bytes_completed;
        spdlog::info("Resuming {} at {} bytes", request_.url, state_.bytes_completed);
        return true;
    }

    // Learns the announced file name when asked to, then looks for a finished file in its place.
    std::optional<TransferResult> inspectDestination() {
        std::optional<ProbeResult> probe;
        if (request_.name_from_response) {
            probe = fetcher_->probe(request_.url, requestHeaders(false), this);
            if (probe->cancelled) {
                return pause();
            }
            if (probe->ok() && probe->resource->file_name) {
                state_.file_name = probe->resource->file_name;
            }
        }

        const auto destination = destinationPath();
        std::error_code ec;
        if (!fs::is_regular_file(destination, ec)) {
            return std::nullopt;
        }
        const auto local_size = fs::file_size(destination, ec);
        if (ec) {
            return std::nullopt;
        }

        if (!probe) {
            probe = fetcher_->probe(request_.url, requestHeaders(false), this);
            if (probe->cancelled) {
                return pause();
            }
        }
        if (!probe->ok() && !options_.overwrite_existing) {
            return fail(*probe->cause);
        }
        const bool same_size =
            probe->ok() && probe->resource->total_size && *probe->resource->total_size == local_size;
        if (same_size) {
            spdlog::info("{} already downloaded ({} bytes)", destination.string(), local_size);
        } else if (!options_.overwrite_existing) {
            spdlog::warn("{} already exists with a different size, skipping", destination.string());
        } else {
            spdlog::warn("{} already exists with a different size, overwriting", destination.string());
            return std::nullopt;
        }

        state_.total_size = local_size;
        state_.bytes_completed = local_size;
        state_.validator = probe->ok() ? probe->resource->validator : std::nullopt;
        state_.status = TransferStatus::Completed;
        store_->remove(key_);
        emit();
        return TransferResult{TransferStatus::Completed, std::nullopt};
    }

    [[nodiscard]] fs::path destinationPath() const {
        if (request_.name_from_response && state_.file_name) {
            return request_.destination.parent_path() / *state_.file_name;
        }
        return request_.destination;
    }

    [[nodiscard]] bool resourceChanged(const ResourceInfo& resource) const {
        if (state_.validator && resource.validator && *state_.validator != *resource.validator) {
            return true;
        }
        return state_.total_size && resource.total_size && *state_.total_size != *resource.total_size;
    }

    [[nodiscard]] Headers requestHeaders(bool ranged) const {
        Headers headers = options_.default_headers;
        headers.insert(headers.end(), request_.headers.begin(), request_.headers.end());
        if (ranged && state_.validator && !detail::isWeakValidator(*state_.validator)) {
            headers.emplace_back("If-Range", *state_.validator);
        }
        return headers;
    }

    bool retryAfter(const FailureCause& cause, int& retry) {
        if (!cause.retryable || retry >= options_.retry.max_retries) {
            return false;
        }
        ++retry;
        const auto delay = options_.retry.delayFor(retry);
        spdlog::warn("{}: {}; retry {}/{} in {} ms", request_.url, cause.describe(), retry,
                     options_.retry.max_retries, delay.count());
        token_->waitFor(delay);
        return true;
    }

    // The reset is recorded before the bytes go, so the record never claims more than the file holds.
    void restartFromZero(const ResourceInfo* fresh, ByteSink* sink) {
        const auto discarded = state_.bytes_completed;
        state_.bytes_completed = 0;
        durable_bytes_ = 0;
        state_.total_size = fresh ? fresh->total_size : std::nullopt;
        state_.validator = fresh ? fresh->validator : std::nullopt;
        persist();

        if (sink) {
            sink->discard();
        } else {
            std::error_code ec;
            if (fs::exists(part_path_, ec)) {
                fs::resize_file(part_path_, 0, ec);
                if (ec) {
                    throw TransferError(ErrorKind::Storage, fmt::format("Cannot truncate partial file {}: {}",
                                                                        part_path_.string(), ec.message()));
                }
            }
        }
        emit(discarded);
    }

    void persistFlushed(ByteSink& sink) {
        sink.flush();
        durable_bytes_ = sink.size();
        persist();
    }

    void persist() {
        if (sink_) {
            sink_->flush();
            durable_bytes_ = sink_->size();
        }
        TransferState record = state_;
        record.bytes_completed = std::min(record.bytes_completed, durable_bytes_);
        store_->save(key_, record);
        last_persist_bytes_ = record.bytes_completed;
        last_persist_time_ = Clock::now();
    }

    TransferResult complete(FileSink& sink) {
        sink.close();
        durable_bytes_ = state_.bytes_completed;
        if (!state_.total_size) {
            state_.total_size = state_.bytes_completed;
        }

        const auto destination = destinationPath();
        std::error_code ec;
        fs::rename(part_path_, destination, ec);
        if (ec) {
            throw TransferError(ErrorKind::Storage, fmt::format("Failed to move {} into place: {}",
                                                                part_path_.string(), ec.message()));
        }

        state_.status = TransferStatus::Completed;
        store_->remove(key_);
        spdlog::info("Downloaded {} ({} bytes)", destination.string(), state_.bytes_completed);
        emit();
        return {TransferStatus::Completed, std::nullopt};
    }

    TransferResult pause() {
        state_.status = TransferStatus::Paused;
        persist();
        spdlog::info("Paused {} at {} bytes", request_.url, state_.bytes_completed);
        emit();
        return {TransferStatus::Paused, std::nullopt};
    }

    TransferResult fail(FailureCause cause) {
        spdlog::error("{}: {}", request_.url, cause.describe());
        state_.status = TransferStatus::Failed;
        try {
            persist();
        } catch (const TransferError& ex) {
            spdlog::error("Cannot record failure of {}: {}", request_.url, ex.what());
        }
        emit(0, cause);
        return {TransferStatus::Failed, std::move(cause)};
    }

    void emit(std::uint64_t discarded = 0, std::optional<FailureCause> cause = std::nullopt) {
        {
            std::lock_guard<std::mutex> lock(snapshot_mutex_);
            snapshot_ = state_;
        }
        if (on_progress_) {
            on_progress_(ProgressEvent{id_, state_.bytes_completed, state_.total_size, state_.status, Clock::now(),
                                       discarded, std::move(cause)});
        }
    }

    TransferId id_;
    TransferRequest request_;
    RangeFetcherPtr fetcher_;
    StateStorePtr store_;
    TransferOptions options_;
    ProgressCallback on_progress_;
    CancelTokenPtr token_;
    std::string key_;
    fs::path part_path_;

    TransferState state_{};
    ByteSink* sink_{nullptr};
    std::uint64_t range_offset_{0};
    std::uint64_t durable_bytes_{0};
    std::uint64_t last_persist_bytes_{0};
    Clock::time_point last_persist_time_{Clock::now()};
    bool server_resumable_{true};
    std::optional<FailureCause> storage_failure_;

    mutable std::mutex snapshot_mutex_;
    TransferState snapshot_{};
};

Transfer::Transfer(TransferId id, TransferRequest request, RangeFetcherPtr fetcher, StateStorePtr store,
                   TransferOptions options, ProgressCallback on_progress, CancelTokenPtr cancel_token)
    : impl_(std::make_unique<Impl>(id, std::move(request), std::move(fetcher), std::move(store),
                                   std::move(options), std::move(on_progress), std::move(cancel_token))) {}

Transfer::~Transfer() = default;

TransferResult Transfer::run() { return impl_->run(); }

void Transfer::cancel() { impl_->cancel(); }

TransferId Transfer::id() const { return impl_->id(); }

const TransferRequest& Transfer::request() const { return impl_->request(); }

TransferState Transfer::state() const { return impl_->snapshot(); }

} // namespace resumable

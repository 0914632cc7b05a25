#include "resumable/range_fetcher.hpp"

#include "resumable/detail/http_headers.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace resumable {

namespace {

ResourceInfo describeResource(const ResponseHead& head) {
    ResourceInfo info;
    info.http_status = head.status_code;

    if (auto etag = head.header("ETag"); etag && !etag->empty()) {
        info.validator = std::move(etag);
    } else if (auto modified = head.header("Last-Modified"); modified && !modified->empty()) {
        info.validator = std::move(modified);
    }

    if (const auto ranges = head.header("Accept-Ranges"); ranges && detail::iequals(*ranges, "none")) {
        info.accepts_ranges = false;
    }

    if (const auto disposition = head.header("Content-Disposition")) {
        info.file_name = detail::parseContentDispositionFilename(*disposition);
    }
    if (!info.file_name && !head.effective_url.empty()) {
        info.file_name = filenameFromUrl(head.effective_url);
    }
    return info;
}

std::optional<std::uint64_t> contentLength(const ResponseHead& head) {
    const auto value = head.header("Content-Length");
    return value ? detail::parseContentLength(*value) : std::nullopt;
}

class FetchSession final : public ResponseHandler {
public:
    FetchSession(std::uint64_t start_offset, ByteSink& sink, FetchListener& listener)
        : start_(start_offset), position_(start_offset), sink_(sink), listener_(listener) {}

    bool onHead(const ResponseHead& head) override {
        head_seen_ = true;
        outcome_.resource = describeResource(head);
        const long status = head.status_code;

        if (start_ > 0 && status == 416) {
            rejected_ = true;
            return false;
        }
        if (status >= 300) {
            failure_ = FailureCause::server(status, "unexpected response status");
            return false;
        }

        std::optional<std::uint64_t> total;
        if (status == 206) {
            const auto header = head.header("Content-Range");
            const auto range = header ? detail::parseContentRange(*header) : std::nullopt;
            if (!range || range->first != start_) {
                if (start_ > 0) {
                    rejected_ = true;
                } else {
                    failure_ = FailureCause::server(status, "partial content for a full request");
                }
                return false;
            }
            total = range->total;
        } else if (start_ > 0 && status != 0) {
            // Full body for a ranged request: the server restarted from zero.
            rejected_ = true;
            return false;
        } else {
            // Status 0 is a non-HTTP scheme, which honours the offset itself.
            const auto length = contentLength(head);
            total = length ? std::optional<std::uint64_t>{start_ + *length} : std::nullopt;
        }
        outcome_.resource.total_size = total;

        if (!listener_.onResponse(outcome_.resource)) {
            failure_ = FailureCause{ErrorKind::ValidatorMismatch, "remote resource changed since the last run",
                                    status, false};
            return false;
        }
        return true;
    }

    bool onBody(const char* data, std::size_t size) override {
        const auto& total = outcome_.resource.total_size;
        if (total && position_ + size > *total) {
            failure_ = FailureCause::sizeMismatch(
                fmt::format("server sent more than the declared {} bytes", *total));
            return false;
        }

        try {
            sink_.write(data, size);
        } catch (const TransferError& ex) {
            failure_ = FailureCause::storage(ex.what());
            return false;
        }

        position_ += size;
        listener_.onChunk(position_);

        // Cancellation is observed only between whole chunks.
        if (listener_.cancelled()) {
            cancelled_ = true;
            return false;
        }
        return true;
    }

    bool keepGoing() override {
        if (listener_.cancelled()) {
            cancelled_ = true;
            return false;
        }
        return true;
    }

    FetchOutcome finish(const TransportResult& result) {
        outcome_.bytes_completed = position_;
        const auto& total = outcome_.resource.total_size;

        if (rejected_) {
            outcome_.kind = FetchOutcome::Kind::ResumeRejected;
            outcome_.cause = FailureCause{ErrorKind::ResumeRejected,
                                          fmt::format("server ignored the range request at offset {}", start_),
                                          outcome_.resource.http_status, false};
        } else if (failure_) {
            fail(std::move(*failure_));
        } else if (cancelled_) {
            outcome_.kind = FetchOutcome::Kind::Cancelled;
        } else if (result.status == TransportResult::Status::Failed) {
            if (result.early_close) {
                fail(FailureCause::sizeMismatch(
                    fmt::format("connection closed early at {} bytes: {}", position_, result.message)));
            } else {
                fail(FailureCause::network(result.message, result.retryable));
            }
        } else if (result.status == TransportResult::Status::Aborted || !head_seen_) {
            fail(FailureCause::network("no response received"));
        } else if (total && position_ != *total) {
            fail(FailureCause::sizeMismatch(fmt::format("stream ended at {} of {} bytes", position_, *total)));
        } else {
            outcome_.kind = FetchOutcome::Kind::Completed;
        }
        return std::move(outcome_);
    }

private:
    void fail(FailureCause cause) {
        outcome_.kind = FetchOutcome::Kind::Failed;
        outcome_.cause = std::move(cause);
    }

    std::uint64_t start_;
    std::uint64_t position_;
    ByteSink& sink_;
    FetchListener& listener_;

    FetchOutcome outcome_{};
    std::optional<FailureCause> failure_;
    bool head_seen_{false};
    bool rejected_{false};
    bool cancelled_{false};
};

class ProbeSession final : public ResponseHandler {
public:
    explicit ProbeSession(const FetchListener* listener) : listener_(listener) {}

    bool onHead(const ResponseHead& head) override {
        head_ = head;
        return true;
    }

    bool onBody([[maybe_unused]] const char* data, [[maybe_unused]] std::size_t size) override { return true; }

    bool keepGoing() override {
        if (listener_ && listener_->cancelled()) {
            cancelled_ = true;
            return false;
        }
        return true;
    }

    std::optional<ResponseHead> head_;
    bool cancelled_{false};

private:
    const FetchListener* listener_;
};

} // namespace

RangeFetcher::RangeFetcher(HttpTransportPtr transport) : transport_(std::move(transport)) {}

FetchOutcome RangeFetcher::fetch(const std::string& url, const Headers& headers, std::uint64_t start_offset,
                                 ByteSink& sink, FetchListener& listener) const {
    HttpRequest request{url, headers, std::nullopt, false};
    if (start_offset > 0) {
        request.range_start = start_offset;
    }

    FetchSession session(start_offset, sink, listener);
    const auto result = transport_->perform(request, session);
    return session.finish(result);
}

ProbeResult RangeFetcher::probe(const std::string& url, const Headers& headers,
                                const FetchListener* listener) const {
    if (listener && listener->cancelled()) {
        return {std::nullopt, std::nullopt, true};
    }

    ProbeSession session(listener);
    const auto result = transport_->perform(HttpRequest{url, headers, std::nullopt, true}, session);

    if (session.cancelled_) {
        return {std::nullopt, std::nullopt, true};
    }
    if (result.status != TransportResult::Status::Ok) {
        return {std::nullopt, FailureCause::network(result.message, result.retryable)};
    }
    if (!session.head_) {
        return {std::nullopt, FailureCause::network("no response received")};
    }

    const long status = session.head_->status_code;
    if (status == 405 || status == 501) {
        spdlog::debug("HEAD not supported for {}, resource metadata unknown", url);
        ResourceInfo unknown;
        unknown.http_status = status;
        return {unknown, std::nullopt};
    }
    if (status >= 400) {
        return {std::nullopt, FailureCause::server(status, "metadata request rejected")};
    }

    auto info = describeResource(*session.head_);
    info.total_size = contentLength(*session.head_);
    return {std::move(info), std::nullopt};
}

} // namespace resumable

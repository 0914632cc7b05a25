#pragma once

#include "byte_sink.hpp"
#include "errors.hpp"
#include "http_transport.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace resumable {

struct ResourceInfo {
    std::optional<std::uint64_t> total_size;
    std::optional<std::string> validator;
    bool accepts_ranges{true};
    long http_status{0};
    // From Content-Disposition, else the last segment of the final url.
    std::optional<std::string> file_name;
};

class FetchListener {
public:
    virtual ~FetchListener() = default;

    // Returning false rejects the resource; the fetch ends as ValidatorMismatch.
    virtual bool onResponse(const ResourceInfo& resource) = 0;
    // Cumulative offset in the destination after each chunk was written.
    virtual void onChunk(std::uint64_t bytes_completed) = 0;
    [[nodiscard]] virtual bool cancelled() const = 0;
};

struct FetchOutcome {
    enum class Kind {
        Completed,
        Failed,
        ResumeRejected,
        Cancelled
    };

    Kind kind{Kind::Completed};
    ResourceInfo resource;
    std::optional<FailureCause> cause;
    std::uint64_t bytes_completed{0};
};

struct ProbeResult {
    std::optional<ResourceInfo> resource;
    std::optional<FailureCause> cause;
    // The listener asked to stop before the response head arrived.
    bool cancelled{false};

    [[nodiscard]] bool ok() const noexcept { return resource.has_value(); }
};

class RangeFetcher {
public:
    explicit RangeFetcher(HttpTransportPtr transport);

    // GET from start_offset (no Range header when 0), streaming the body to sink.
    [[nodiscard]] FetchOutcome fetch(const std::string& url, const Headers& headers, std::uint64_t start_offset,
                                     ByteSink& sink, FetchListener& listener) const;

    // Metadata-only request (HEAD) used to confirm a resource before resuming it.
    // listener->cancelled() is polled while waiting and aborts the request.
    [[nodiscard]] ProbeResult probe(const std::string& url, const Headers& headers,
                                    const FetchListener* listener = nullptr) const;

private:
    HttpTransportPtr transport_;
};

using RangeFetcherPtr = std::shared_ptr<const RangeFetcher>;

} // namespace resumable

#pragma once

#include "transfer_request.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace resumable {

struct HttpRequest {
    std::string url;
    Headers headers;
    std::optional<std::uint64_t> range_start;
    bool head_only{false};
};

struct ResponseHead {
    long status_code{0};
    Headers headers;
    // Url the response came from after redirects; empty when unknown.
    std::string effective_url;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    // Called once with the final response head, before any body bytes.
    virtual bool onHead(const ResponseHead& head) = 0;
    virtual bool onBody(const char* data, std::size_t size) = 0;
    // Polled while waiting for bytes; returning false aborts the request.
    virtual bool keepGoing() { return true; }
};

struct TransportResult {
    enum class Status {
        Ok,
        Failed,
        Aborted
    };

    Status status{Status::Ok};
    std::string message;
    bool retryable{false};
    // The connection closed before the declared body length arrived.
    bool early_close{false};
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual TransportResult perform(const HttpRequest& request, ResponseHandler& handler) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace resumable

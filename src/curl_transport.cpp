#include "resumable/curl_transport.hpp"

#include "resumable/detail/curl_utils.hpp"
#include "resumable/detail/http_headers.hpp"

#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace resumable {

class CurlTransport::Impl {
public:
    explicit Impl(TransferOptions options) : options_(std::move(options)) {}

    TransportResult perform(const HttpRequest& request, ResponseHandler& handler) const {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

        detail::ensureCurlInitialized();

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return {TransportResult::Status::Failed, "Failed to allocate curl handle", false, false};
        }

        HeaderList header_list{nullptr, &curl_slist_free_all};
        for (const auto& [name, value] : request.headers) {
            const std::string line = name + ": " + value;
            curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
            if (!appended) {
                return {TransportResult::Status::Failed, "Failed to build request headers", false, false};
            }
            header_list.release();
            header_list.reset(appended);
        }

        RequestContext ctx{curl.get(), &handler};
        char error_buffer[CURL_ERROR_SIZE] = {0};
        const std::string range =
            request.range_start && *request.range_start > 0 ? std::to_string(*request.range_start) + "-" : "";

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        // A connection delivering less than one byte per second for the stall window is dead.
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(options_.chunk_size));
        if (header_list) {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        }
        if (!range.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }
        if (request.head_only) {
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        }

        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        spdlog::debug("{} {}{}", request.head_only ? "HEAD" : "GET", request.url,
                      range.empty() ? std::string{} : " range " + range);

        const CURLcode res = curl_easy_perform(curl.get());

        if (res == CURLE_OK && !ctx.head_delivered && !ctx.deliverHead()) {
            ctx.aborted = true;
        }
        if (ctx.aborted) {
            return {TransportResult::Status::Aborted, "aborted by handler", false, false};
        }
        if (res == CURLE_OK) {
            return {};
        }

        std::string message = error_buffer[0] != '\0' ? std::string{error_buffer} : curl_easy_strerror(res);
        return {TransportResult::Status::Failed, std::move(message), isRetryable(res), res == CURLE_PARTIAL_FILE};
    }

private:
    struct RequestContext {
        CURL* curl{nullptr};
        ResponseHandler* handler{nullptr};
        ResponseHead head{};
        bool head_delivered{false};
        bool aborted{false};

        bool deliverHead() {
            head_delivered = true;
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            head.status_code = code;
            char* effective = nullptr;
            if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
                head.effective_url = effective;
            }
            return handler->onHead(head);
        }
    };

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<RequestContext*>(userdata);
        const size_t total = size * nitems;
        const std::string_view line{buffer, total};

        // Every status line (redirects, 100 Continue) starts a fresh head.
        if (detail::isStatusLine(line)) {
            ctx->head.headers.clear();
        } else if (auto header = detail::parseHeaderLine(line)) {
            ctx->head.headers.push_back(std::move(*header));
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<RequestContext*>(userdata);
        const size_t total = size * nmemb;

        if (!ctx->head_delivered && !ctx->deliverHead()) {
            ctx->aborted = true;
            return 0;
        }
        if (total == 0) {
            return 0;
        }
        if (!ctx->handler->onBody(ptr, total)) {
            ctx->aborted = true;
            return 0;
        }
        return total;
    }

    static int progressCallback(void* clientp, [[maybe_unused]] curl_off_t dltotal,
                                [[maybe_unused]] curl_off_t dlnow, [[maybe_unused]] curl_off_t ultotal,
                                [[maybe_unused]] curl_off_t ulnow) {
        auto* ctx = static_cast<RequestContext*>(clientp);
        if (!ctx->handler->keepGoing()) {
            ctx->aborted = true;
            return 1;
        }
        return 0;
    }

    static bool isRetryable(CURLcode code) {
        switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
        }
    }

    TransferOptions options_;
};

CurlTransport::CurlTransport(TransferOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlTransport::~CurlTransport() = default;

TransportResult CurlTransport::perform(const HttpRequest& request, ResponseHandler& handler) {
    return impl_->perform(request, handler);
}

} // namespace resumable

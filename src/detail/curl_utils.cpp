#include "resumable/detail/curl_utils.hpp"

#include "resumable/errors.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <mutex>

namespace resumable::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw TransferError(ErrorKind::Network, "Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

} // namespace resumable::detail

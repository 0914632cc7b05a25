#include "resumable/transfer_request.hpp"

#include "resumable/detail/http_headers.hpp"

#include <cstdint>
#include <string_view>

#include <fmt/format.h>

namespace resumable {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::uint64_t fnv1a(std::string_view data, std::uint64_t hash = kFnvOffset) {
    for (const unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

} // namespace

std::string TransferRequest::key() const {
    std::uint64_t hash = fnv1a(url);
    hash = fnv1a("\n", hash);
    hash = fnv1a(destination.lexically_normal().string(), hash);
    return fmt::format("{:016x}", hash);
}

std::string filenameFromUrl(const std::string& url) {
    std::string_view path{url};

    const auto scheme = path.find("://");
    if (scheme != std::string_view::npos) {
        path.remove_prefix(scheme + 3);
        const auto slash = path.find('/');
        path = slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
    }

    const auto query = path.find_first_of("?#");
    if (query != std::string_view::npos) {
        path = path.substr(0, query);
    }

    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }

    const auto last_slash = path.rfind('/');
    const auto segment = last_slash == std::string_view::npos ? path : path.substr(last_slash + 1);

    std::string name = detail::percentDecode(segment);
    // A decoded segment must not smuggle in directory components.
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos) {
        return "download";
    }
    return name;
}

} // namespace resumable

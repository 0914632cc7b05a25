#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace resumable {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct TransferRequest {
    std::string url;
    std::filesystem::path destination;
    Headers headers;
    // Replace the file name of destination with the one the server announces
    // (Content-Disposition, else the last segment of the final url).
    bool name_from_response{false};

    // Stable identifier of the persisted state, derived from url + destination.
    [[nodiscard]] std::string key() const;
};

// Last path segment of the url, percent-decoded; "download" when there is none.
[[nodiscard]] std::string filenameFromUrl(const std::string& url);

} // namespace resumable

#pragma once

#include "resumable/transfer_request.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace resumable::detail {

struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total;
};

[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

// "HTTP/1.1 206 Partial Content" and friends; a new one starts a new response head.
[[nodiscard]] bool isStatusLine(std::string_view line) noexcept;

// Splits "Name: value", trimming whitespace and the trailing CRLF.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> parseHeaderLine(std::string_view line);

[[nodiscard]] std::optional<std::string> findHeader(const Headers& headers, std::string_view name);

// "bytes 100-199/1000" or "bytes 100-199/*".
[[nodiscard]] std::optional<ContentRange> parseContentRange(std::string_view value) noexcept;

[[nodiscard]] std::optional<std::uint64_t> parseContentLength(std::string_view value) noexcept;

[[nodiscard]] std::string percentDecode(std::string_view text);

// File name from a Content-Disposition value; filename* wins over filename.
// Directory components are stripped, "." and ".." are rejected.
[[nodiscard]] std::optional<std::string> parseContentDispositionFilename(std::string_view value);

// W/"..." entity tags cannot be used with If-Range.
[[nodiscard]] bool isWeakValidator(std::string_view validator) noexcept;

} // namespace resumable::detail

#include "resumable/detail/http_headers.hpp"

#include <cctype>
#include <charconv>

namespace resumable::detail {

namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::uint64_t> parseNumber(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

// Splits off the next ';'-separated parameter; semicolons inside quotes do not count.
std::string_view nextParameter(std::string_view& rest) noexcept {
    bool quoted = false;
    for (std::size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] == '\\' && quoted) {
            ++i;
        } else if (rest[i] == '"') {
            quoted = !quoted;
        } else if (rest[i] == ';' && !quoted) {
            const auto param = rest.substr(0, i);
            rest.remove_prefix(i + 1);
            return param;
        }
    }
    const auto param = rest;
    rest = {};
    return param;
}

std::string unquote(std::string_view text) {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        return std::string{text};
    }
    text = text.substr(1, text.size() - 2);
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            ++i;
        }
        out.push_back(text[i]);
    }
    return out;
}

} // namespace

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

bool isStatusLine(std::string_view line) noexcept {
    return line.size() >= 5 && iequals(line.substr(0, 5), "HTTP/");
}

std::optional<std::pair<std::string, std::string>> parseHeaderLine(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    const auto name = trim(line.substr(0, colon));
    if (name.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::string{name}, std::string{trim(line.substr(colon + 1))});
}

std::optional<std::string> findHeader(const Headers& headers, std::string_view name) {
    // Last occurrence wins, matching how a repeated header overrides an earlier one.
    for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
        if (iequals(it->first, name)) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::optional<ContentRange> parseContentRange(std::string_view value) noexcept {
    value = trim(value);
    constexpr std::string_view unit = "bytes";
    if (value.size() <= unit.size() || !iequals(value.substr(0, unit.size()), unit)) {
        return std::nullopt;
    }
    value = trim(value.substr(unit.size()));

    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    const auto first = parseNumber(value.substr(0, dash));
    const auto last = parseNumber(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }

    ContentRange range{*first, *last, std::nullopt};
    const auto total_text = trim(value.substr(slash + 1));
    if (total_text != "*") {
        range.total = parseNumber(total_text);
        if (!range.total || *range.total <= *last) {
            return std::nullopt;
        }
    }
    return range;
}

std::optional<std::uint64_t> parseContentLength(std::string_view value) noexcept {
    return parseNumber(value);
}

std::string percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::optional<std::string> parseContentDispositionFilename(std::string_view value) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    std::string_view rest = value;
    while (!rest.empty()) {
        const auto param = trim(nextParameter(rest));
        const auto eq = param.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const auto name = trim(param.substr(0, eq));
        const auto raw = trim(param.substr(eq + 1));
        if (iequals(name, "filename*")) {
            // charset'language'percent-encoded-value
            const auto first = raw.find('\'');
            const auto second = first == std::string_view::npos ? first : raw.find('\'', first + 1);
            if (second != std::string_view::npos) {
                extended = percentDecode(raw.substr(second + 1));
            }
        } else if (iequals(name, "filename")) {
            plain = unquote(raw);
        }
    }

    auto filename = extended ? std::move(extended) : std::move(plain);
    if (!filename) {
        return std::nullopt;
    }
    // Only the last path component is honoured.
    if (const auto slash = filename->find_last_of("/\\"); slash != std::string::npos) {
        filename->erase(0, slash + 1);
    }
    if (filename->empty() || *filename == "." || *filename == "..") {
        return std::nullopt;
    }
    return filename;
}

bool isWeakValidator(std::string_view validator) noexcept {
    return validator.size() >= 2 && (validator[0] == 'W' || validator[0] == 'w') && validator[1] == '/';
}

} // namespace resumable::detail

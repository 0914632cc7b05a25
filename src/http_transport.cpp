#include "resumable/http_transport.hpp"

#include "resumable/detail/http_headers.hpp"

namespace resumable {

std::optional<std::string> ResponseHead::header(std::string_view name) const {
    return detail::findHeader(headers, name);
}

} // namespace resumable

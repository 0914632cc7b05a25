#pragma once

#include "http_transport.hpp"
#include "options.hpp"

#include <memory>

namespace resumable {

class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(TransferOptions options = {});
    ~CurlTransport() override;

    TransportResult perform(const HttpRequest& request, ResponseHandler& handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace resumable

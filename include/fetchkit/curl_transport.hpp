#pragma once

#include "http_transport.hpp"

#include <memory>

namespace fetchkit {

class CurlTransport final : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    TransportStatus get(const HttpRequest& request, HttpResponseHandler& handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fetchkit

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace fetchkit {

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const noexcept;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest {
    std::string url;
    HeaderMap headers;
    // Preferred size of a single body delivery, 0 leaves it to the transport.
    std::size_t buffer_size{0};
    // Hard limit for the whole exchange, nullopt for none.
    std::optional<std::chrono::milliseconds> timeout;
};

struct HttpResponseHead {
    long status_code{0};
    std::string status_line;
    HeaderMap headers;

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
    // -1 when the header is absent or malformed.
    [[nodiscard]] std::int64_t contentLength() const;
};

// Receives one response. Returning false from any method aborts the exchange.
class HttpResponseHandler {
public:
    virtual ~HttpResponseHandler() = default;

    // Called once, before the first body byte (or after the exchange for an empty body).
    virtual bool onResponse(const HttpResponseHead& head) = 0;
    virtual bool onData(const char* data, std::size_t size) = 0;
    // Called periodically while the exchange is in progress, with or without new data.
    virtual bool onPoll() = 0;
};

struct TransportStatus {
    bool ok{true};
    // The handler asked to stop.
    bool aborted{false};
    std::string message;
    // The transport gave up because the request timeout elapsed.
    bool timed_out{false};
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Performs a GET and streams the response into handler. Blocks until done.
    virtual TransportStatus get(const HttpRequest& request, HttpResponseHandler& handler) = 0;
};

} // namespace fetchkit

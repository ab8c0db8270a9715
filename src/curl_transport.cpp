#include "fetchkit/curl_transport.hpp"

#include "fetchkit/detail/curl_utils.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace fetchkit {

class CurlTransport::Impl {
public:
    TransportStatus get(const HttpRequest& request, HttpResponseHandler& handler) {
        detail::CurlHandle curl = detail::makeCurlHandle();
        if (!curl) {
            return {false, false, "Failed to allocate curl handle"};
        }

        auto header_list = detail::makeHeaderList(request.headers);
        if (!header_list) {
            return {false, false, "Failed to build request headers"};
        }

        ExchangeContext ctx{&handler, curl.get()};

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list->get());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        // Some servers misbehave over HTTP/2 with ranged requests.
        curl_easy_setopt(curl.get(), CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        if (request.buffer_size > 0) {
            const auto buffer_size = std::clamp<std::size_t>(request.buffer_size, 1024, CURL_MAX_READ_SIZE);
            curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(buffer_size));
        }
        if (request.timeout) {
            const long timeout_ms = static_cast<long>(std::max<long long>(1, request.timeout->count()));
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
        }

        const CURLcode res = curl_easy_perform(curl.get());

        if (res == CURLE_OK) {
            // Bodiless responses (e.g. 403 with no content) never reach the write callback.
            if (!ctx.head_delivered && !deliverHead(ctx)) {
                return {false, true, "aborted by handler"};
            }
            return {};
        }

        if (ctx.aborted || res == CURLE_ABORTED_BY_CALLBACK) {
            return {false, true, "aborted by handler"};
        }

        spdlog::debug("curl error for {}: {}", request.url, curl_easy_strerror(res));
        return {false, false, std::string{"curl error: "} + curl_easy_strerror(res),
                res == CURLE_OPERATION_TIMEDOUT};
    }

private:
    struct ExchangeContext {
        HttpResponseHandler* handler{nullptr};
        CURL* curl{nullptr};
        HttpResponseHead head{};
        bool head_delivered{false};
        bool aborted{false};
    };

    static bool deliverHead(ExchangeContext& ctx) {
        long code = 0;
        curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);
        ctx.head.status_code = code;
        ctx.head_delivered = true;
        if (!ctx.handler->onResponse(ctx.head)) {
            ctx.aborted = true;
            return false;
        }
        return true;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<ExchangeContext*>(userdata);
        const size_t total = size * nitems;
        if (!ctx) {
            return 0;
        }

        const std::string line = detail::trimHeaderText(std::string(buffer, total));
        if (line.rfind("HTTP/", 0) == 0) {
            // A new response begins (redirects and 100-continue produce several).
            ctx->head = HttpResponseHead{};
            ctx->head.status_line = line;
        } else if (auto header = detail::splitHeaderLine(line)) {
            ctx->head.headers[header->first] = std::move(header->second);
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<ExchangeContext*>(userdata);
        if (!ctx || !ctx->handler) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (!ctx->head_delivered && !deliverHead(*ctx)) {
            return 0;
        }
        if (total == 0) {
            return 0;
        }

        if (!ctx->handler->onData(ptr, total)) {
            ctx->aborted = true;
            return 0;
        }
        return total;
    }

    static int xferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<ExchangeContext*>(userdata);
        if (!ctx || !ctx->handler) {
            return 1;
        }
        if (!ctx->handler->onPoll()) {
            ctx->aborted = true;
            return 1;
        }
        return 0;
    }
};

CurlTransport::CurlTransport() : impl_(std::make_unique<Impl>()) {
    detail::ensureCurlInitialized();
}

CurlTransport::~CurlTransport() = default;

TransportStatus CurlTransport::get(const HttpRequest& request, HttpResponseHandler& handler) {
    return impl_->get(request, handler);
}

} // namespace fetchkit

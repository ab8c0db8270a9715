#include "fetchkit/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace fetchkit::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
        spdlog::debug("libcurl initialized: {}", curl_version());
    });
}

CurlHandle makeCurlHandle() {
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

std::optional<HeaderList> makeHeaderList(const HeaderMap& headers) {
    HeaderList list{nullptr, &curl_slist_free_all};
    for (const auto& [name, value] : headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(list.get(), line.c_str());
        if (!appended) {
            return std::nullopt;
        }
        // curl_slist_append returns the head, which is unchanged after the first node.
        list.release();
        list.reset(appended);
    }
    return list;
}

std::optional<std::pair<std::string, std::string>> splitHeaderLine(const std::string& line) {
    const std::string text = trimHeaderText(line);
    if (text.empty() || text.rfind("HTTP/", 0) == 0) {
        return std::nullopt;
    }
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(trimHeaderText(text.substr(0, colon)), trimHeaderText(text.substr(colon + 1)));
}

std::string trimHeaderText(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace fetchkit::detail

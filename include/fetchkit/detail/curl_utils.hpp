#pragma once

#include "fetchkit/http_transport.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <curl/curl.h>

namespace fetchkit::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// Performs curl_global_init exactly once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

[[nodiscard]] CurlHandle makeCurlHandle();

// "Name: value" lines for CURLOPT_HTTPHEADER. nullopt when libcurl runs out of memory.
[[nodiscard]] std::optional<HeaderList> makeHeaderList(const HeaderMap& headers);

// Splits a raw response header line into name and value. nullopt for status and blank lines.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> splitHeaderLine(const std::string& line);

[[nodiscard]] std::string trimHeaderText(const std::string& value);

} // namespace fetchkit::detail

#include "fetchkit/http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace fetchkit {

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const noexcept {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char a, unsigned char b) {
            return std::tolower(a) < std::tolower(b);
        });
}

std::optional<std::string> HttpResponseHead::header(const std::string& name) const {
    const auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::int64_t HttpResponseHead::contentLength() const {
    const auto value = header("Content-Length");
    if (!value || value->empty()) {
        return -1;
    }

    std::int64_t length = 0;
    const char* begin = value->data();
    const char* end = begin + value->size();
    const auto [ptr, ec] = std::from_chars(begin, end, length);
    if (ec != std::errc{} || ptr != end) {
        return -1;
    }
    return length;
}

} // namespace fetchkit

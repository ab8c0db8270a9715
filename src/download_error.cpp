#include "fetchkit/download_error.hpp"

#include <utility>

#include <fmt/format.h>

namespace fetchkit {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ServerError: return "ServerError";
        case ErrorCode::ResumeUnsupported: return "ResumeUnsupported";
        case ErrorCode::SizeUnknown: return "SizeUnknown";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string DownloadError::describe() const {
    if (code == ErrorCode::ServerError) {
        return fmt::format("{}: server returned status {} ({})", toString(code), http_status, status_line);
    }
    if (message.empty()) {
        return toString(code);
    }
    return fmt::format("{}: {}", toString(code), message);
}

DownloadError DownloadError::invalidArgument(std::string message) {
    return {ErrorCode::InvalidArgument, std::move(message), 0, {}};
}

DownloadError DownloadError::ioError(std::string message) {
    return {ErrorCode::IOError, std::move(message), 0, {}};
}

DownloadError DownloadError::serverError(long http_status, std::string status_line) {
    std::string message = fmt::format("status {}", http_status);
    return {ErrorCode::ServerError, std::move(message), http_status, std::move(status_line)};
}

DownloadError DownloadError::resumeUnsupported(std::string message) {
    return {ErrorCode::ResumeUnsupported, std::move(message), 0, {}};
}

DownloadError DownloadError::sizeUnknown(std::string message) {
    return {ErrorCode::SizeUnknown, std::move(message), 0, {}};
}

DownloadError DownloadError::cancelled(std::string message) {
    return {ErrorCode::Cancelled, std::move(message), 0, {}};
}

} // namespace fetchkit

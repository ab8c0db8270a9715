#pragma once

#include <optional>
#include <string>
#include <utility>

namespace fetchkit {

enum class ErrorCode {
    InvalidArgument,
    IOError,
    ServerError,
    ResumeUnsupported,
    SizeUnknown,
    Cancelled
};

[[nodiscard]] const char* toString(ErrorCode code) noexcept;

struct DownloadError {
    ErrorCode code{ErrorCode::IOError};
    std::string message;
    // Only meaningful for ErrorCode::ServerError.
    long http_status{0};
    std::string status_line;

    [[nodiscard]] std::string describe() const;

    static DownloadError invalidArgument(std::string message);
    static DownloadError ioError(std::string message);
    static DownloadError serverError(long http_status, std::string status_line);
    static DownloadError resumeUnsupported(std::string message);
    static DownloadError sizeUnknown(std::string message);
    static DownloadError cancelled(std::string message);
};

// Outcome of a transfer: success, or the error that ended it.
class DownloadResult {
public:
    DownloadResult() = default;
    DownloadResult(DownloadError error) : error_(std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    // Precondition: !ok()
    [[nodiscard]] const DownloadError& error() const& { return *error_; }

private:
    std::optional<DownloadError> error_;
};

} // namespace fetchkit

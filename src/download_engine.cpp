#include "fetchkit/download_engine.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include <sys/types.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fetchkit {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

// Opens for read/write without truncating; creates the file when it does not exist.
FilePtr openForResume(const std::string& path) {
    FilePtr file{std::fopen(path.c_str(), "rb+")};
    if (!file && errno == ENOENT) {
        file.reset(std::fopen(path.c_str(), "wb+"));
    }
    return file;
}

std::optional<std::int64_t> parseInt(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value < 0) {
        return std::nullopt;
    }
    return value;
}

class TransferSession final : public HttpResponseHandler {
public:
    TransferSession(const TransferDescriptor& descriptor,
                    FILE* file,
                    std::int64_t start_offset,
                    const CancellationToken& cancellation,
                    const ProgressCallback& on_progress,
                    std::chrono::milliseconds sample_interval)
        : descriptor_(descriptor),
          file_(file),
          start_offset_(start_offset),
          downloaded_(start_offset),
          cancellation_(cancellation),
          on_progress_(on_progress),
          sampler_(sample_interval) {}

    bool onResponse(const HttpResponseHead& head) override {
        if (checkCancelled()) {
            return false;
        }

        const long code = head.status_code;
        if (code < 200 || code >= 300) {
            return fail(DownloadError::serverError(code, head.status_line));
        }

        if (code == 206) {
            const auto content_range = head.header("Content-Range");
            if (!content_range) {
                return fail(DownloadError::resumeUnsupported("partial response without Content-Range"));
            }
            const auto range = parseContentRange(*content_range);
            if (!range) {
                return fail(DownloadError::sizeUnknown(fmt::format("malformed Content-Range: {}", *content_range)));
            }
            if (range->first != start_offset_) {
                return fail(DownloadError::resumeUnsupported(
                    fmt::format("server resumed at byte {} instead of {}", range->first, start_offset_)));
            }
            if (range->total <= 0) {
                return fail(DownloadError::sizeUnknown("Content-Range does not carry the total size"));
            }
            total_ = range->total;
        } else {
            if (start_offset_ > 0) {
                return fail(DownloadError::resumeUnsupported(
                    fmt::format("server ignored the range request (status {})", code)));
            }
            const std::int64_t length = head.contentLength();
            if (length <= 0) {
                return fail(DownloadError::sizeUnknown("server did not report Content-Length"));
            }
            total_ = length;
        }

        if (start_offset_ > total_) {
            return fail(DownloadError::resumeUnsupported(
                fmt::format("local file holds {} bytes but the remote size is {}", start_offset_, total_)));
        }

        if (fseeko(file_, static_cast<off_t>(start_offset_), SEEK_SET) != 0) {
            return fail(DownloadError::ioError(fmt::format("Failed to seek output file: {}", std::strerror(errno))));
        }

        spdlog::debug("{}: status {}, total {} bytes, starting at {}", descriptor_.url, code, total_, start_offset_);
        streaming_ = true;
        sampler_.start(ProgressSampler::Clock::now());
        return true;
    }

    bool onData(const char* data, std::size_t size) override {
        if (!streaming_) {
            return fail(DownloadError::ioError("body received before response headers"));
        }

        std::size_t offset = 0;
        while (offset < size) {
            if (checkCancelled()) {
                return false;
            }

            const std::int64_t allowed = total_ - downloaded_;
            if (allowed <= 0) {
                return fail(DownloadError::ioError(
                    fmt::format("response body exceeds the declared size of {} bytes", total_)));
            }

            const std::size_t n = std::min({size - offset, descriptor_.chunk_size, static_cast<std::size_t>(allowed)});
            if (std::fwrite(data + offset, 1, n, file_) != n) {
                return fail(DownloadError::ioError(fmt::format("Failed to write output file: {}", std::strerror(errno))));
            }
            // Keep the on-disk size equal to the reported count so a cancelled run resumes cleanly.
            if (std::fflush(file_) != 0) {
                return fail(DownloadError::ioError(fmt::format("Failed to flush output file: {}", std::strerror(errno))));
            }

            offset += n;
            downloaded_ += static_cast<std::int64_t>(n);
            sampler_.recordChunk();
            if (sampler_.poll(ProgressSampler::Clock::now()) && !emit()) {
                return false;
            }
        }
        return true;
    }

    bool onPoll() override {
        if (checkCancelled()) {
            return false;
        }
        if (streaming_ && sampler_.poll(ProgressSampler::Clock::now())) {
            return emit();
        }
        return true;
    }

    // Called once the transport reports a clean end of stream.
    bool finishStream() {
        if (error_) {
            return false;
        }
        if (!streaming_) {
            return fail(DownloadError::ioError("no usable response received"));
        }
        if (downloaded_ < total_) {
            return fail(DownloadError::ioError(
                fmt::format("stream ended after {} of {} bytes", downloaded_, total_)));
        }
        if (sampler_.finish()) {
            return emit();
        }
        return true;
    }

    [[nodiscard]] const std::optional<DownloadError>& error() const { return error_; }
    [[nodiscard]] std::int64_t downloaded() const noexcept { return downloaded_; }
    [[nodiscard]] std::int64_t total() const noexcept { return total_; }

private:
    bool fail(DownloadError error) {
        if (!error_) {
            error_ = std::move(error);
        }
        return false;
    }

    bool checkCancelled() {
        if (!cancellation_.isCancelled()) {
            return false;
        }
        fail(DownloadError::cancelled(cancellation_.cancelRequested() ? "cancelled by caller" : "timed out"));
        return true;
    }

    bool emit() {
        if (!on_progress_) {
            return true;
        }
        try {
            on_progress_(computePercent(downloaded_, total_), downloaded_, total_);
        } catch (const std::exception& ex) {
            // The callback runs inside the transport's C callbacks; stop instead of unwinding through them.
            return fail(DownloadError::ioError(fmt::format("progress callback failed: {}", ex.what())));
        }
        return true;
    }

    const TransferDescriptor& descriptor_;
    FILE* file_;
    const std::int64_t start_offset_;
    std::int64_t downloaded_;
    std::int64_t total_{0};
    const CancellationToken& cancellation_;
    const ProgressCallback& on_progress_;
    ProgressSampler sampler_;
    bool streaming_{false};
    std::optional<DownloadError> error_;
};

} // namespace

std::map<std::string, std::string> defaultHttpHeaders() {
    return {
        {"Accept", "*/*"},
        {"Priority", "u=1, i"},
        {"User-Agent",
         "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
         "Chrome/142.0.0.0 Safari/537.36"},
    };
}

double computePercent(std::int64_t downloaded, std::int64_t total) noexcept {
    if (total <= 0) {
        return 0.0;
    }
    const double ratio = static_cast<double>(downloaded) / static_cast<double>(total);
    return std::clamp(ratio * 100.0, 0.0, 100.0);
}

std::optional<ContentRange> parseContentRange(const std::string& value) {
    // bytes 0-1023/4096, bytes 1024-4095/*
    constexpr const char* kUnit = "bytes";
    std::size_t pos = value.find_first_not_of(' ');
    if (pos == std::string::npos || value.compare(pos, std::strlen(kUnit), kUnit) != 0) {
        return std::nullopt;
    }
    pos += std::strlen(kUnit);
    if (pos >= value.size() || (value[pos] != ' ' && value[pos] != '=')) {
        return std::nullopt;
    }
    const auto range_begin = value.find_first_not_of(" =", pos);
    if (range_begin == std::string::npos) {
        return std::nullopt;
    }
    const std::string range_text = value.substr(range_begin);

    const auto slash = range_text.find('/');
    const auto dash = range_text.find('-');
    if (slash == std::string::npos || dash == std::string::npos || dash > slash) {
        return std::nullopt;
    }

    ContentRange range;
    const auto first = parseInt(range_text.substr(0, dash));
    const auto last = parseInt(range_text.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }
    range.first = *first;
    range.last = *last;

    std::string total_text = range_text.substr(slash + 1);
    total_text.erase(total_text.find_last_not_of(" \r\n") + 1);
    if (total_text == "*") {
        range.total = -1;
        return range;
    }
    const auto total = parseInt(total_text);
    if (!total || *total <= *last) {
        return std::nullopt;
    }
    range.total = *total;
    return range;
}

DownloadEngine::DownloadEngine(HttpTransport& transport, EngineOptions options)
    : transport_(transport), options_(std::move(options)) {}

DownloadResult DownloadEngine::run(const TransferDescriptor& descriptor,
                                   const CancellationToken& cancellation,
                                   const ProgressCallback& on_progress) const {
    const TransferDescriptor transfer = descriptor;

    if (transfer.url.empty()) {
        return DownloadError::invalidArgument("empty URL");
    }
    if (transfer.destination.empty()) {
        return DownloadError::invalidArgument("empty destination path");
    }
    if (transfer.chunk_size == 0) {
        return DownloadError::invalidArgument("chunk size must be positive");
    }
    if (cancellation.isCancelled()) {
        return DownloadError::cancelled("cancelled before start");
    }

    FilePtr file = openForResume(transfer.destination);
    if (!file) {
        return DownloadError::ioError(
            fmt::format("Cannot open destination file {}: {}", transfer.destination, std::strerror(errno)));
    }
    if (fseeko(file.get(), 0, SEEK_END) != 0) {
        return DownloadError::ioError(fmt::format("Failed to seek output file: {}", std::strerror(errno)));
    }
    const off_t existing = ftello(file.get());
    if (existing < 0) {
        return DownloadError::ioError(fmt::format("Failed to read output file size: {}", std::strerror(errno)));
    }
    const auto start_offset = static_cast<std::int64_t>(existing);
    if (start_offset > 0) {
        spdlog::info("Found {} bytes in {}, resuming", start_offset, transfer.destination);
    }

    HttpRequest request;
    request.url = transfer.url;
    for (const auto& [name, value] : transfer.headers) {
        request.headers[name] = value;
    }
    for (const auto& [name, value] : options_.default_headers) {
        request.headers.emplace(name, value);
    }
    if (start_offset > 0) {
        request.headers["Range"] = fmt::format("bytes={}-", start_offset);
    }
    request.buffer_size = transfer.chunk_size;
    request.timeout = cancellation.remaining();

    TransferSession session(transfer, file.get(), start_offset, cancellation, on_progress, options_.sample_interval);
    const TransportStatus status = transport_.get(request, session);

    if (status.ok && session.finishStream()) {
        if (std::fclose(file.release()) != 0) {
            return DownloadError::ioError(fmt::format("Failed to close output file: {}", std::strerror(errno)));
        }
        spdlog::debug("{}: finished, {} bytes", transfer.destination, session.downloaded());
        return {};
    }

    if (session.error()) {
        return *session.error();
    }
    if (cancellation.cancelRequested()) {
        return DownloadError::cancelled("cancelled by caller");
    }
    // The transport may give up a few milliseconds before the token sees its deadline pass.
    if (status.timed_out || cancellation.deadlineExpired()) {
        return DownloadError::cancelled("timed out");
    }
    return DownloadError::ioError(status.message.empty() ? "transfer failed" : status.message);
}

} // namespace fetchkit

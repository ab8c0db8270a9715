#pragma once

#include "cancellation.hpp"
#include "download_error.hpp"
#include "http_transport.hpp"
#include "progress_sampler.hpp"
#include "transfer_descriptor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace fetchkit {

using ProgressCallback = std::function<void(double percent, std::int64_t downloaded, std::int64_t total)>;

// Headers sent when the caller does not set them.
[[nodiscard]] std::map<std::string, std::string> defaultHttpHeaders();

[[nodiscard]] double computePercent(std::int64_t downloaded, std::int64_t total) noexcept;

struct ContentRange {
    std::int64_t first{0};
    std::int64_t last{-1};
    // -1 when the server reports "*".
    std::int64_t total{-1};
};

// Parses "bytes first-last/total". nullopt when the value is malformed.
[[nodiscard]] std::optional<ContentRange> parseContentRange(const std::string& value);

struct EngineOptions {
    std::map<std::string, std::string> default_headers{defaultHttpHeaders()};
    std::chrono::milliseconds sample_interval{kDefaultSampleInterval};
};

// Runs one resumable transfer at a time per call; the engine itself keeps no per-transfer
// state, so concurrent run() calls on different destinations are fine.
class DownloadEngine {
public:
    explicit DownloadEngine(HttpTransport& transport, EngineOptions options = {});

    [[nodiscard]] DownloadResult run(const TransferDescriptor& descriptor,
                                     const CancellationToken& cancellation,
                                     const ProgressCallback& on_progress = {}) const;

private:
    HttpTransport& transport_;
    EngineOptions options_;
};

} // namespace fetchkit

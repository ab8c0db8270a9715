#pragma once

#include "transfer_descriptor.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace fetchkit {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AppConfig {
    std::string url;
    std::string output_dir;
    std::string output_path;
    std::string timeout{"30s"};
    std::int64_t chunk_size{static_cast<std::int64_t>(kDefaultChunkSize)};
    std::map<std::string, std::string> headers;
};

void to_json(nlohmann::json& j, const AppConfig& config);
void from_json(const nlohmann::json& j, AppConfig& config);

[[nodiscard]] AppConfig defaultConfig();
[[nodiscard]] AppConfig loadConfig(const std::string& path);
void saveConfig(const std::string& path, const AppConfig& config);

// Go-style durations: "300ms", "1.5h", "2h45m". Units ns, us, ms, s, m, h.
[[nodiscard]] std::optional<std::chrono::milliseconds> parseDuration(const std::string& text);
// The configured timeout, or 30s when it does not parse.
[[nodiscard]] std::chrono::milliseconds timeoutOf(const AppConfig& config);

// File name to save a URL under when no output path is configured.
[[nodiscard]] std::string defaultFilename(const std::string& url);

// Builds the descriptor for config.url, deriving the destination when output_path is empty.
// Throws ConfigError when the URL is empty or the chunk size is not positive.
[[nodiscard]] TransferDescriptor makeDescriptor(const AppConfig& config);

} // namespace fetchkit

#include "fetchkit/config.hpp"

#include "fetchkit/download_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <fmt/format.h>

namespace fetchkit {

namespace {

constexpr std::chrono::milliseconds kFallbackTimeout{30000};

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::optional<double> unitInNanoseconds(const std::string& unit) {
    if (unit == "ns") return 1.0;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return 1e3;
    if (unit == "ms") return 1e6;
    if (unit == "s") return 1e9;
    if (unit == "m") return 60e9;
    if (unit == "h") return 3600e9;
    return std::nullopt;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Percent-decoding of a path segment; nullopt on a malformed escape.
std::optional<std::string> unescapePath(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        const int hi = hexValue(text[i + 1]);
        const int lo = hexValue(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

bool isInteger(const std::string& text) {
    std::size_t pos = 0;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        pos = 1;
    }
    if (pos >= text.size()) {
        return false;
    }
    return std::all_of(text.begin() + static_cast<std::ptrdiff_t>(pos), text.end(), isDigit);
}

bool endsWithIgnoreCase(const std::string& text, const std::string& suffix) {
    if (text.size() < suffix.size()) {
        return false;
    }
    return std::equal(suffix.rbegin(), suffix.rend(), text.rbegin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

// Drops the purely numeric '_'-separated parts of the stem: "12_report_2024.pdf" -> "report.pdf".
std::string stripNumericParts(const std::string& filename) {
    const auto dot = filename.rfind('.');
    const std::string ext = dot == std::string::npos ? std::string{} : filename.substr(dot);
    const std::string stem = filename.substr(0, filename.size() - ext.size());

    std::vector<std::string> kept;
    std::stringstream parts(stem);
    std::string item;
    while (std::getline(parts, item, '_')) {
        if (item.empty() || isInteger(item)) {
            continue;
        }
        kept.push_back(item);
    }

    std::string joined;
    for (std::size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            joined.push_back('_');
        }
        joined += kept[i];
    }
    return joined + ext;
}

} // namespace

void to_json(nlohmann::json& j, const AppConfig& config) {
    j = nlohmann::json::object();
    if (!config.url.empty()) {
        j["url"] = config.url;
    }
    j["output_dir"] = config.output_dir;
    if (!config.output_path.empty()) {
        j["output_path"] = config.output_path;
    }
    j["timeout"] = config.timeout;
    j["chunk_size"] = config.chunk_size;
    j["headers"] = config.headers;
}

void from_json(const nlohmann::json& j, AppConfig& config) {
    const AppConfig defaults;
    config.url = j.value("url", defaults.url);
    config.output_dir = j.value("output_dir", defaults.output_dir);
    config.output_path = j.value("output_path", defaults.output_path);
    config.timeout = j.value("timeout", defaults.timeout);
    config.chunk_size = j.value("chunk_size", defaults.chunk_size);
    config.headers = j.value("headers", defaults.headers);
}

AppConfig defaultConfig() {
    AppConfig config;
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    config.output_dir = ec ? std::string{"output"} : (cwd / "output").string();
    config.timeout = "30s";
    config.chunk_size = static_cast<std::int64_t>(kDefaultChunkSize);
    config.headers = defaultHttpHeaders();
    return config;
}

AppConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(fmt::format("Cannot read config file {}", path));
    }

    try {
        const auto j = nlohmann::json::parse(in);
        if (!j.is_object()) {
            throw ConfigError(fmt::format("Config file {} does not hold a JSON object", path));
        }
        return j.get<AppConfig>();
    } catch (const nlohmann::json::exception& ex) {
        throw ConfigError(fmt::format("Cannot parse config file {}: {}", path, ex.what()));
    }
}

void saveConfig(const std::string& path, const AppConfig& config) {
    const std::filesystem::path file{path};
    if (file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            throw ConfigError(fmt::format("Cannot create directory for {}: {}", path, ec.message()));
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw ConfigError(fmt::format("Cannot write config file {}", path));
    }
    out << nlohmann::json(config).dump(2) << '\n';
    out.flush();
    if (!out) {
        throw ConfigError(fmt::format("Failed to write config file {}", path));
    }
}

std::optional<std::chrono::milliseconds> parseDuration(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::size_t pos = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = text[0] == '-';
        pos = 1;
    }
    if (text.compare(pos, std::string::npos, "0") == 0) {
        return std::chrono::milliseconds{0};
    }
    if (pos >= text.size()) {
        return std::nullopt;
    }

    double nanoseconds = 0.0;
    while (pos < text.size()) {
        const std::size_t number_start = pos;
        bool seen_digit = false;
        bool seen_dot = false;
        while (pos < text.size() && (isDigit(text[pos]) || text[pos] == '.')) {
            if (text[pos] == '.') {
                if (seen_dot) {
                    return std::nullopt;
                }
                seen_dot = true;
            } else {
                seen_digit = true;
            }
            ++pos;
        }
        if (!seen_digit) {
            return std::nullopt;
        }
        const double value = std::strtod(text.substr(number_start, pos - number_start).c_str(), nullptr);

        const std::size_t unit_start = pos;
        while (pos < text.size() && !isDigit(text[pos]) && text[pos] != '.') {
            ++pos;
        }
        const auto factor = unitInNanoseconds(text.substr(unit_start, pos - unit_start));
        if (!factor) {
            return std::nullopt;
        }
        nanoseconds += value * *factor;
    }

    const auto millis = static_cast<std::chrono::milliseconds::rep>(nanoseconds / 1e6);
    return std::chrono::milliseconds{negative ? -millis : millis};
}

std::chrono::milliseconds timeoutOf(const AppConfig& config) {
    return parseDuration(config.timeout).value_or(kFallbackTimeout);
}

std::string defaultFilename(const std::string& url) {
    const auto slash = url.rfind('/');
    std::string filename = slash == std::string::npos ? url : url.substr(slash + 1);

    const auto query = filename.find_first_of("?#");
    if (query != std::string::npos) {
        filename.erase(query);
    }

    if (!endsWithIgnoreCase(filename, ".pdf")) {
        filename += ".pdf";
    }
    if (filename == ".pdf") {
        filename = fmt::format("download_{}.pdf", static_cast<long long>(std::time(nullptr)));
    }

    if (const auto decoded = unescapePath(filename)) {
        filename = *decoded;
    }
    if (filename.find('_') != std::string::npos) {
        filename = stripNumericParts(filename);
    }
    return filename;
}

TransferDescriptor makeDescriptor(const AppConfig& config) {
    if (config.url.empty()) {
        throw ConfigError("no URL configured");
    }
    if (config.chunk_size <= 0) {
        throw ConfigError(fmt::format("chunk size must be positive, got {}", config.chunk_size));
    }

    TransferDescriptor descriptor;
    descriptor.url = config.url;
    descriptor.destination = config.output_path;
    if (descriptor.destination.empty()) {
        descriptor.destination = (std::filesystem::path{config.output_dir} / defaultFilename(config.url)).string();
    }
    descriptor.chunk_size = static_cast<std::size_t>(config.chunk_size);
    descriptor.timeout = timeoutOf(config);
    descriptor.headers = config.headers;
    return descriptor;
}

} // namespace fetchkit

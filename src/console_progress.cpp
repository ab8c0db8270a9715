#include "fetchkit/console_progress.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace fetchkit {

namespace {

constexpr int kBarWidth = 30;
constexpr const char* kFilledGlyph = u8"█";
constexpr const char* kEmptyGlyph = u8"░";

std::string repeatGlyph(const char* glyph, int count) {
    std::string out;
    for (int i = 0; i < count; ++i) {
        out += glyph;
    }
    return out;
}

} // namespace

ConsoleProgress::ConsoleProgress(std::string name) : ConsoleProgress(std::move(name), std::cout) {}

ConsoleProgress::ConsoleProgress(std::string name, std::ostream& out) : name_(std::move(name)), out_(out) {}

void ConsoleProgress::update(double percent, std::int64_t downloaded, std::int64_t total) {
    if (total <= 0) {
        return;
    }
    out_ << '\r' << formatLine(name_, percent, downloaded, total) << std::flush;
    drawn_ = true;
}

void ConsoleProgress::finish() {
    if (drawn_) {
        out_ << '\n' << std::flush;
        drawn_ = false;
    }
}

ProgressCallback ConsoleProgress::callback() {
    return [this](double percent, std::int64_t downloaded, std::int64_t total) {
        update(percent, downloaded, total);
    };
}

std::string ConsoleProgress::formatLine(const std::string& name,
                                        double percent,
                                        std::int64_t downloaded,
                                        std::int64_t total) {
    const double clamped = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(clamped / 100.0 * kBarWidth);

    std::string bar = repeatGlyph(kFilledGlyph, filled);
    bar += repeatGlyph(kEmptyGlyph, kBarWidth - filled);

    return fmt::format("{:<13} [{}] {:>5.1f}% ({}/{})",
                       shortenName(name),
                       bar,
                       clamped,
                       formatSize(static_cast<std::uint64_t>(std::max<std::int64_t>(downloaded, 0))),
                       formatSize(static_cast<std::uint64_t>(std::max<std::int64_t>(total, 0))));
}

std::string ConsoleProgress::shortenName(const std::string& name) {
    if (name.empty()) {
        return "(unnamed)";
    }
    if (name.size() <= 10) {
        return name;
    }
    return name.substr(0, 5) + "..." + name.substr(name.size() - 5);
}

std::string ConsoleProgress::formatSize(std::uint64_t bytes) {
    static constexpr std::array<const char*, 4> kUnits{"KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

} // namespace fetchkit

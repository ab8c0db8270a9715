#pragma once

#include "download_engine.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

namespace fetchkit {

// Single-line terminal progress, redrawn in place with '\r'.
class ConsoleProgress {
public:
    explicit ConsoleProgress(std::string name);
    ConsoleProgress(std::string name, std::ostream& out);

    void update(double percent, std::int64_t downloaded, std::int64_t total);
    // Terminates the line if anything was drawn.
    void finish();

    [[nodiscard]] ProgressCallback callback();

    [[nodiscard]] static std::string formatLine(const std::string& name,
                                                double percent,
                                                std::int64_t downloaded,
                                                std::int64_t total);
    [[nodiscard]] static std::string shortenName(const std::string& name);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    std::string name_;
    std::ostream& out_;
    bool drawn_{false};
};

} // namespace fetchkit

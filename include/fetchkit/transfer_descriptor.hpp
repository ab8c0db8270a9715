#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace fetchkit {

inline constexpr std::size_t kDefaultChunkSize = 4 * 1024 * 1024;
inline constexpr std::chrono::milliseconds kDefaultTimeout{30000};

// Parameters of one transfer. The engine copies it before starting.
struct TransferDescriptor {
    std::string url;
    std::string destination;
    std::size_t chunk_size{kDefaultChunkSize};
    // Whole-transfer budget; zero disables the deadline.
    std::chrono::milliseconds timeout{kDefaultTimeout};
    std::map<std::string, std::string> headers;
};

} // namespace fetchkit

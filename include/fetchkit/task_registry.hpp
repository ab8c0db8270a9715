#pragma once

#include "progress.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fetchkit {

// Process-wide table of task progress. The map is guarded by a reader/writer lock and every
// record has its own mutex, so writers on different tasks never wait for each other.
class TaskRegistry {
public:
    // Throws std::invalid_argument when task_id is empty or already present.
    ProgressRecord create(const std::string& task_id, std::string display_name, std::string destination);

    // Applies a progress/status change. Returns the updated record, or nullopt when the task is
    // unknown or the status change is not allowed (e.g. out of a terminal state).
    std::optional<ProgressRecord> update(const std::string& task_id,
                                         std::int64_t downloaded,
                                         std::int64_t total,
                                         TaskStatus status,
                                         std::string error_message = {});

    // Moves the task to failed, keeping its counters.
    std::optional<ProgressRecord> fail(const std::string& task_id, std::string error_message);

    [[nodiscard]] std::optional<ProgressRecord> get(const std::string& task_id) const;
    [[nodiscard]] std::vector<ProgressRecord> list() const;
    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        ProgressRecord record;
    };

    [[nodiscard]] std::shared_ptr<Entry> find(const std::string& task_id) const;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace fetchkit

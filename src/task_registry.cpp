#include "fetchkit/task_registry.hpp"

#include "fetchkit/download_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace fetchkit {

ProgressRecord TaskRegistry::create(const std::string& task_id, std::string display_name, std::string destination) {
    if (task_id.empty()) {
        throw std::invalid_argument("task id must not be empty");
    }

    auto entry = std::make_shared<Entry>();
    entry->record.task_id = task_id;
    entry->record.filename = std::move(display_name);
    entry->record.output_path = std::move(destination);
    entry->record.status = TaskStatus::Pending;

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    const auto [it, inserted] = entries_.emplace(task_id, entry);
    if (!inserted) {
        throw std::invalid_argument("duplicate task id: " + task_id);
    }
    return it->second->record;
}

std::optional<ProgressRecord> TaskRegistry::update(const std::string& task_id,
                                                   std::int64_t downloaded,
                                                   std::int64_t total,
                                                   TaskStatus status,
                                                   std::string error_message) {
    const auto entry = find(task_id);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    ProgressRecord& record = entry->record;
    if (!canTransition(record.status, status)) {
        spdlog::debug("task {}: rejected transition {} -> {}", task_id, toString(record.status), toString(status));
        return std::nullopt;
    }

    // The total is fixed once known.
    if (record.total <= 0 && total > 0) {
        record.total = total;
    }
    record.downloaded = std::max(record.downloaded, std::max<std::int64_t>(downloaded, 0));
    if (record.total > 0) {
        record.downloaded = std::min(record.downloaded, record.total);
    }
    record.percent = computePercent(record.downloaded, record.total);
    record.status = status;
    if (status == TaskStatus::Failed) {
        record.error_message = std::move(error_message);
    }
    return record;
}

std::optional<ProgressRecord> TaskRegistry::fail(const std::string& task_id, std::string error_message) {
    const auto entry = find(task_id);
    if (!entry) {
        return std::nullopt;
    }

    std::int64_t downloaded = 0;
    std::int64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        downloaded = entry->record.downloaded;
        total = entry->record.total;
    }
    return update(task_id, downloaded, total, TaskStatus::Failed, std::move(error_message));
}

std::optional<ProgressRecord> TaskRegistry::get(const std::string& task_id) const {
    const auto entry = find(task_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record;
}

std::vector<ProgressRecord> TaskRegistry::list() const {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }

    std::vector<ProgressRecord> records;
    records.reserve(snapshot.size());
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        records.push_back(entry->record);
    }
    std::sort(records.begin(), records.end(), [](const ProgressRecord& a, const ProgressRecord& b) {
        return a.task_id < b.task_id;
    });
    return records;
}

std::size_t TaskRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return entries_.size();
}

std::shared_ptr<TaskRegistry::Entry> TaskRegistry::find(const std::string& task_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    const auto it = entries_.find(task_id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace fetchkit

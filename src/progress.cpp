#include "fetchkit/progress.hpp"

namespace fetchkit {

const char* toString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Downloading: return "downloading";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
    }
    return "unknown";
}

bool isTerminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Failed;
}

bool canTransition(TaskStatus from, TaskStatus to) noexcept {
    if (isTerminal(from)) {
        return false;
    }
    if (from == to) {
        return true;
    }
    switch (to) {
        case TaskStatus::Pending: return false;
        case TaskStatus::Downloading: return from == TaskStatus::Pending;
        case TaskStatus::Completed: return from == TaskStatus::Downloading;
        case TaskStatus::Failed: return true;
    }
    return false;
}

void to_json(nlohmann::json& j, const ProgressRecord& record) {
    j = nlohmann::json{
        {"task_id", record.task_id},
        {"filename", record.filename},
        {"percent", record.percent},
        {"downloaded", record.downloaded},
        {"total", record.total},
        {"status", record.status},
        {"output_path", record.output_path},
    };
    if (record.status == TaskStatus::Failed && !record.error_message.empty()) {
        j["error_msg"] = record.error_message;
    }
}

void from_json(const nlohmann::json& j, ProgressRecord& record) {
    record.task_id = j.at("task_id").get<std::string>();
    record.filename = j.value("filename", std::string{});
    record.percent = j.value("percent", 0.0);
    record.downloaded = j.value("downloaded", std::int64_t{0});
    record.total = j.value("total", std::int64_t{0});
    record.status = j.value("status", TaskStatus::Pending);
    record.output_path = j.value("output_path", std::string{});
    record.error_message = j.value("error_msg", std::string{});
}

std::string serialize(const ProgressRecord& record) {
    return nlohmann::json(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace fetchkit

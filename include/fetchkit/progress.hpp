#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace fetchkit {

enum class TaskStatus {
    Pending,
    Downloading,
    Completed,
    Failed
};

[[nodiscard]] const char* toString(TaskStatus status) noexcept;
[[nodiscard]] bool isTerminal(TaskStatus status) noexcept;
[[nodiscard]] bool canTransition(TaskStatus from, TaskStatus to) noexcept;

NLOHMANN_JSON_SERIALIZE_ENUM(TaskStatus, {
    {TaskStatus::Pending, "pending"},
    {TaskStatus::Downloading, "downloading"},
    {TaskStatus::Completed, "completed"},
    {TaskStatus::Failed, "failed"},
})

struct ProgressRecord {
    std::string task_id;
    std::string filename;
    double percent{0.0};
    std::int64_t downloaded{0};
    std::int64_t total{0};
    TaskStatus status{TaskStatus::Pending};
    std::string output_path;
    std::string error_message;
};

void to_json(nlohmann::json& j, const ProgressRecord& record);
void from_json(const nlohmann::json& j, ProgressRecord& record);

[[nodiscard]] std::string serialize(const ProgressRecord& record);

} // namespace fetchkit

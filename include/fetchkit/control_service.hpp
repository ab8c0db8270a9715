#pragma once

#include "config.hpp"
#include "download_manager.hpp"
#include "task_registry.hpp"

#include <functional>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace fetchkit {

// Serve-mode commands. One JSON object in, one JSON reply out; see handle().
class ControlService {
public:
    using ExitCallback = std::function<void()>;

    ControlService(AppConfig config,
                   std::string config_path,
                   DownloadManager& manager,
                   const TaskRegistry& registry,
                   ExitCallback on_exit = {});

    // Dispatches on command["action"]: download, status, tasks, cancel, config, save-config,
    // reset-config, exit. Never throws for a bad command; the reply carries success=false.
    [[nodiscard]] nlohmann::json handle(const nlohmann::json& command);
    // Same as handle() for one line of text.
    [[nodiscard]] std::string handleLine(const std::string& line);

    [[nodiscard]] AppConfig config() const;

private:
    nlohmann::json startDownload(const nlohmann::json& command);
    nlohmann::json taskStatus(const nlohmann::json& command) const;
    nlohmann::json listTasks() const;
    nlohmann::json cancelTask(const nlohmann::json& command);
    nlohmann::json getConfig() const;
    nlohmann::json saveConfigCommand(const nlohmann::json& command);
    nlohmann::json resetConfig();
    nlohmann::json requestExit();

    mutable std::mutex config_mutex_;
    AppConfig config_;
    std::string config_path_;
    DownloadManager& manager_;
    const TaskRegistry& registry_;
    ExitCallback on_exit_;
};

} // namespace fetchkit

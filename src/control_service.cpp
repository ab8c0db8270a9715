#include "fetchkit/control_service.hpp"

#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fetchkit {

namespace {

nlohmann::json failure(const std::string& message) {
    return {{"success", false}, {"message", message}};
}

std::string stringField(const nlohmann::json& command, const char* key) {
    const auto it = command.find(key);
    if (it == command.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

ControlService::ControlService(AppConfig config,
                               std::string config_path,
                               DownloadManager& manager,
                               const TaskRegistry& registry,
                               ExitCallback on_exit)
    : config_(std::move(config)),
      config_path_(std::move(config_path)),
      manager_(manager),
      registry_(registry),
      on_exit_(std::move(on_exit)) {}

nlohmann::json ControlService::handle(const nlohmann::json& command) {
    if (!command.is_object()) {
        return failure("command must be a JSON object");
    }

    const std::string action = stringField(command, "action");
    try {
        if (action == "download") return startDownload(command);
        if (action == "status") return taskStatus(command);
        if (action == "tasks") return listTasks();
        if (action == "cancel") return cancelTask(command);
        if (action == "config") return getConfig();
        if (action == "save-config") return saveConfigCommand(command);
        if (action == "reset-config") return resetConfig();
        if (action == "exit") return requestExit();
    } catch (const std::exception& ex) {
        spdlog::error("command {} failed: {}", action, ex.what());
        return failure(ex.what());
    }
    return failure(action.empty() ? "missing action" : fmt::format("unknown action: {}", action));
}

std::string ControlService::handleLine(const std::string& line) {
    nlohmann::json command;
    try {
        command = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
        return failure(fmt::format("invalid JSON: {}", ex.what())).dump();
    }
    // Decoded file names are not guaranteed to be valid UTF-8.
    return handle(command).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

AppConfig ControlService::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

nlohmann::json ControlService::startDownload(const nlohmann::json& command) {
    AppConfig download_config = config();
    const std::string url = stringField(command, "url");
    if (!url.empty()) {
        download_config.url = url;
    }
    if (download_config.url.empty()) {
        return failure("no URL given and none configured");
    }

    const TransferDescriptor descriptor = makeDescriptor(download_config);
    const std::string filename = defaultFilename(download_config.url);
    const auto record = manager_.start(descriptor, filename);

    return {
        {"success", true},
        {"task_id", record.task_id},
        {"filename", record.filename},
        {"output_path", record.output_path},
        {"total_size", 0},
        {"status", record.status},
        {"message", "download started"},
    };
}

nlohmann::json ControlService::taskStatus(const nlohmann::json& command) const {
    const std::string task_id = stringField(command, "task_id");
    const auto record = registry_.get(task_id);
    if (!record) {
        return failure(fmt::format("unknown task: {}", task_id));
    }
    return {{"success", true}, {"task", *record}};
}

nlohmann::json ControlService::listTasks() const {
    return {{"success", true}, {"tasks", registry_.list()}};
}

nlohmann::json ControlService::cancelTask(const nlohmann::json& command) {
    const std::string task_id = stringField(command, "task_id");
    if (!manager_.cancel(task_id)) {
        return failure(fmt::format("task {} is not running", task_id));
    }
    return {{"success", true}, {"message", "cancellation requested"}};
}

nlohmann::json ControlService::getConfig() const {
    return {{"success", true}, {"config", config()}};
}

nlohmann::json ControlService::saveConfigCommand(const nlohmann::json& command) {
    const auto it = command.find("config");
    if (it == command.end() || !it->is_object()) {
        return failure("missing config object");
    }

    AppConfig updated = it->get<AppConfig>();
    saveConfig(config_path_, updated);
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = std::move(updated);
    }
    spdlog::info("configuration saved to {}", config_path_);
    return {{"success", true}, {"message", "configuration saved"}};
}

nlohmann::json ControlService::resetConfig() {
    AppConfig defaults = defaultConfig();
    saveConfig(config_path_, defaults);
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = std::move(defaults);
    }
    spdlog::info("configuration reset to defaults");
    return {{"success", true}, {"message", "configuration reset to defaults"}};
}

nlohmann::json ControlService::requestExit() {
    spdlog::info("exit requested by client");
    if (on_exit_) {
        on_exit_();
    }
    return {{"success", true}, {"message", "shutting down"}};
}

} // namespace fetchkit

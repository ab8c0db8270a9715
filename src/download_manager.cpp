#include "fetchkit/download_manager.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fetchkit {

DownloadManager::DownloadManager(const DownloadEngine& engine, TaskRegistry& registry, ProgressPublisher& publisher)
    : engine_(engine), registry_(registry), publisher_(publisher) {}

DownloadManager::~DownloadManager() {
    cancelAll();
    waitAll();
}

ProgressRecord DownloadManager::addTask(const std::string& task_id,
                                        const std::string& display_name,
                                        const TransferDescriptor& descriptor) {
    std::string name = display_name;
    if (name.empty()) {
        name = std::filesystem::path{descriptor.destination}.filename().string();
    }
    auto record = registry_.create(task_id, std::move(name), descriptor.destination);
    publisher_.publish(record);
    return record;
}

DownloadResult DownloadManager::run(const std::string& task_id,
                                    const TransferDescriptor& descriptor,
                                    const CancellationToken& cancellation,
                                    const ProgressCallback& on_progress) {
    if (auto record = registry_.update(task_id, 0, 0, TaskStatus::Downloading)) {
        publisher_.publish(*record);
    } else {
        return DownloadError::invalidArgument(fmt::format("task {} is unknown or already finished", task_id));
    }

    spdlog::info("task {}: downloading {} -> {}", task_id, descriptor.url, descriptor.destination);

    std::int64_t last_downloaded = 0;
    std::int64_t last_total = 0;
    const auto result = engine_.run(descriptor, cancellation, [&](double percent, std::int64_t downloaded, std::int64_t total) {
        last_downloaded = downloaded;
        last_total = total;
        if (auto record = registry_.update(task_id, downloaded, total, TaskStatus::Downloading)) {
            publisher_.publish(*record);
        }
        if (on_progress) {
            on_progress(percent, downloaded, total);
        }
    });

    std::optional<ProgressRecord> terminal;
    if (result.ok()) {
        terminal = registry_.update(task_id, last_downloaded, last_total, TaskStatus::Completed);
        spdlog::info("task {}: completed, {} bytes", task_id, last_downloaded);
    } else {
        const std::string message = result.error().describe();
        terminal = registry_.fail(task_id, message);
        if (result.error().code == ErrorCode::Cancelled) {
            spdlog::warn("task {}: {}", task_id, message);
        } else {
            spdlog::error("task {}: {}", task_id, message);
        }
    }
    if (terminal) {
        publisher_.publish(*terminal);
    }
    return result;
}

ProgressRecord DownloadManager::start(TransferDescriptor descriptor, std::string display_name) {
    const std::string task_id = makeTaskId();
    auto record = addTask(task_id, display_name, descriptor);

    auto cancellation = std::make_shared<CancellationToken>(descriptor.timeout);
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    reapFinishedLocked();

    Worker worker;
    worker.cancellation = cancellation;
    worker.done = done;
    worker.thread = std::thread([this, task_id, descriptor = std::move(descriptor), cancellation, done]() {
        const bool succeeded = run(task_id, descriptor, *cancellation).ok();
        spdlog::debug("task {}: worker finished ({})", task_id, succeeded ? "ok" : "failed");
        done->store(true);
    });
    workers_.emplace(task_id, std::move(worker));
    return record;
}

bool DownloadManager::cancel(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    const auto it = workers_.find(task_id);
    if (it == workers_.end() || it->second.done->load()) {
        return false;
    }
    it->second.cancellation->cancel();
    return true;
}

void DownloadManager::cancelAll() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& [id, worker] : workers_) {
        worker.cancellation->cancel();
    }
}

void DownloadManager::waitAll() {
    std::unordered_map<std::string, Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& [id, worker] : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

std::size_t DownloadManager::activeTasks() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    std::size_t active = 0;
    for (const auto& [id, worker] : workers_) {
        if (!worker.done->load()) {
            ++active;
        }
    }
    return active;
}

std::string DownloadManager::makeTaskId() {
    static std::atomic<std::int64_t> last{0};
    const auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    std::int64_t previous = last.load();
    std::int64_t next = 0;
    do {
        next = std::max<std::int64_t>(now, previous + 1);
    } while (!last.compare_exchange_weak(previous, next));
    return std::to_string(next);
}

void DownloadManager::reapFinishedLocked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->second.done->load()) {
            if (it->second.thread.joinable()) {
                it->second.thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace fetchkit

#pragma once

#include "broadcast_hub.hpp"
#include "cancellation.hpp"
#include "download_engine.hpp"
#include "task_registry.hpp"
#include "transfer_descriptor.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace fetchkit {

// Runs transfers and keeps the registry and the observers informed. Every progress sample of a
// task goes registry first, then publisher, from the single thread running that task.
class DownloadManager {
public:
    DownloadManager(const DownloadEngine& engine, TaskRegistry& registry, ProgressPublisher& publisher);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Creates the pending record and publishes it.
    ProgressRecord addTask(const std::string& task_id,
                           const std::string& display_name,
                           const TransferDescriptor& descriptor);

    // Runs a task created by addTask() on the calling thread until it reaches a terminal state.
    DownloadResult run(const std::string& task_id,
                       const TransferDescriptor& descriptor,
                       const CancellationToken& cancellation,
                       const ProgressCallback& on_progress = {});

    // addTask() followed by run() on a dedicated thread. Returns the pending record.
    ProgressRecord start(TransferDescriptor descriptor, std::string display_name);

    bool cancel(const std::string& task_id);
    void cancelAll();
    // Joins every worker thread started by start().
    void waitAll();

    [[nodiscard]] std::size_t activeTasks() const;

    [[nodiscard]] static std::string makeTaskId();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<CancellationToken> cancellation;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinishedLocked();

    const DownloadEngine& engine_;
    TaskRegistry& registry_;
    ProgressPublisher& publisher_;

    mutable std::mutex workers_mutex_;
    std::unordered_map<std::string, Worker> workers_;
};

} // namespace fetchkit

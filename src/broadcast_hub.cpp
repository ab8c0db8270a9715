#include "fetchkit/broadcast_hub.hpp"

#include <exception>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fetchkit {

BroadcastHub::~BroadcastHub() {
    closeAll();
}

void BroadcastHub::registerConnection(ObserverConnectionPtr connection) {
    if (!connection) {
        return;
    }
    spdlog::debug("observer connected: {}", connection->describe());
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.insert(std::move(connection));
}

void BroadcastHub::unregisterConnection(const ObserverConnectionPtr& connection) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = connections_.erase(connection) > 0;
    }
    if (removed) {
        connection->close();
        spdlog::debug("observer disconnected: {}", connection->describe());
    }
}

void BroadcastHub::publish(const ProgressRecord& record) {
    std::string payload;
    try {
        payload = serialize(record);
    } catch (const std::exception& ex) {
        spdlog::error("failed to serialize progress of task {}: {}", record.task_id, ex.what());
        return;
    }

    // Deliver outside the lock so a slow observer does not stall registration.
    std::vector<ObserverConnectionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.assign(connections_.begin(), connections_.end());
    }

    std::vector<ObserverConnectionPtr> broken;
    for (const auto& connection : targets) {
        if (!deliver(connection, payload)) {
            broken.push_back(connection);
        }
    }

    for (const auto& connection : broken) {
        spdlog::warn("dropping observer {} after failed delivery", connection->describe());
        unregisterConnection(connection);
    }
}

void BroadcastHub::closeAll() {
    std::unordered_set<ObserverConnectionPtr> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing.swap(connections_);
    }
    for (const auto& connection : closing) {
        connection->close();
    }
}

std::size_t BroadcastHub::connectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

bool BroadcastHub::deliver(const ObserverConnectionPtr& connection, const std::string& payload) {
    try {
        return connection->send(payload);
    } catch (const std::exception& ex) {
        spdlog::warn("observer {} threw while sending: {}", connection->describe(), ex.what());
        return false;
    }
}

} // namespace fetchkit

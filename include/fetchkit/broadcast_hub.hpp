#pragma once

#include "observer_connection.hpp"
#include "progress.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_set>

namespace fetchkit {

class ProgressPublisher {
public:
    virtual ~ProgressPublisher() = default;

    virtual void registerConnection(ObserverConnectionPtr connection) = 0;
    virtual void unregisterConnection(const ObserverConnectionPtr& connection) = 0;
    // Best effort; never throws because of an observer.
    virtual void publish(const ProgressRecord& record) = 0;
};

class BroadcastHub final : public ProgressPublisher {
public:
    BroadcastHub() = default;
    ~BroadcastHub() override;

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    void registerConnection(ObserverConnectionPtr connection) override;
    void unregisterConnection(const ObserverConnectionPtr& connection) override;
    void publish(const ProgressRecord& record) override;

    // Closes and drops every connection.
    void closeAll();

    [[nodiscard]] std::size_t connectionCount() const;

private:
    [[nodiscard]] static bool deliver(const ObserverConnectionPtr& connection, const std::string& payload);

    mutable std::mutex mutex_;
    std::unordered_set<ObserverConnectionPtr> connections_;
};

} // namespace fetchkit

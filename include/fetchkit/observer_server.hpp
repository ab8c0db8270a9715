#pragma once

#include "activity_tracker.hpp"
#include "broadcast_hub.hpp"
#include "observer_connection.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fetchkit {

// TCP listener for push observers. Every client is registered with the publisher and receives
// each record as a JSON line; lines the client sends are passed to the command handler and the
// handler's reply is written back on the same connection.
class ObserverServer {
public:
    using CommandHandler = std::function<std::string(const std::string& line)>;

    ObserverServer(std::string bind_address,
                   std::uint16_t port,
                   ProgressPublisher& publisher,
                   CommandHandler handler,
                   ActivityTracker* tracker = nullptr);
    ~ObserverServer();

    ObserverServer(const ObserverServer&) = delete;
    ObserverServer& operator=(const ObserverServer&) = delete;

    // Binds and starts accepting. Throws std::system_error when the socket cannot be set up.
    void start();
    // Full shutdown: stops accepting, disconnects clients and joins their threads.
    // Must not be called from a command handler; use requestStop() there.
    void stop();
    // Asks wait() to return. Safe from any thread.
    void requestStop();
    // Blocks until requestStop() or stop().
    void wait();

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    struct Client {
        std::shared_ptr<SocketConnection> connection;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void acceptLoop();
    void serveClient(const std::shared_ptr<SocketConnection>& connection);
    void reapClientsLocked();

    std::string bind_address_;
    std::uint16_t port_;
    ProgressPublisher& publisher_;
    CommandHandler handler_;
    ActivityTracker* tracker_;

    int listen_fd_{-1};
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::mutex clients_mutex_;
    std::vector<Client> clients_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};
};

} // namespace fetchkit

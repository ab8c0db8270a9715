#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace fetchkit {

// A sink for serialized progress records.
class ObserverConnection {
public:
    virtual ~ObserverConnection() = default;

    // Delivers one message. false (or an exception) means the connection is broken.
    [[nodiscard]] virtual bool send(const std::string& message) = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual std::string describe() const = 0;
};

using ObserverConnectionPtr = std::shared_ptr<ObserverConnection>;

inline constexpr std::chrono::milliseconds kDefaultSendTimeout{50};

// Newline-delimited messages over a connected stream socket. Owns the descriptor.
// A peer that leaves no room for a frame within the send timeout counts as broken.
class SocketConnection final : public ObserverConnection {
public:
    SocketConnection(int fd, std::string peer, std::chrono::milliseconds send_timeout = kDefaultSendTimeout);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    [[nodiscard]] bool send(const std::string& message) override;
    void close() override;
    [[nodiscard]] std::string describe() const override { return peer_; }

    // Reads one '\n'-terminated line. Returns false on EOF, error or close().
    [[nodiscard]] bool readLine(std::string& line);

    [[nodiscard]] bool isOpen() const noexcept { return !closed_.load(); }

private:
    int fd_;
    std::string peer_;
    std::chrono::milliseconds send_timeout_;
    std::string read_buffer_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace fetchkit

#include "fetchkit/observer_connection.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace fetchkit {

namespace {

// Waits until the socket can take more bytes. false on timeout or error.
bool waitWritable(int fd, std::chrono::steady_clock::time_point deadline) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return false;
        }
        const int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        return ready > 0 && (pfd.revents & POLLOUT) != 0;
    }
}

} // namespace

SocketConnection::SocketConnection(int fd, std::string peer, std::chrono::milliseconds send_timeout)
    : fd_(fd), peer_(std::move(peer)), send_timeout_(send_timeout) {}

SocketConnection::~SocketConnection() {
    close();
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

bool SocketConnection::send(const std::string& message) {
    if (closed_.load()) {
        return false;
    }

    std::string frame;
    frame.reserve(message.size() + 1);
    frame.append(message);
    frame.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    // The whole frame shares one budget so a trickling reader cannot stall the publisher.
    const auto deadline = std::chrono::steady_clock::now() + send_timeout_;
    std::size_t sent = 0;
    while (sent < frame.size()) {
        const ssize_t n = ::send(fd_, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            if (err == EAGAIN || err == EWOULDBLOCK) {
                if (waitWritable(fd_, deadline)) {
                    continue;
                }
                spdlog::debug("send to {} failed: peer is not reading", peer_);
                return false;
            }
            spdlog::debug("send to {} failed: {}", peer_, std::strerror(err));
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

void SocketConnection::close() {
    if (closed_.exchange(true)) {
        return;
    }
    // The descriptor itself is released in the destructor so a reader blocked in recv() never
    // sees it reused.
    ::shutdown(fd_, SHUT_RDWR);
}

bool SocketConnection::readLine(std::string& line) {
    while (true) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            line = read_buffer_.substr(0, newline);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            read_buffer_.erase(0, newline + 1);
            return true;
        }
        if (closed_.load()) {
            return false;
        }

        char buffer[4096];
        const ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        read_buffer_.append(buffer, static_cast<std::size_t>(n));
    }
}

} // namespace fetchkit

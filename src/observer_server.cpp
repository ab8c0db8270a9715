#include "fetchkit/observer_server.hpp"

#include <cerrno>
#include <exception>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fetchkit {

namespace {

constexpr int kAcceptPollMs = 200;

std::string peerName(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip))) {
        return "unknown";
    }
    return fmt::format("{}:{}", ip, ntohs(addr.sin_port));
}

} // namespace

ObserverServer::ObserverServer(std::string bind_address,
                               std::uint16_t port,
                               ProgressPublisher& publisher,
                               CommandHandler handler,
                               ActivityTracker* tracker)
    : bind_address_(std::move(bind_address)),
      port_(port),
      publisher_(publisher),
      handler_(std::move(handler)),
      tracker_(tracker) {}

ObserverServer::~ObserverServer() {
    stop();
}

void ObserverServer::start() {
    if (running_.load()) {
        return;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }

    int opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        spdlog::warn("SO_REUSEADDR not set: {}", std::system_category().message(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw std::system_error(EINVAL, std::generic_category(), "invalid bind address " + bind_address_);
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), fmt::format("bind {}:{}", bind_address_, port_));
    }
    if (::listen(fd, SOMAXCONN) < 0) {
        const int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), "listen");
    }

    // Port 0 asks the kernel for an ephemeral port.
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    listen_fd_ = fd;
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    accept_thread_ = std::thread(&ObserverServer::acceptLoop, this);
    spdlog::info("Observer server listening on {}:{}", bind_address_, port_);
}

void ObserverServer::stop() {
    const bool was_running = running_.exchange(false);
    requestStop();

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    std::vector<Client> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }
    for (auto& client : clients) {
        publisher_.unregisterConnection(client.connection);
        client.connection->close();
    }
    for (auto& client : clients) {
        if (client.thread.joinable()) {
            client.thread.join();
        }
    }

    if (was_running) {
        spdlog::info("Observer server stopped");
    }
}

void ObserverServer::requestStop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

void ObserverServer::wait() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait(lock, [this] { return stop_requested_; });
}

void ObserverServer::acceptLoop() {
    while (running_.load()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on listening socket failed: {}", std::system_category().message(errno));
            requestStop();
            return;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_in peer{};
        socklen_t len = sizeof(peer);
        const int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &len);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                spdlog::warn("accept failed: {}", std::system_category().message(errno));
            }
            continue;
        }

        if (tracker_) {
            tracker_->touch();
        }

        auto connection = std::make_shared<SocketConnection>(client_fd, peerName(peer));
        publisher_.registerConnection(connection);

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(clients_mutex_);
        reapClientsLocked();
        Client client;
        client.connection = connection;
        client.done = done;
        client.thread = std::thread([this, connection, done]() {
            serveClient(connection);
            done->store(true);
        });
        clients_.push_back(std::move(client));
    }
}

void ObserverServer::serveClient(const std::shared_ptr<SocketConnection>& connection) {
    std::string line;
    while (connection->readLine(line)) {
        if (tracker_) {
            tracker_->touch();
        }
        if (line.empty() || !handler_) {
            continue;
        }

        std::string reply;
        try {
            reply = handler_(line);
        } catch (const std::exception& ex) {
            spdlog::error("command from {} failed: {}", connection->describe(), ex.what());
            const nlohmann::json failure{{"success", false}, {"message", ex.what()}};
            reply = failure.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        if (!connection->send(reply)) {
            break;
        }
    }

    std::shared_ptr<ObserverConnection> observer = connection;
    publisher_.unregisterConnection(observer);
    connection->close();
}

void ObserverServer::reapClientsLocked() {
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace fetchkit

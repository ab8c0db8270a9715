#include "fetchkit/activity_tracker.hpp"
#include "fetchkit/broadcast_hub.hpp"
#include "fetchkit/config.hpp"
#include "fetchkit/console_progress.hpp"
#include "fetchkit/control_service.hpp"
#include "fetchkit/curl_transport.hpp"
#include "fetchkit/detail/curl_utils.hpp"
#include "fetchkit/download_engine.hpp"
#include "fetchkit/download_manager.hpp"
#include "fetchkit/observer_server.hpp"
#include "fetchkit/task_registry.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::chrono::minutes kIdleLimit{5};
constexpr std::chrono::seconds kIdleCheckInterval{30};

fetchkit::CancellationToken* g_cancellation = nullptr;

void handleInterrupt(int) {
    if (g_cancellation) {
        g_cancellation->cancel();
    }
}

struct Options {
    std::string mode{"cli"};
    std::uint16_t port{8080};
    std::string config_path{"config.json"};
    std::string url;
    std::string output_path;
    std::optional<std::string> timeout;
    std::optional<std::int64_t> chunk_size;
    std::map<std::string, std::string> headers;
    bool verbose{false};
};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options]" << std::endl;
    std::cerr << "Options:\n"
              << "  -m, --mode <cli|serve>  Run mode (default: cli)\n"
              << "  -p, --port <port>       Serve mode port (default: 8080)\n"
              << "  -c, --config <path>     Configuration file (default: config.json)\n"
              << "  -u, --url <url>         File URL (cli mode)\n"
              << "  -o, --out <path>        Output file (cli mode, default: derived from URL)\n"
              << "  -t, --timeout <dur>     Whole-transfer timeout, e.g. 30s, 10m (cli mode)\n"
              << "  -k, --chunk <bytes>     Chunk size (cli mode, default: 4194304)\n"
              << "  -H <Key:Value>          Request header, repeatable (cli mode)\n"
              << "  -v                      Verbose logging\n"
              << "  -h, --help              Show this message" << std::endl;
}

std::pair<std::string, std::string> parseHeader(const std::string& text) {
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        throw std::runtime_error("Invalid header, expected Key:Value: " + text);
    }
    auto trim = [](std::string value) {
        const auto first = value.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return std::string{};
        }
        const auto last = value.find_last_not_of(" \t");
        return value.substr(first, last - first + 1);
    };
    std::string key = trim(text.substr(0, colon));
    if (key.empty()) {
        throw std::runtime_error("Invalid header, empty key: " + text);
    }
    return {std::move(key), trim(text.substr(colon + 1))};
}

// Returns nullopt when the program should exit with the given code right away.
std::optional<Options> parseArguments(int argc, char** argv, int& exit_code) {
    Options options;
    int arg_index = 1;

    while (arg_index < argc) {
        const std::string option = argv[arg_index];
        const bool has_value = arg_index + 1 < argc;
        const auto value = [&]() -> std::string { return argv[arg_index + 1]; };

        if (option == "-h" || option == "--help") {
            printUsage(argv[0]);
            exit_code = 0;
            return std::nullopt;
        }
        if (option == "-v") {
            options.verbose = true;
            arg_index += 1;
            continue;
        }
        if (!has_value) {
            printUsage(argv[0]);
            exit_code = 1;
            return std::nullopt;
        }

        if (option == "-m" || option == "--mode") {
            options.mode = value();
            if (options.mode != "cli" && options.mode != "serve") {
                throw std::runtime_error("Unknown mode: " + options.mode);
            }
        } else if (option == "-p" || option == "--port") {
            int port = 0;
            try {
                port = std::stoi(value());
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid port: " + value());
            }
            if (port <= 0 || port > 65535) {
                throw std::runtime_error("Port is out of range.");
            }
            options.port = static_cast<std::uint16_t>(port);
        } else if (option == "-c" || option == "--config") {
            options.config_path = value();
        } else if (option == "-u" || option == "--url") {
            options.url = value();
        } else if (option == "-o" || option == "--out") {
            options.output_path = value();
        } else if (option == "-t" || option == "--timeout") {
            if (!fetchkit::parseDuration(value())) {
                throw std::runtime_error("Invalid timeout: " + value());
            }
            options.timeout = value();
        } else if (option == "-k" || option == "--chunk") {
            try {
                options.chunk_size = std::stoll(value());
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid chunk size: " + value());
            }
            if (*options.chunk_size <= 0) {
                throw std::runtime_error("Chunk size must be positive.");
            }
        } else if (option == "-H") {
            auto [key, header_value] = parseHeader(value());
            options.headers.insert_or_assign(std::move(key), std::move(header_value));
        } else {
            printUsage(argv[0]);
            exit_code = 1;
            return std::nullopt;
        }
        arg_index += 2;
    }
    return options;
}

void setupLogging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("fetchkit");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

int runCli(const Options& options) {
    fetchkit::AppConfig config = fetchkit::defaultConfig();
    std::error_code ec;
    if (std::filesystem::exists(options.config_path, ec)) {
        try {
            config = fetchkit::loadConfig(options.config_path);
        } catch (const fetchkit::ConfigError& ex) {
            spdlog::warn("{}; using defaults", ex.what());
        }
    }

    if (!options.url.empty()) {
        config.url = options.url;
    }
    if (!options.output_path.empty()) {
        config.output_path = options.output_path;
    }
    if (options.timeout) {
        config.timeout = *options.timeout;
    }
    if (options.chunk_size) {
        config.chunk_size = *options.chunk_size;
    }
    for (const auto& [key, value] : options.headers) {
        config.headers.insert_or_assign(key, value);
    }

    if (config.url.empty()) {
        std::cerr << "Error: a file URL is required (-u <url>)" << std::endl;
        return 1;
    }

    const fetchkit::TransferDescriptor descriptor = fetchkit::makeDescriptor(config);
    const std::filesystem::path destination{descriptor.destination};
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: "
                 + destination.parent_path().string() + " - " + ec.message());
        }
    }

    fetchkit::CurlTransport transport;
    const fetchkit::DownloadEngine engine(transport);
    fetchkit::TaskRegistry registry;
    fetchkit::BroadcastHub hub;
    fetchkit::DownloadManager manager(engine, registry, hub);

    const std::string task_id = fetchkit::DownloadManager::makeTaskId();
    const std::string name = destination.filename().string();
    manager.addTask(task_id, name, descriptor);

    fetchkit::CancellationToken cancellation(descriptor.timeout);
    g_cancellation = &cancellation;
    std::signal(SIGINT, handleInterrupt);

    fetchkit::ConsoleProgress console(name);
    const auto result = manager.run(task_id, descriptor, cancellation, console.callback());
    console.finish();

    std::signal(SIGINT, SIG_DFL);
    g_cancellation = nullptr;

    if (!result.ok()) {
        std::cerr << "Download failed: " << result.error().describe() << std::endl;
        return 1;
    }

    std::cout << "Download complete, saved to " << descriptor.destination << std::endl;
    return 0;
}

int runServe(const Options& options) {
    fetchkit::AppConfig config;
    try {
        config = fetchkit::loadConfig(options.config_path);
    } catch (const fetchkit::ConfigError& ex) {
        spdlog::warn("{}; using default configuration", ex.what());
        config = fetchkit::defaultConfig();
        try {
            fetchkit::saveConfig(options.config_path, config);
        } catch (const fetchkit::ConfigError& save_error) {
            spdlog::warn("{}", save_error.what());
        }
    }

    fetchkit::CurlTransport transport;
    const fetchkit::DownloadEngine engine(transport);
    fetchkit::TaskRegistry registry;
    fetchkit::BroadcastHub hub;
    fetchkit::DownloadManager manager(engine, registry, hub);
    fetchkit::ActivityTracker tracker;

    std::unique_ptr<fetchkit::ObserverServer> server;
    fetchkit::ControlService control(std::move(config), options.config_path, manager, registry, [&server] {
        if (server) {
            server->requestStop();
        }
    });

    server = std::make_unique<fetchkit::ObserverServer>(
        "127.0.0.1", options.port, hub, [&control](const std::string& line) { return control.handleLine(line); },
        &tracker);
    server->start();

    fetchkit::IdleWatchdog watchdog(tracker, kIdleLimit, kIdleCheckInterval, [&server] { server->requestStop(); });
    watchdog.start();

    server->wait();
    // Give the reply to an exit command a moment to reach its client.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    watchdog.stop();
    server->stop();
    manager.cancelAll();
    manager.waitAll();
    hub.closeAll();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        int exit_code = 0;
        const auto options = parseArguments(argc, argv, exit_code);
        if (!options) {
            return exit_code;
        }

        setupLogging(options->verbose);
        fetchkit::detail::ensureCurlInitialized();

        if (options->mode == "serve") {
            return runServe(*options);
        }
        return runCli(*options);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}

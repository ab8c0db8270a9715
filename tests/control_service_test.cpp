#include "test_helpers.hpp"

#include "fetchkit/control_service.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <string>

using namespace fetchkit;
using namespace fetchkit::test;
using json = nlohmann::json;

namespace {

struct ServiceFixture {
    ServiceFixture()
        : transport(script()),
          engine(transport),
          manager(engine, registry, hub),
          config_path((dir.path() / "config.json").string()),
          service(initialConfig(), config_path, manager, registry, [this] { exit_requested = true; }) {}

    static ScriptedTransport::Script script() {
        ScriptedTransport::Script s;
        s.body = makeContent(16 * 1024);
        return s;
    }

    AppConfig initialConfig() const {
        AppConfig config = defaultConfig();
        config.output_dir = dir.path().string();
        config.timeout = "0";
        return config;
    }

    TempDir dir;
    ScriptedTransport transport;
    DownloadEngine engine;
    TaskRegistry registry;
    BroadcastHub hub;
    DownloadManager manager;
    std::string config_path;
    std::atomic<bool> exit_requested{false};
    ControlService service;
};

} // namespace

TEST_CASE_METHOD(ServiceFixture, "ControlService: download", "[control]") {
    const auto reply = service.handle({{"action", "download"}, {"url", "http://files.test/3_guide_2024.pdf"}});
    REQUIRE(reply.at("success") == true);
    CHECK(reply.at("filename") == "guide.pdf");
    CHECK(reply.at("status") == "pending");
    CHECK(reply.at("total_size") == 0);
    CHECK(reply.at("output_path") == (dir.path() / "guide.pdf").string());

    const auto task_id = reply.at("task_id").get<std::string>();
    manager.waitAll();

    const auto status = service.handle({{"action", "status"}, {"task_id", task_id}});
    REQUIRE(status.at("success") == true);
    CHECK(status.at("task").at("status") == "completed");
    CHECK(status.at("task").at("percent").get<double>() == Approx(100.0));
    CHECK(readFile(dir.path() / "guide.pdf") == makeContent(16 * 1024));

    const auto tasks = service.handle({{"action", "tasks"}});
    REQUIRE(tasks.at("success") == true);
    REQUIRE(tasks.at("tasks").size() == 1);
    CHECK(tasks.at("tasks")[0].at("task_id") == task_id);
}

TEST_CASE_METHOD(ServiceFixture, "ControlService: download without a URL", "[control]") {
    const auto reply = service.handle({{"action", "download"}});
    CHECK(reply.at("success") == false);
    CHECK(registry.size() == 0);
}

TEST_CASE_METHOD(ServiceFixture, "ControlService: unknown tasks", "[control]") {
    CHECK(service.handle({{"action", "status"}, {"task_id", "nope"}}).at("success") == false);
    CHECK(service.handle({{"action", "cancel"}, {"task_id", "nope"}}).at("success") == false);
}

TEST_CASE_METHOD(ServiceFixture, "ControlService: configuration", "[control]") {
    SECTION("Current configuration") {
        const auto reply = service.handle({{"action", "config"}});
        REQUIRE(reply.at("success") == true);
        CHECK(reply.at("config").at("output_dir") == dir.path().string());
    }

    SECTION("Save replaces and persists") {
        AppConfig updated = service.config();
        updated.url = "http://files.test/default.pdf";
        updated.chunk_size = 8192;
        const auto reply = service.handle({{"action", "save-config"}, {"config", updated}});
        REQUIRE(reply.at("success") == true);
        CHECK(service.config().url == updated.url);
        CHECK(loadConfig(config_path).chunk_size == 8192);

        // The configured URL is used when the command names none.
        const auto download = service.handle({{"action", "download"}});
        REQUIRE(download.at("success") == true);
        CHECK(download.at("filename") == "default.pdf");
        manager.waitAll();
    }

    SECTION("Save needs a config object") {
        CHECK(service.handle({{"action", "save-config"}}).at("success") == false);
        CHECK(service.handle({{"action", "save-config"}, {"config", "x"}}).at("success") == false);
    }

    SECTION("Reset restores defaults") {
        const auto reply = service.handle({{"action", "reset-config"}});
        REQUIRE(reply.at("success") == true);
        CHECK(service.config().timeout == "30s");
        CHECK(loadConfig(config_path).chunk_size == static_cast<std::int64_t>(kDefaultChunkSize));
    }
}

TEST_CASE_METHOD(ServiceFixture, "ControlService: exit", "[control]") {
    const auto reply = service.handle({{"action", "exit"}});
    CHECK(reply.at("success") == true);
    CHECK(exit_requested.load());
}

TEST_CASE_METHOD(ServiceFixture, "ControlService: malformed commands", "[control]") {
    CHECK(json::parse(service.handleLine("not json")).at("success") == false);
    CHECK(json::parse(service.handleLine("[1,2,3]")).at("success") == false);
    CHECK(json::parse(service.handleLine(R"({"action":"fly"})")).at("message") == "unknown action: fly");
    CHECK(json::parse(service.handleLine("{}")).at("message") == "missing action");
    CHECK_FALSE(exit_requested.load());
}

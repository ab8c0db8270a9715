#include "test_helpers.hpp"

#include "fetchkit/download_engine.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace fetchkit;
using namespace fetchkit::test;

namespace {

EngineOptions everyChunk() {
    EngineOptions options;
    options.sample_interval = std::chrono::milliseconds{0};
    return options;
}

TransferDescriptor descriptorFor(const TempDir& dir, std::size_t chunk_size = 64 * 1024) {
    TransferDescriptor descriptor;
    descriptor.url = "http://files.test/report.pdf";
    descriptor.destination = (dir.path() / "report.pdf").string();
    descriptor.chunk_size = chunk_size;
    descriptor.timeout = std::chrono::milliseconds{0};
    return descriptor;
}

} // namespace

TEST_CASE("DownloadEngine: fresh download", "[engine]") {
    TempDir dir;
    const std::string body = makeContent(300 * 1024);
    ScriptedTransport::Script script;
    script.body = body;
    ScriptedTransport transport(script);
    DownloadEngine engine(transport, everyChunk());

    const auto descriptor = descriptorFor(dir);
    CancellationToken token;
    SampleRecorder recorder;
    const auto result = engine.run(descriptor, token, recorder.callback());

    REQUIRE(result.ok());
    CHECK(readFile(descriptor.destination) == body);

    REQUIRE_FALSE(recorder.samples.empty());
    CHECK(recorder.samples.back().downloaded == static_cast<std::int64_t>(body.size()));
    CHECK(recorder.samples.back().total == static_cast<std::int64_t>(body.size()));
    CHECK(recorder.samples.back().percent == Approx(100.0));

    const auto requests = transport.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].headers.count("Range") == 0);
    CHECK(requests[0].url == descriptor.url);
}

TEST_CASE("DownloadEngine: request headers", "[engine][headers]") {
    TempDir dir;
    ScriptedTransport::Script script;
    script.body = makeContent(1024);
    ScriptedTransport transport(script);
    DownloadEngine engine(transport);

    auto descriptor = descriptorFor(dir);
    descriptor.headers["user-agent"] = "fetchkit-test/1.0";
    descriptor.headers["X-Token"] = "abc";
    CancellationToken token;
    REQUIRE(engine.run(descriptor, token).ok());

    const auto requests = transport.requests();
    REQUIRE(requests.size() == 1);
    const auto& headers = requests[0].headers;

    SECTION("Caller headers win over defaults, names compare case-insensitively") {
        CHECK(headers.at("User-Agent") == "fetchkit-test/1.0");
    }

    SECTION("Defaults fill the gaps") {
        CHECK(headers.at("Accept") == "*/*");
        CHECK(headers.count("Priority") == 1);
        CHECK(headers.at("X-Token") == "abc");
    }
}

TEST_CASE("DownloadEngine: resume from a partial file", "[engine][resume]") {
    constexpr std::size_t kTotal = 10'000'000;
    constexpr std::size_t kChunk = 1'000'000;
    constexpr std::size_t kExisting = 3'000'000;

    TempDir dir;
    const std::string body = makeContent(kTotal);
    ScriptedTransport::Script script;
    script.body = body;
    script.delivery_size = 256 * 1024;
    ScriptedTransport transport(script);
    DownloadEngine engine(transport, everyChunk());

    const auto descriptor = descriptorFor(dir, kChunk);
    writeFile(descriptor.destination, body.substr(0, kExisting));

    CancellationToken token;
    SampleRecorder recorder;
    const auto result = engine.run(descriptor, token, recorder.callback());

    REQUIRE(result.ok());
    CHECK(readFile(descriptor.destination) == body);

    const auto requests = transport.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].headers.at("Range") == "bytes=3000000-");

    REQUIRE_FALSE(recorder.samples.empty());
    CHECK(recorder.samples.front().downloaded > static_cast<std::int64_t>(kExisting));
    CHECK(recorder.samples.back().downloaded == static_cast<std::int64_t>(kTotal));
    CHECK(recorder.samples.back().percent == Approx(100.0));
    for (std::size_t i = 1; i < recorder.samples.size(); ++i) {
        CHECK(recorder.samples[i].downloaded >= recorder.samples[i - 1].downloaded);
    }
}

TEST_CASE("DownloadEngine: resumed file always matches the source", "[engine][resume]") {
    const std::size_t size = GENERATE(as<std::size_t>{}, 1, 1000, 65536, 200000);
    const double fraction = GENERATE(0.0, 0.25, 0.5, 0.999);
    const std::size_t chunk = GENERATE(as<std::size_t>{}, 1000, 65536);

    TempDir dir;
    const std::string body = makeContent(size);
    ScriptedTransport::Script script;
    script.body = body;
    script.delivery_size = 4096;
    ScriptedTransport transport(script);
    DownloadEngine engine(transport, everyChunk());

    const auto descriptor = descriptorFor(dir, chunk);
    const auto prefix = static_cast<std::size_t>(static_cast<double>(size) * fraction);
    if (prefix > 0) {
        writeFile(descriptor.destination, body.substr(0, prefix));
    }

    CancellationToken token;
    SampleRecorder recorder;
    const auto result = engine.run(descriptor, token, recorder.callback());

    REQUIRE(result.ok());
    CHECK(readFile(descriptor.destination) == body);
    for (const auto& sample : recorder.samples) {
        CHECK(sample.total == static_cast<std::int64_t>(size));
        CHECK(sample.downloaded >= static_cast<std::int64_t>(prefix));
        CHECK(sample.percent == Approx(100.0 * static_cast<double>(sample.downloaded) / static_cast<double>(size)));
    }
}

TEST_CASE("DownloadEngine: protocol errors", "[engine][errors]") {
    TempDir dir;
    const std::string body = makeContent(8192);
    const auto descriptor = descriptorFor(dir);
    CancellationToken token;

    SECTION("Partial response without Content-Range") {
        writeFile(descriptor.destination, body.substr(0, 100));
        ScriptedTransport::Script script;
        script.body = body;
        script.send_content_range = false;
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::ResumeUnsupported);
        CHECK(readFile(descriptor.destination) == body.substr(0, 100));
    }

    SECTION("Server ignores the range request") {
        writeFile(descriptor.destination, body.substr(0, 100));
        ScriptedTransport::Script script;
        script.body = body;
        script.honor_range = false;
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::ResumeUnsupported);
        CHECK(readFile(descriptor.destination) == body.substr(0, 100));
    }

    SECTION("Missing Content-Length on a fresh download") {
        ScriptedTransport::Script script;
        script.body = body;
        script.send_content_length = false;
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::SizeUnknown);
    }

    SECTION("Non-2xx status") {
        ScriptedTransport::Script script;
        script.body = body;
        script.status = 403;
        ScriptedTransport transport(script);
        SampleRecorder recorder;
        const auto result = DownloadEngine(transport).run(descriptor, token, recorder.callback());
        REQUIRE_FALSE(result.ok());
        CHECK(recorder.samples.empty());
        CHECK(readFile(descriptor.destination).empty());
        CHECK(result.error().code == ErrorCode::ServerError);
        CHECK(result.error().http_status == 403);
        CHECK_THAT(result.error().describe(), Catch::Contains("403"));
    }

    SECTION("Body longer than the declared size") {
        ScriptedTransport::Script script;
        script.body = body;
        script.content_length_override = 4096;
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::IOError);
        CHECK(readFile(descriptor.destination) == body.substr(0, 4096));
    }
}

TEST_CASE("DownloadEngine: interrupted streams keep what was written", "[engine][errors]") {
    TempDir dir;
    const std::string body = makeContent(64 * 1024);
    const auto descriptor = descriptorFor(dir, 1024);
    CancellationToken token;

    SECTION("Transport failure") {
        ScriptedTransport::Script script;
        script.body = body;
        script.delivery_size = 1024;
        script.fail_after = 10 * 1024;
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::IOError);
        CHECK_THAT(result.error().message, Catch::Contains("connection reset"));
        CHECK(readFile(descriptor.destination) == body.substr(0, 10 * 1024));
    }

    SECTION("Stream ends before the declared size") {
        ScriptedTransport::Script script;
        script.body = body;
        script.delivery_size = 1024;
        script.truncate_at = 20 * 1024;
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::IOError);
        CHECK(readFile(descriptor.destination) == body.substr(0, 20 * 1024));

        // The next run picks up where this one stopped.
        ScriptedTransport::Script rest;
        rest.body = body;
        ScriptedTransport second(rest);
        REQUIRE(DownloadEngine(second).run(descriptor, token).ok());
        CHECK(readFile(descriptor.destination) == body);
    }
}

TEST_CASE("DownloadEngine: cancellation", "[engine][cancel]") {
    TempDir dir;
    const std::string body = makeContent(64 * 1024);
    const auto descriptor = descriptorFor(dir, 1024);

    SECTION("Cancel mid-transfer leaves exactly the flushed bytes") {
        CancellationToken token;
        ScriptedTransport::Script script;
        script.body = body;
        script.delivery_size = 1024;
        script.before_delivery = [&token](std::size_t delivered) {
            if (delivered == 16 * 1024) {
                token.cancel();
            }
        };
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::Cancelled);
        CHECK(readFile(descriptor.destination) == body.substr(0, 16 * 1024));
    }

    SECTION("Cancel before start sends nothing") {
        CancellationToken token;
        token.cancel();
        ScriptedTransport::Script script;
        script.body = body;
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::Cancelled);
        CHECK(transport.requests().empty());
    }

    SECTION("Deadline expires during the transfer") {
        CancellationToken token(std::chrono::milliseconds{200});
        ScriptedTransport::Script script;
        script.body = body;
        script.delivery_size = 1024;
        script.before_delivery = [](std::size_t delivered) {
            if (delivered == 4096) {
                std::this_thread::sleep_for(std::chrono::milliseconds{400});
            }
        };
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::Cancelled);
        CHECK_THAT(result.error().message, Catch::Contains("timed out"));
        CHECK(readFile(descriptor.destination) == body.substr(0, 4096));
    }

    SECTION("Transport reaching the request timeout counts as timed out") {
        CancellationToken token(std::chrono::seconds{30});
        ScriptedTransport::Script script;
        script.body = body;
        script.delivery_size = 1024;
        script.time_out_after = 8 * 1024;
        ScriptedTransport transport(script);
        const auto result = DownloadEngine(transport).run(descriptor, token);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::Cancelled);
        CHECK_THAT(result.error().message, Catch::Contains("timed out"));
        CHECK(readFile(descriptor.destination) == body.substr(0, 8 * 1024));

        const auto requests = transport.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].timeout.has_value());
        CHECK(requests[0].timeout->count() > 0);
    }
}

TEST_CASE("CancellationToken: remaining time", "[engine][cancel]") {
    SECTION("No deadline") {
        CancellationToken token;
        CHECK_FALSE(token.remaining().has_value());
        CHECK_FALSE(token.deadlineExpired());
    }

    SECTION("Never reports zero before the deadline passes") {
        CancellationToken token(std::chrono::milliseconds{1});
        const auto left = token.remaining();
        REQUIRE(left.has_value());
        CHECK((token.deadlineExpired() || left->count() > 0));
    }

    SECTION("Clamped to zero once expired") {
        CancellationToken token(std::chrono::milliseconds{1});
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        CHECK(token.deadlineExpired());
        REQUIRE(token.remaining().has_value());
        CHECK(token.remaining()->count() == 0);
        CHECK(token.isCancelled());
        CHECK_FALSE(token.cancelRequested());
    }
}

TEST_CASE("DownloadEngine: invalid descriptors", "[engine][errors]") {
    TempDir dir;
    ScriptedTransport::Script script;
    script.body = makeContent(16);
    ScriptedTransport transport(script);
    DownloadEngine engine(transport);
    CancellationToken token;

    auto descriptor = descriptorFor(dir);
    SECTION("Zero chunk size") {
        descriptor.chunk_size = 0;
    }
    SECTION("Empty URL") {
        descriptor.url.clear();
    }
    SECTION("Empty destination") {
        descriptor.destination.clear();
    }

    const auto result = engine.run(descriptor, token);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
    CHECK(transport.requests().empty());
}

TEST_CASE("DownloadEngine: sampling rate", "[engine][sampler]") {
    TempDir dir;
    const std::string body = makeContent(256 * 1024);
    ScriptedTransport::Script script;
    script.body = body;
    script.delivery_size = 1024;
    ScriptedTransport transport(script);

    EngineOptions options;
    options.sample_interval = std::chrono::hours{1};
    DownloadEngine engine(transport, options);

    CancellationToken token;
    SampleRecorder recorder;
    REQUIRE(engine.run(descriptorFor(dir, 1024), token, recorder.callback()).ok());

    // Only the forced final sample fits in a one-hour tick.
    REQUIRE(recorder.samples.size() == 1);
    CHECK(recorder.samples[0].downloaded == static_cast<std::int64_t>(body.size()));
    CHECK(recorder.samples[0].percent == Approx(100.0));
}

TEST_CASE("DownloadEngine: throwing progress callback stops the transfer", "[engine][errors]") {
    TempDir dir;
    ScriptedTransport::Script script;
    script.body = makeContent(8192);
    script.delivery_size = 1024;
    ScriptedTransport transport(script);
    DownloadEngine engine(transport, everyChunk());

    CancellationToken token;
    const auto result = engine.run(descriptorFor(dir, 1024), token, [](double, std::int64_t, std::int64_t) {
        throw std::runtime_error("observer exploded");
    });
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().code == ErrorCode::IOError);
    CHECK_THAT(result.error().message, Catch::Contains("observer exploded"));
}

TEST_CASE("computePercent", "[engine]") {
    CHECK(computePercent(0, 0) == 0.0);
    CHECK(computePercent(5, -1) == 0.0);
    CHECK(computePercent(50, 200) == Approx(25.0));
    CHECK(computePercent(200, 200) == Approx(100.0));
    CHECK(computePercent(300, 200) == Approx(100.0));
}

TEST_CASE("parseContentRange", "[engine][headers]") {
    SECTION("Complete range") {
        const auto range = parseContentRange("bytes 100-199/1000");
        REQUIRE(range.has_value());
        CHECK(range->first == 100);
        CHECK(range->last == 199);
        CHECK(range->total == 1000);
    }

    SECTION("Unknown total") {
        const auto range = parseContentRange("bytes 0-99/*");
        REQUIRE(range.has_value());
        CHECK(range->total == -1);
    }

    SECTION("Malformed values") {
        CHECK_FALSE(parseContentRange("").has_value());
        CHECK_FALSE(parseContentRange("items 0-1/2").has_value());
        CHECK_FALSE(parseContentRange("bytes */1000").has_value());
        CHECK_FALSE(parseContentRange("bytes 10-5/100").has_value());
        CHECK_FALSE(parseContentRange("bytes 0-99/50").has_value());
        CHECK_FALSE(parseContentRange("bytes 0-99/abc").has_value());
    }
}

// SPDX-License-Identifier: Apache-2.0
#include <mcp/StdioTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <limits>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

auto quickConfig(std::vector<std::string> argv) -> StdioTransportConfig
{
    return StdioTransportConfig {
        .argv = std::move(argv),
        .env = {},
        .probe = StartupProbe { .window = 2'000ms, .interval = 20ms, .settle = 100ms },
        .shutdownGrace = 1'000ms,
    };
}

} // namespace

TEST_CASE("StdioTransport starts disconnected", "[transport]")
{
    auto transport = StdioTransport(quickConfig({ "cat" }));
    CHECK(!transport.isConnected());

    auto const sent = transport.send(nlohmann::json { { "test", true } });
    REQUIRE(!sent.has_value());
    CHECK(sent.error().code == ErrorCode::TransportError);

    auto const received = transport.receive(10ms);
    REQUIRE(!received.has_value());
    CHECK(received.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport rejects an empty command", "[transport]")
{
    auto transport = StdioTransport(quickConfig({}));
    auto const opened = transport.open();
    REQUIRE(!opened.has_value());
    CHECK(opened.error().code == ErrorCode::LaunchError);
}

#ifndef _WIN32
TEST_CASE("StdioTransport exchanges lines with a child process", "[transport]")
{
    auto transport = StdioTransport(quickConfig({ "cat" }));

    REQUIRE(transport.open().has_value());
    CHECK(transport.isConnected());

    REQUIRE(transport.send(nlohmann::json { { "test", "hello" } }).has_value());
    REQUIRE(transport.send(nlohmann::json { { "test", "world" } }).has_value());

    auto first = transport.receive(2'000ms);
    REQUIRE(first.has_value());
    CHECK((*first)["test"] == "hello");

    auto second = transport.receive(2'000ms);
    REQUIRE(second.has_value());
    CHECK((*second)["test"] == "world");

    transport.close();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport receive times out when the child stays silent", "[transport]")
{
    auto transport = StdioTransport(quickConfig({ "sleep", "10" }));
    REQUIRE(transport.open().has_value());

    auto const started = std::chrono::steady_clock::now();
    auto const received = transport.receive(200ms);
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(!received.has_value());
    CHECK(received.error().code == ErrorCode::TimeoutError);
    CHECK(elapsed >= 200ms);

    // A timeout leaves the child running.
    CHECK(transport.isConnected());
    CHECK(elapsed < 2'000ms);

    // A timeout does not end the session.
    CHECK(transport.isConnected());
}

TEST_CASE("StdioTransport reports a missing executable as a launch error", "[transport]")
{
    auto transport = StdioTransport(quickConfig({ "/nonexistent/command/that/does/not/exist" }));
    auto const opened = transport.open();
    REQUIRE(!opened.has_value());
    CHECK(opened.error().code == ErrorCode::LaunchError);
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport reports early exit with the child's stderr", "[transport]")
{
    auto transport = StdioTransport(quickConfig({ "sh", "-c", "echo boom >&2; exit 3" }));
    auto const opened = transport.open();
    REQUIRE(!opened.has_value());
    CHECK(opened.error().code == ErrorCode::LaunchError);
    CHECK(opened.error().message.find("exited with code 3") != std::string::npos);
    CHECK(opened.error().message.find("boom") != std::string::npos);
}

TEST_CASE("StdioTransport rejects non-JSON output", "[transport]")
{
    auto transport = StdioTransport(quickConfig({ "sh", "-c", "read line; echo not-json; sleep 5" }));
    REQUIRE(transport.open().has_value());
    REQUIRE(transport.send(nlohmann::json { { "go", true } }).has_value());

    auto const received = transport.receive(2'000ms);
    REQUIRE(!received.has_value());
    CHECK(received.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("StdioTransport detects a closed stdout", "[transport]")
{
    auto transport = StdioTransport(quickConfig({ "sh", "-c", "read line; echo bye >&2" }));
    REQUIRE(transport.open().has_value());
    REQUIRE(transport.send(nlohmann::json { { "go", true } }).has_value());

    auto const received = transport.receive(2'000ms);
    REQUIRE(!received.has_value());
    CHECK(received.error().code == ErrorCode::TransportError);
    CHECK(!transport.isConnected());
    CHECK(transport.stderrTail().find("bye") != std::string::npos);
}

TEST_CASE("StdioTransport overlays the configured environment", "[transport]")
{
    auto config = quickConfig({ "sh", "-c", "read line; printf '{\"value\":\"%s\"}\\n' \"$MCPHUB_TEST_VALUE\"; sleep 5" });
    config.env["MCPHUB_TEST_VALUE"] = "overlay";

    auto transport = StdioTransport(std::move(config));
    REQUIRE(transport.open().has_value());
    REQUIRE(transport.send(nlohmann::json { { "go", true } }).has_value());

    auto const received = transport.receive(2'000ms);
    REQUIRE(received.has_value());
    CHECK((*received)["value"] == "overlay");
}

TEST_CASE("StdioTransport looks the command up in the configured PATH", "[transport]")
{
    auto const directory = std::filesystem::temp_directory_path() / "mcphub_path_test";
    std::filesystem::create_directories(directory);
    auto const script = directory / "mcphub-path-server";
    {
        auto out = std::ofstream(script);
        out << "#!/bin/sh\nexec cat\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);

    auto config = quickConfig({ "mcphub-path-server" });
    config.env["PATH"] = std::format("{}:/usr/bin:/bin", directory.string());

    auto transport = StdioTransport(std::move(config));
    auto const opened = transport.open();
    std::filesystem::remove_all(directory);
    REQUIRE(opened.has_value());

    REQUIRE(transport.send(nlohmann::json { { "via", "path" } }).has_value());
    auto const received = transport.receive(2'000ms);
    REQUIRE(received.has_value());
    CHECK((*received)["via"] == "path");
}

TEST_CASE("StdioTransport does not fall back to the inherited PATH", "[transport]")
{
    auto config = quickConfig({ "cat" });
    config.env["PATH"] = "/nonexistent/mcphub";

    auto transport = StdioTransport(std::move(config));
    auto const opened = transport.open();
    REQUIRE(!opened.has_value());
    CHECK(opened.error().code == ErrorCode::LaunchError);
    CHECK(opened.error().message.find("/nonexistent/mcphub") != std::string::npos);
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport accepts a timeout beyond the range of poll()", "[transport]")
{
    auto transport = StdioTransport(quickConfig({ "sh", "-c", "read line; sleep 0.2; echo '{\"late\":true}'; sleep 5" }));
    REQUIRE(transport.open().has_value());
    REQUIRE(transport.send(nlohmann::json { { "go", true } }).has_value());

    auto const beyondPoll = std::chrono::milliseconds::rep { std::numeric_limits<int>::max() } + 1'000;
    auto const timeout = std::chrono::milliseconds(beyondPoll);
    auto const received = transport.receive(timeout);
    REQUIRE(received.has_value());
    CHECK((*received)["late"] == true);
}

TEST_CASE("StdioTransport kills a child that ignores SIGTERM", "[transport]")
{
    auto config = quickConfig({ "sh", "-c", "trap '' TERM; while true; do sleep 1; done" });
    config.shutdownGrace = 200ms;

    auto transport = StdioTransport(std::move(config));
    REQUIRE(transport.open().has_value());

    auto const started = std::chrono::steady_clock::now();
    transport.close();
    auto const elapsed = std::chrono::steady_clock::now() - started;

    CHECK(!transport.isConnected());
    CHECK(elapsed < 3'000ms);
}
#endif

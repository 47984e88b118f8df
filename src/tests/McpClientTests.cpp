// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpClient.hpp>

#include <catch2/catch_test_macros.hpp>

#include "MockTransport.hpp"

using namespace mcphub;
using namespace mcphub::test;

namespace
{

auto makeClient(const std::shared_ptr<MockServerState>& state, std::string name = "mock") -> McpClient
{
    return McpClient(makeServerConfig(std::move(name)), std::make_unique<MockTransport>(state));
}

auto sentIds(MockServerState& state) -> std::vector<int64_t>
{
    auto const lock = std::lock_guard(state.sentMutex);
    auto ids = std::vector<int64_t> {};
    for (const auto& message: state.sent)
    {
        if (message.contains("id"))
            ids.push_back(message["id"].get<int64_t>());
    }
    return ids;
}

} // namespace

TEST_CASE("McpClient connect performs the handshake and lists tools", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->tools.push_back(makeToolJson("echo", "Echoes text"));

    auto client = makeClient(state);
    CHECK(client.state() == ConnectionState::Disconnected);

    REQUIRE(client.connect().has_value());
    CHECK(client.isConnected());
    CHECK(client.processRunning());

    CHECK(state->sentMethods()
          == std::vector<std::string> { "initialize", "notifications/initialized", "tools/list" });

    auto const initialize = [&] {
        auto const lock = std::lock_guard(state->sentMutex);
        return state->sent.front();
    }();
    CHECK(initialize["params"]["protocolVersion"] == "2024-11-05");
    CHECK(initialize["params"]["capabilities"].contains("tools"));
    CHECK(initialize["params"]["capabilities"].contains("resources"));
    CHECK(initialize["params"]["clientInfo"]["name"] == "mcphub");

    CHECK(client.serverInfo().serverName == "mock-server");
    CHECK(client.serverInfo().serverVersion == "0.1");
    CHECK(client.serverInfo().hasTools);
    CHECK(!client.serverInfo().hasPrompts);

    REQUIRE(client.tools().size() == 1);
    auto const& tool = client.tools().front();
    CHECK(tool.name == "echo");
    CHECK(tool.description == "Echoes text");
    CHECK(tool.serverName == "mock");
    CHECK(tool.inputSchema["required"][0] == "text");
    REQUIRE(tool.parameters.size() == 1);
    CHECK(tool.parameters[0].name == "text");
    CHECK(tool.parameters[0].type == "string");
    CHECK(tool.parameters[0].description == "Input text");
    CHECK(tool.parameters[0].required);
}

TEST_CASE("McpClient connect fails with a launch error", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->failOpen = true;

    auto client = makeClient(state);
    auto const connected = client.connect();
    REQUIRE(!connected.has_value());
    CHECK(connected.error().code == ErrorCode::LaunchError);
    CHECK(client.state() == ConnectionState::Disconnected);
    CHECK(state->sentCount() == 0);
}

TEST_CASE("McpClient reports a refused initialize as a handshake error", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->failInitialize = true;

    auto client = makeClient(state, "picky");
    auto const connected = client.connect();
    REQUIRE(!connected.has_value());
    CHECK(connected.error().code == ErrorCode::HandshakeError);
    CHECK(connected.error().message.find("picky") != std::string::npos);
    CHECK(client.state() == ConnectionState::Disconnected);
}

TEST_CASE("McpClient handshake times out against a silent server", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->silentMethod = "initialize";

    auto client = makeClient(state);
    auto const connected = client.connect();
    REQUIRE(!connected.has_value());
    CHECK(connected.error().code == ErrorCode::HandshakeError);
    CHECK(connected.error().message.find("No response") != std::string::npos);
}

TEST_CASE("McpClient request ids strictly increase and match responses", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->tools.push_back(makeToolJson("echo"));

    auto client = makeClient(state);
    REQUIRE(client.connect().has_value());

    auto first = client.sendRequest("tools/list");
    auto second = client.sendRequest("ping");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->contains("tools"));
    CHECK(second->empty());

    auto const ids = sentIds(*state);
    REQUIRE(ids.size() == 4);
    for (size_t i = 1; i < ids.size(); ++i)
        CHECK(ids[i] == ids[i - 1] + 1);
}

TEST_CASE("McpClient skips notifications and stale responses", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->tools.push_back(makeToolJson("echo"));

    auto client = makeClient(state);
    REQUIRE(client.connect().has_value());

    state->injected.push_back({ { "jsonrpc", "2.0" }, { "method", "notifications/message" } });
    state->injected.push_back({ { "jsonrpc", "2.0" }, { "id", 1 }, { "result", { { "stale", true } } } });

    auto const result = client.callTool("echo", { { "text", "hi" } });
    REQUIRE(result.has_value());
    CHECK(toolResultText(*result) == R"({"text":"hi"})");
    CHECK(client.isConnected());
}

TEST_CASE("McpClient callTool unwraps results", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->tools.push_back(makeToolJson("tool"));
    auto client = makeClient(state);

    SECTION("first text item")
    {
        state->onCall = [](const nlohmann::json&) {
            return nlohmann::json {
                { "content",
                  nlohmann::json::array({ { { "type", "text" }, { "text", "first" } },
                                          { { "type", "text" }, { "text", "second" } } }) },
            };
        };
        REQUIRE(client.connect().has_value());
        auto const result = client.callTool("tool", { { "text", "x" } });
        REQUIRE(result.has_value());
        REQUIRE(std::holds_alternative<TextContent>(*result));
        CHECK(std::get<TextContent>(*result).text == "first");
    }

    SECTION("raw result without content")
    {
        state->onCall = [](const nlohmann::json&) { return nlohmann::json { { "answer", 42 } }; };
        REQUIRE(client.connect().has_value());
        auto const result = client.callTool("tool", nullptr);
        REQUIRE(result.has_value());
        REQUIRE(std::holds_alternative<StructuredContent>(*result));
        CHECK(std::get<StructuredContent>(*result).value["answer"] == 42);
    }

    SECTION("tool-reported error")
    {
        state->onCall = [](const nlohmann::json&) {
            return nlohmann::json {
                { "content", nlohmann::json::array({ { { "type", "text" }, { "text", "disk full" } } }) },
                { "isError", true },
            };
        };
        REQUIRE(client.connect().has_value());
        auto const result = client.callTool("tool", { { "text", "x" } });
        REQUIRE(result.has_value());
        CHECK(isToolError(*result));
        CHECK(toolResultText(*result) == "disk full");
    }
}

TEST_CASE("McpClient callTool sends name and arguments", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->tools.push_back(makeToolJson("echo"));
    auto client = makeClient(state);
    REQUIRE(client.connect().has_value());

    REQUIRE(client.callTool("echo", nullptr).has_value());

    auto const request = [&] {
        auto const lock = std::lock_guard(state->sentMutex);
        return state->sent.back();
    }();
    CHECK(request["method"] == "tools/call");
    CHECK(request["params"]["name"] == "echo");
    CHECK(request["params"]["arguments"] == nlohmann::json::object());
}

TEST_CASE("McpClient callTool rejects unknown tools locally", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    auto client = makeClient(state);
    REQUIRE(client.connect().has_value());
    auto const before = state->sentCount();

    auto const result = client.callTool("missing", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ToolNotFound);
    CHECK(state->sentCount() == before);
}

TEST_CASE("McpClient maps an RPC error from tools/call to an upstream error", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->tools.push_back(makeToolJson("echo"));
    auto client = makeClient(state, "srv");
    REQUIRE(client.connect().has_value());

    state->injected.push_back(
        { { "jsonrpc", "2.0" }, { "id", 3 }, { "error", { { "code", -32602 }, { "message", "Invalid params" } } } });

    auto const result = client.callTool("echo", { { "bad", true } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::UpstreamToolError);
    CHECK(result.error().message.find("'echo'") != std::string::npos);
    CHECK(result.error().message.find("'srv'") != std::string::npos);
    CHECK(client.isConnected());
}

TEST_CASE("McpClient drops to Disconnected after a failed round trip", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->tools.push_back(makeToolJson("echo"));
    auto client = makeClient(state);
    REQUIRE(client.connect().has_value());

    state->silentMethod = "tools/call";
    auto const result = client.callTool("echo", { { "text", "hi" } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(client.state() == ConnectionState::Disconnected);
    CHECK(client.processRunning());

    auto const again = client.callTool("echo", { { "text", "hi" } });
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::ServerUnavailable);
}

TEST_CASE("McpClient ping", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    auto client = makeClient(state);

    SECTION("requires a connection")
    {
        auto const pinged = client.ping();
        REQUIRE(!pinged.has_value());
        CHECK(pinged.error().code == ErrorCode::ServerUnavailable);
    }

    SECTION("updates the heartbeat")
    {
        REQUIRE(client.connect().has_value());
        CHECK(!client.lastHeartbeat().has_value());
        REQUIRE(client.ping().has_value());
        CHECK(client.lastHeartbeat().has_value());
        CHECK(state->pings.load() == 1);
    }

    SECTION("method not found still counts as alive and does not list tools")
    {
        state->pingMethodNotFound = true;
        REQUIRE(client.connect().has_value());
        auto const listed = state->toolsListCalls.load();

        REQUIRE(client.ping().has_value());
        CHECK(client.isConnected());
        CHECK(client.lastHeartbeat().has_value());
        CHECK(state->toolsListCalls.load() == listed);
    }

    SECTION("fails once the process is gone")
    {
        REQUIRE(client.connect().has_value());
        state->alive = false;

        auto const pinged = client.ping();
        REQUIRE(!pinged.has_value());
        CHECK(pinged.error().code == ErrorCode::TransportError);
        CHECK(client.state() == ConnectionState::Disconnected);
        CHECK(!client.processRunning());
    }
}

TEST_CASE("McpClient disconnect clears its tools", "[mcp]")
{
    auto state = std::make_shared<MockServerState>();
    state->tools.push_back(makeToolJson("echo"));
    auto client = makeClient(state);
    REQUIRE(client.connect().has_value());
    REQUIRE(!client.tools().empty());

    client.disconnect();
    CHECK(client.state() == ConnectionState::Disconnected);
    CHECK(client.tools().empty());
    CHECK(!client.processRunning());
}

// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>

namespace mcphub
{

namespace
{
    constexpr auto ClientName = std::string_view("mcphub");
    constexpr auto ClientVersion = std::string_view("1.1.0");

    /// @brief Decodes a `tools/call` result into a ToolResult.
    ///
    /// The first item of a `content` array is the primary value: its `text` if it has one,
    /// the item itself otherwise. Results without `content` are returned as they are.
    auto decodeToolResult(const nlohmann::json& result) -> ToolResult
    {
        auto const isError = json::getBoolOr(result, "isError", false);

        if (!result.is_object() || !result.contains("content"))
        {
            if (isError)
                return ToolError { .message = result.dump() };
            return StructuredContent { .value = result };
        }

        auto const& content = result["content"];
        if (!content.is_array())
            return isError ? ToolResult { ToolError { .message = content.dump() } }
                           : ToolResult { StructuredContent { .value = content } };

        if (content.empty())
            return isError ? ToolResult { ToolError { .message = "Tool reported an error without details" } }
                           : ToolResult { TextContent {} };

        auto const& first = content.front();
        if (first.is_object() && first.contains("text") && first["text"].is_string())
        {
            auto text = first["text"].get<std::string>();
            if (isError)
                return ToolError { .message = std::move(text) };
            return TextContent { .text = std::move(text) };
        }

        if (isError)
            return ToolError { .message = first.dump() };
        return StructuredContent { .value = first };
    }
} // namespace

McpClient::McpClient(ServerConfig config, std::unique_ptr<Transport> transport):
    _config(std::move(config)), _transport(std::move(transport))
{
}

McpClient::~McpClient()
{
    disconnect();
}

auto McpClient::connect() -> VoidResult
{
    if (_state == ConnectionState::Connected)
        return {};

    _state = ConnectionState::Starting;
    log::info("Connecting to MCP server '{}'", _config.name);

    if (auto opened = _transport->open(); !opened)
    {
        _state = ConnectionState::Disconnected;
        log::error("MCP server '{}' failed to start: {}", _config.name, opened.error().message);
        return opened;
    }

    if (auto info = initialize(); !info)
    {
        _transport->close();
        return std::unexpected(info.error());
    }

    if (auto tools = listTools(); !tools)
    {
        if (!isConnected())
        {
            _transport->close();
            return std::unexpected(tools.error());
        }
        log::warning("Failed to list tools for server '{}': {}", _config.name, tools.error().message);
    }

    return {};
}

auto McpClient::initialize() -> Result<McpServerInfo>
{
    _state = ConnectionState::Initializing;

    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities",
          nlohmann::json {
              { "tools", nlohmann::json::object() },
              { "resources", nlohmann::json::object() },
          } },
        { "clientInfo",
          nlohmann::json {
              { "name", ClientName },
              { "version", ClientVersion },
          } },
    };

    auto const handshakeError = [this](const Error& error) -> std::unexpected<Error> {
        _state = ConnectionState::Disconnected;
        log::error("Handshake with MCP server '{}' failed: {}", _config.name, error.message);
        return makeError(ErrorCode::HandshakeError,
                         std::format("Handshake with server '{}' failed: {}", _config.name, error.message));
    };

    auto result = sendRequest("initialize", std::move(params));
    if (!result)
        return handshakeError(result.error());

    if (!result->is_object())
        return handshakeError(Error { ErrorCode::ProtocolError, "initialize result is not an object" });

    auto const serverInfo = result->value("serverInfo", nlohmann::json::object());
    _serverInfo.serverName = json::getStringOr(serverInfo, "name", "unknown");
    _serverInfo.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
    _serverInfo.protocolVersion = json::getStringOr(*result, "protocolVersion", "");

    if (result->contains("capabilities") && (*result)["capabilities"].is_object())
    {
        auto const& caps = (*result)["capabilities"];
        _serverInfo.hasTools = caps.contains("tools");
        _serverInfo.hasResources = caps.contains("resources");
        _serverInfo.hasPrompts = caps.contains("prompts");
    }

    if (auto notified = sendNotification("notifications/initialized"); !notified)
        return handshakeError(notified.error());

    _state = ConnectionState::Connected;
    log::info("MCP server '{}' initialized: {} v{}",
              _config.name,
              _serverInfo.serverName,
              _serverInfo.serverVersion);

    return _serverInfo;
}

auto McpClient::listTools() -> Result<std::vector<Tool>>
{
    if (auto ready = requireConnected(); !ready)
        return std::unexpected(ready.error());

    auto result = sendRequest("tools/list");
    if (!result)
        return std::unexpected(result.error());

    auto tools = std::vector<Tool> {};

    if (result->contains("tools") && (*result)["tools"].is_array())
    {
        for (const auto& toolJson: (*result)["tools"])
        {
            auto name = json::getString(toolJson, "name");
            if (!name)
            {
                log::warning("MCP server '{}' listed a tool without a name, skipping", _config.name);
                continue;
            }

            auto inputSchema = toolJson.value("inputSchema", nlohmann::json::object());
            tools.push_back(Tool {
                .name = std::move(*name),
                .description = json::getStringOr(toolJson, "description", ""),
                .parameters = flattenParameters(inputSchema),
                .serverName = _config.name,
                .inputSchema = std::move(inputSchema),
            });
        }
    }

    _tools = tools;
    log::info("MCP server '{}' provides {} tools", _config.name, _tools.size());
    return tools;
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    if (auto ready = requireConnected(); !ready)
        return std::unexpected(ready.error());

    auto const known = std::ranges::any_of(_tools, [&](const Tool& tool) { return tool.name == name; });
    if (!known)
        return makeError(ErrorCode::ToolNotFound,
                         std::format("Tool '{}' is not provided by server '{}'", name, _config.name));

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto result = sendRequest("tools/call", std::move(params));
    if (!result)
    {
        // The session survived, so the server answered with an error for this tool.
        auto const code = isConnected() ? ErrorCode::UpstreamToolError : result.error().code;
        return makeError(
            code, std::format("Tool '{}' on server '{}' failed: {}", name, _config.name, result.error().message));
    }

    auto toolResult = decodeToolResult(*result);
    log::debug("Tool '{}' on server '{}' returned: {} (isError: {})",
               name,
               _config.name,
               toolResultText(toolResult),
               isToolError(toolResult));
    return toolResult;
}

auto McpClient::ping() -> VoidResult
{
    if (auto ready = requireConnected(); !ready)
        return ready;

    if (!_transport->isConnected())
    {
        _state = ConnectionState::Disconnected;
        return makeError(ErrorCode::TransportError,
                         std::format("Server '{}' process is no longer running", _config.name));
    }

    auto result = sendRequest("ping");
    if (!result && result.error().code != ErrorCode::MethodNotFound)
        return std::unexpected(result.error());

    _lastHeartbeat = std::chrono::system_clock::now();
    log::trace("MCP server '{}' is alive", _config.name);
    return {};
}

void McpClient::disconnect()
{
    if (_transport)
        _transport->close();

    if (_state != ConnectionState::Disconnected)
        log::info("MCP server '{}' disconnected", _config.name);

    _tools.clear();
    _state = ConnectionState::Disconnected;
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    if (_state != ConnectionState::Initializing && _state != ConnectionState::Connected)
        return makeError(ErrorCode::ServerUnavailable, std::format("Server '{}' is not connected", _config.name));

    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    if (auto sent = _transport->send(request); !sent)
        return failSession(method, sent.error());

    auto const deadline = std::chrono::steady_clock::now() + _config.timeout;

    while (true)
    {
        auto const remaining = std::max(std::chrono::milliseconds::zero(),
                                        std::chrono::duration_cast<std::chrono::milliseconds>(
                                            deadline - std::chrono::steady_clock::now()));

        auto message = _transport->receive(remaining);
        if (!message)
            return failSession(method, message.error());

        auto response = jsonrpc::parseResponse(*message);
        if (!response)
            return failSession(method, response.error());

        if (response->isServerMessage())
        {
            log::debug("MCP server '{}' sent '{}' while waiting for a response, ignoring",
                       _config.name,
                       response->method);
            continue;
        }

        // Late answers to requests that timed out earlier carry a smaller id.
        if (!response->id.is_number_integer() || response->id.get<int64_t>() != id)
        {
            log::debug("MCP server '{}': skipping response with id {} (expected {})",
                       _config.name,
                       response->id.dump(),
                       id);
            continue;
        }

        if (response->error)
            return std::unexpected(jsonrpc::toError(method, *response->error));

        return response->result.value_or(nlohmann::json::object());
    }
}

auto McpClient::sendNotification(std::string_view method, nlohmann::json params) -> VoidResult
{
    if (_state != ConnectionState::Initializing && _state != ConnectionState::Connected)
        return makeError(ErrorCode::ServerUnavailable, std::format("Server '{}' is not connected", _config.name));

    if (auto sent = _transport->send(jsonrpc::makeNotification(method, std::move(params))); !sent)
        return failSession(method, sent.error());

    return {};
}

auto McpClient::processRunning() const -> bool
{
    return _transport && _transport->isConnected();
}

auto McpClient::requireConnected() const -> VoidResult
{
    if (_state != ConnectionState::Connected)
        return makeError(ErrorCode::ServerUnavailable, std::format("Server '{}' is not connected", _config.name));
    return {};
}

auto McpClient::failSession(std::string_view method, const Error& error) -> std::unexpected<Error>
{
    _state = ConnectionState::Disconnected;
    log::warning("MCP server '{}': '{}' failed: {}", _config.name, method, error.message);
    return std::unexpected(error);
}

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Logical state of an MCP session.
enum class ConnectionState
{
    Disconnected,
    Starting,
    Initializing,
    Connected,
};

/// @brief Returns the display name of a connection state.
[[nodiscard]] constexpr auto connectionStateName(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Starting: return "starting";
        case ConnectionState::Initializing: return "initializing";
        case ConnectionState::Connected: return "connected";
    }
    return "unknown";
}

/// @brief Identity and capabilities a server reports in its initialize result.
struct McpServerInfo
{
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
};

/// @brief Client for one MCP server session.
///
/// Owns the transport (and through it the server process) and handles the MCP lifecycle:
/// connect, initialize, list tools, call tools, ping, disconnect.
///
/// @note Not thread-safe. Exactly one request may be in flight at a time, because responses
/// are read in order from a single stream. Callers must serialize every call on one instance.
///
/// Any request that does not complete its round trip (write failure, timeout, closed stream,
/// malformed message) moves the client to Disconnected; it then needs a fresh connect().
/// A well-formed JSON-RPC error response leaves the session Connected.
class McpClient
{
  public:
    /// @brief Version string sent as `protocolVersion` in the initialize request.
    static constexpr auto ProtocolVersion = std::string_view("2024-11-05");

    /// @brief Constructs an McpClient for one server.
    /// @param config The server descriptor; its timeout bounds every request.
    /// @param transport The transport to use for communication.
    McpClient(ServerConfig config, std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Opens the transport, performs the handshake and fetches the tool list.
    /// @return Success, or the LaunchError/HandshakeError/... that stopped the connection.
    [[nodiscard]] auto connect() -> VoidResult;

    /// @brief Performs the MCP initialize handshake (request plus initialized notification).
    /// @return The server's identity and capabilities, or a HandshakeError.
    [[nodiscard]] auto initialize() -> Result<McpServerInfo>;

    /// @brief Fetches the server's tools, replacing the previously known set.
    /// @return The tools or an error.
    [[nodiscard]] auto listTools() -> Result<std::vector<Tool>>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name as the server knows it.
    /// @param arguments The tool arguments.
    /// @return The decoded tool result or an error naming tool and server.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>;

    /// @brief Side-effect-free liveness probe.
    ///
    /// Sends `ping`. A server that answers "method not found" has still completed a round
    /// trip and counts as alive. Updates lastHeartbeat() on success.
    [[nodiscard]] auto ping() -> VoidResult;

    /// @brief Stops the server process and forgets all tools. Safe to call more than once.
    void disconnect();

    /// @brief Sends one request and waits for its response, bounded by the server timeout.
    /// @param method The method name.
    /// @param params The request parameters.
    /// @return The `result` member of the response, or an error.
    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params = nlohmann::json::object())
        -> Result<nlohmann::json>;

    /// @brief Sends a notification; no response is awaited.
    [[nodiscard]] auto sendNotification(std::string_view method, nlohmann::json params = nullptr)
        -> VoidResult;

    [[nodiscard]] auto state() const -> ConnectionState { return _state; }
    [[nodiscard]] auto isConnected() const -> bool { return _state == ConnectionState::Connected; }

    /// @brief Returns true if the server process (or peer) is still running.
    [[nodiscard]] auto processRunning() const -> bool;

    [[nodiscard]] auto config() const -> const ServerConfig& { return _config; }
    [[nodiscard]] auto serverInfo() const -> const McpServerInfo& { return _serverInfo; }
    [[nodiscard]] auto tools() const -> const std::vector<Tool>& { return _tools; }

    /// @brief Time of the last successful ping, if any.
    [[nodiscard]] auto lastHeartbeat() const -> std::optional<std::chrono::system_clock::time_point>
    {
        return _lastHeartbeat;
    }

  private:
    ServerConfig _config;
    std::unique_ptr<Transport> _transport;
    McpServerInfo _serverInfo;
    std::vector<Tool> _tools;
    int64_t _nextId = 1;
    ConnectionState _state = ConnectionState::Disconnected;
    std::optional<std::chrono::system_clock::time_point> _lastHeartbeat;

    [[nodiscard]] auto requireConnected() const -> VoidResult;
    [[nodiscard]] auto failSession(std::string_view method, const Error& error) -> std::unexpected<Error>;
};

} // namespace mcphub

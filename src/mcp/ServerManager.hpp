// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/StdioTransport.hpp>
#include <mcp/ToolDispatcher.hpp>
#include <mcp/ToolRegistry.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace mcphub
{

/// @brief Tunables of a ServerManager.
struct ManagerConfig
{
    std::chrono::milliseconds healthCheckInterval { 30'000 };

    /// @brief Upper bound on concurrent connection attempts in connectAll().
    size_t maxConnectWorkers = 5;

    StartupProbe startupProbe;
    std::chrono::milliseconds shutdownGrace { 5'000 };
};

/// @brief Observable state of one configured server.
struct ServerStatus
{
    std::string name;
    std::string description;
    bool enabled = true;
    bool connected = false;
    std::optional<std::chrono::system_clock::time_point> lastCheck;
    std::string error; // last recorded failure, empty if none
    size_t toolsCount = 0;
    bool processRunning = false;
    std::optional<std::chrono::system_clock::time_point> lastHeartbeat;
};

/// @brief Aggregate figures over all configured servers.
struct Statistics
{
    size_t totalServers = 0;
    size_t connectedServers = 0;
    size_t totalTools = 0;
    std::map<std::string, size_t> toolsByServer;
    bool healthCheckRunning = false;
};

[[nodiscard]] auto toJson(const ServerStatus& status) -> nlohmann::json;
[[nodiscard]] auto toJson(const Statistics& statistics) -> nlohmann::json;

/// @brief Creates a fresh, unconnected client for a server. Called on every (re)connect.
using ClientFactory = std::function<std::unique_ptr<McpClient>(const ServerConfig&)>;

/// @brief Returns the factory that spawns servers as child processes speaking over stdio.
[[nodiscard]] auto makeStdioClientFactory(const ManagerConfig& config) -> ClientFactory;

/// @brief Manages multiple MCP server connections and routes tool calls.
///
/// Owns one McpClient per connected server, merges their tools into one ToolRegistry, and
/// supervises the connections with a background health check.
///
/// Locking: every server has its own session mutex that serializes connect, disconnect and
/// all requests on its client, so a manual and an automatic reconnect can never race and
/// the client never sees concurrent requests. The registry and the status records are
/// guarded by one state mutex. A session mutex is always acquired before the state mutex.
class ServerManager: public ToolDispatcher
{
  public:
    /// @brief Constructs a ServerManager.
    /// @param servers The validated server descriptors, in connection-priority order.
    /// @param config Manager tunables.
    /// @param factory Client factory; defaults to makeStdioClientFactory(config).
    explicit ServerManager(std::vector<ServerConfig> servers = {},
                           ManagerConfig config = {},
                           ClientFactory factory = {});
    ~ServerManager() override;

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Adds a server descriptor (not connected yet).
    /// @return Success, or a ConfigError for invalid or duplicate descriptors.
    [[nodiscard]] auto addServer(ServerConfig config) -> VoidResult;

    /// @brief Disconnects a server and forgets its descriptor, tools and status.
    [[nodiscard]] auto removeServer(std::string_view name) -> VoidResult;

    /// @brief Connects every enabled server concurrently.
    ///
    /// Failures are recorded in the server's status and never abort the other attempts.
    /// Tools are merged into the registry after all attempts finished, in configuration order.
    /// @return Exactly one entry per enabled server: true if it is connected.
    [[nodiscard]] auto connectAll() -> std::map<std::string, bool>;

    /// @brief (Re)connects one server, replacing any existing session.
    [[nodiscard]] auto connectServer(std::string_view name) -> VoidResult;

    /// @brief Stops every server and clears the registry and all connected flags.
    void disconnectAll();

    /// @brief Re-fetches the tool lists of all connected servers without reconnecting.
    void refreshTools();

    [[nodiscard]] auto allTools() const -> std::vector<ToolDescriptor> override;
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments)
        -> Result<ToolResult> override;
    [[nodiscard]] auto isMcpTool(std::string_view name) const -> bool override;

    [[nodiscard]] auto findTool(std::string_view name) const -> std::optional<RegisteredTool>;
    [[nodiscard]] auto toolsByServer(std::string_view serverName) const -> std::vector<RegisteredTool>;

    /// @brief Returns the names of all connected servers, in configuration order.
    [[nodiscard]] auto availableServers() const -> std::vector<std::string>;

    /// @brief Returns the status of every configured server, in configuration order.
    [[nodiscard]] auto serverStatus() const -> std::vector<ServerStatus>;

    [[nodiscard]] auto statistics() const -> Statistics;

    /// @brief Returns the number of configured servers.
    [[nodiscard]] auto serverCount() const -> size_t;

    /// @brief Starts the background health check. Does nothing if it is already running.
    void startHealthCheck();

    /// @brief Stops the background health check and waits for it. Does nothing if not running.
    void stopHealthCheck();

    [[nodiscard]] auto isHealthCheckRunning() const -> bool;

    /// @brief Runs one health-check pass synchronously.
    ///
    /// Pings every supervised server. A failed probe disconnects the server; servers with
    /// `autoRestart` are reconnected right away.
    void performHealthCheck();

  private:
    struct ServerSlot;

    ManagerConfig _config;
    ClientFactory _factory;

    mutable std::mutex _mutex;
    std::vector<std::shared_ptr<ServerSlot>> _slots;
    ToolRegistry _registry;

    std::mutex _healthControlMutex;
    std::mutex _healthWaitMutex;
    std::condition_variable_any _healthWake;
    std::jthread _healthThread;
    std::atomic<bool> _healthRunning = false;

    [[nodiscard]] auto findSlot(std::string_view name) const -> std::shared_ptr<ServerSlot>;
    [[nodiscard]] auto snapshotSlots() const -> std::vector<std::shared_ptr<ServerSlot>>;

    [[nodiscard]] auto connectSlot(ServerSlot& slot, bool merge) -> VoidResult;
    [[nodiscard]] auto mergeTools(ServerSlot& slot) -> bool;
    void teardownSlot(ServerSlot& slot, std::string error);
    void healthCheckLoop(const std::stop_token& stopToken);
};

} // namespace mcphub

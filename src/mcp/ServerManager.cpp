// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace mcphub
{

struct ServerManager::ServerSlot
{
    explicit ServerSlot(ServerConfig c): config(std::move(c))
    {
        status.name = config.name;
        status.description = config.description;
        status.enabled = config.enabled;
    }

    const ServerConfig config;

    // Guards client, supervised and removed.
    std::mutex sessionMutex;
    std::unique_ptr<McpClient> client;

    // Set once a connection succeeded; cleared by an explicit disconnect.
    // The health check only looks after supervised servers.
    bool supervised = false;

    // Set by removeServer. A removed slot may still be held by a concurrent connect.
    bool removed = false;

    // Guarded by ServerManager::_mutex.
    ServerStatus status;
};

namespace
{
    auto formatTimestamp(std::optional<std::chrono::system_clock::time_point> timePoint) -> nlohmann::json
    {
        if (!timePoint)
            return nullptr;
        return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(*timePoint));
    }
} // namespace

auto toJson(const ServerStatus& status) -> nlohmann::json
{
    return nlohmann::json {
        { "name", status.name },
        { "description", status.description },
        { "enabled", status.enabled },
        { "connected", status.connected },
        { "last_check", formatTimestamp(status.lastCheck) },
        { "error", status.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(status.error) },
        { "tools_count", status.toolsCount },
        { "process_running", status.processRunning },
        { "last_heartbeat", formatTimestamp(status.lastHeartbeat) },
    };
}

auto toJson(const Statistics& statistics) -> nlohmann::json
{
    return nlohmann::json {
        { "total_servers", statistics.totalServers },
        { "connected_servers", statistics.connectedServers },
        { "total_tools", statistics.totalTools },
        { "tools_by_server", statistics.toolsByServer },
        { "health_check_running", statistics.healthCheckRunning },
    };
}

auto makeStdioClientFactory(const ManagerConfig& config) -> ClientFactory
{
    return [probe = config.startupProbe, grace = config.shutdownGrace](const ServerConfig& server) {
        auto transport = std::make_unique<StdioTransport>(StdioTransportConfig {
            .argv = server.argv(),
            .env = server.env,
            .probe = probe,
            .shutdownGrace = grace,
        });
        return std::make_unique<McpClient>(server, std::move(transport));
    };
}

ServerManager::ServerManager(std::vector<ServerConfig> servers, ManagerConfig config, ClientFactory factory):
    _config(config), _factory(factory ? std::move(factory) : makeStdioClientFactory(config))
{
    for (auto& server: servers)
    {
        if (auto added = addServer(std::move(server)); !added)
            log::warning("Ignoring MCP server: {}", added.error().message);
    }
}

ServerManager::~ServerManager()
{
    stopHealthCheck();
    disconnectAll();
}

auto ServerManager::addServer(ServerConfig config) -> VoidResult
{
    if (auto valid = config.validate(); !valid)
        return valid;

    auto const lock = std::lock_guard(_mutex);
    auto const duplicate = std::ranges::any_of(
        _slots, [&](const std::shared_ptr<ServerSlot>& slot) { return slot->config.name == config.name; });
    if (duplicate)
        return makeError(ErrorCode::ConfigError, std::format("MCP server '{}' is already configured", config.name));

    log::debug("MCP server '{}' added", config.name);
    _slots.push_back(std::make_shared<ServerSlot>(std::move(config)));
    return {};
}

auto ServerManager::removeServer(std::string_view name) -> VoidResult
{
    auto slot = findSlot(name);
    if (!slot)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown MCP server: {}", name));

    auto const session = std::lock_guard(slot->sessionMutex);
    if (slot->client)
    {
        slot->client->disconnect();
        slot->client.reset();
    }
    slot->supervised = false;
    slot->removed = true;

    auto const lock = std::lock_guard(_mutex);
    _registry.removeServerTools(slot->config.name);
    std::erase(_slots, slot);
    log::info("MCP server '{}' removed", name);
    return {};
}

auto ServerManager::connectAll() -> std::map<std::string, bool>
{
    auto targets = snapshotSlots();
    std::erase_if(targets, [](const std::shared_ptr<ServerSlot>& slot) { return !slot->config.enabled; });

    auto results = std::map<std::string, bool> {};
    if (targets.empty())
        return results;

    auto resultsMutex = std::mutex {};
    auto next = std::atomic<size_t> { 0 };
    auto const workerCount = std::min(std::max<size_t>(1, _config.maxConnectWorkers), targets.size());

    log::info("Connecting to {} MCP servers with {} workers", targets.size(), workerCount);

    {
        auto workers = std::vector<std::jthread> {};
        workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i)
        {
            workers.emplace_back([&] {
                for (auto index = next++; index < targets.size(); index = next++)
                {
                    auto& slot = *targets[index];
                    auto connected = false;
                    {
                        auto const session = std::lock_guard(slot.sessionMutex);
                        connected = connectSlot(slot, false).has_value();
                    }
                    auto const lock = std::lock_guard(resultsMutex);
                    results[slot.config.name] = connected;
                }
            });
        }
    }

    // Merging after the join keeps collision resolution independent of completion order.
    for (const auto& slot: targets)
    {
        if (!mergeTools(*slot))
            results.erase(slot->config.name);
    }

    auto const connected = std::ranges::count_if(results, [](const auto& entry) { return entry.second; });
    log::info("Connected to {}/{} MCP servers", connected, results.size());
    return results;
}

auto ServerManager::connectServer(std::string_view name) -> VoidResult
{
    auto slot = findSlot(name);
    if (!slot)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown MCP server: {}", name));
    if (!slot->config.enabled)
        return makeError(ErrorCode::ConfigError, std::format("MCP server '{}' is disabled", name));

    auto const session = std::lock_guard(slot->sessionMutex);
    return connectSlot(*slot, true);
}

void ServerManager::disconnectAll()
{
    for (const auto& slot: snapshotSlots())
    {
        auto const session = std::lock_guard(slot->sessionMutex);
        if (slot->client)
        {
            slot->client->disconnect();
            slot->client.reset();
        }
        slot->supervised = false;
    }

    auto const lock = std::lock_guard(_mutex);
    _registry.clear();
    for (const auto& slot: _slots)
    {
        slot->status.connected = false;
        slot->status.processRunning = false;
        slot->status.toolsCount = 0;
    }
}

void ServerManager::refreshTools()
{
    for (const auto& slot: snapshotSlots())
    {
        auto const session = std::lock_guard(slot->sessionMutex);
        if (!slot->client || !slot->client->isConnected())
            continue;

        auto tools = slot->client->listTools();
        auto const lock = std::lock_guard(_mutex);
        if (tools)
        {
            _registry.replaceServerTools(slot->config.name, *tools);
            slot->status.toolsCount = tools->size();
            continue;
        }

        log::warning("Failed to refresh tools of MCP server '{}': {}", slot->config.name, tools.error().message);
        if (!slot->client->isConnected())
        {
            // Left to the health check to tear down and restart.
            _registry.removeServerTools(slot->config.name);
            slot->status.connected = false;
            slot->status.toolsCount = 0;
            slot->status.error = tools.error().message;
        }
    }
}

auto ServerManager::allTools() const -> std::vector<ToolDescriptor>
{
    auto const lock = std::lock_guard(_mutex);

    auto result = std::vector<ToolDescriptor> {};
    result.reserve(_registry.size());
    for (const auto& entry: _registry.entries())
    {
        result.push_back(ToolDescriptor {
            .name = entry.name,
            .description = std::format("[MCP:{}] {}", entry.tool.serverName, entry.tool.description),
            .parameters = entry.tool.parameters,
            .serverName = entry.tool.serverName,
            .isMcpTool = true,
        });
    }
    return result;
}

auto ServerManager::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    auto slot = std::shared_ptr<ServerSlot> {};
    auto remoteName = std::string {};
    {
        auto const lock = std::lock_guard(_mutex);
        auto const* entry = _registry.find(name);
        if (!entry)
            return makeError(ErrorCode::ToolNotFound, std::format("Unknown MCP tool: {}", name));

        remoteName = entry->tool.name;
        auto const it = std::ranges::find_if(
            _slots, [&](const auto& candidate) { return candidate->config.name == entry->tool.serverName; });
        if (it == _slots.end())
            return makeError(ErrorCode::ToolNotFound, std::format("Unknown MCP tool: {}", name));
        slot = *it;
    }

    auto const session = std::lock_guard(slot->sessionMutex);
    if (!slot->client || !slot->client->isConnected())
        return makeError(ErrorCode::ServerUnavailable,
                         std::format("MCP server '{}' for tool '{}' is not connected", slot->config.name, name));

    log::debug("Calling tool '{}' on MCP server '{}'", remoteName, slot->config.name);
    return slot->client->callTool(remoteName, arguments);
}

auto ServerManager::isMcpTool(std::string_view name) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _registry.contains(name);
}

auto ServerManager::findTool(std::string_view name) const -> std::optional<RegisteredTool>
{
    auto const lock = std::lock_guard(_mutex);
    if (auto const* entry = _registry.find(name))
        return *entry;
    return std::nullopt;
}

auto ServerManager::toolsByServer(std::string_view serverName) const -> std::vector<RegisteredTool>
{
    auto const lock = std::lock_guard(_mutex);
    return _registry.toolsOf(serverName);
}

auto ServerManager::availableServers() const -> std::vector<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    auto names = std::vector<std::string> {};
    for (const auto& slot: _slots)
    {
        if (slot->status.connected)
            names.push_back(slot->config.name);
    }
    return names;
}

auto ServerManager::serverStatus() const -> std::vector<ServerStatus>
{
    auto result = std::vector<ServerStatus> {};
    for (const auto& slot: snapshotSlots())
    {
        auto status = ServerStatus {};
        {
            auto const lock = std::lock_guard(_mutex);
            status = slot->status;
        }

        // A session busy with a long call is reported from its last recorded state.
        auto session = std::unique_lock(slot->sessionMutex, std::try_to_lock);
        if (session.owns_lock())
        {
            status.processRunning = slot->client && slot->client->processRunning();
            status.lastHeartbeat = slot->client ? slot->client->lastHeartbeat() : status.lastHeartbeat;
        }
        else
        {
            status.processRunning = status.connected;
        }
        result.push_back(std::move(status));
    }
    return result;
}

auto ServerManager::statistics() const -> Statistics
{
    auto const lock = std::lock_guard(_mutex);
    return Statistics {
        .totalServers = _slots.size(),
        .connectedServers = static_cast<size_t>(std::ranges::count_if(
            _slots, [](const std::shared_ptr<ServerSlot>& slot) { return slot->status.connected; })),
        .totalTools = _registry.size(),
        .toolsByServer = _registry.countByServer(),
        .healthCheckRunning = _healthRunning.load(),
    };
}

auto ServerManager::serverCount() const -> size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _slots.size();
}

void ServerManager::startHealthCheck()
{
    auto const lock = std::lock_guard(_healthControlMutex);
    if (_healthThread.joinable())
        return;

    _healthRunning = true;
    _healthThread = std::jthread([this](std::stop_token stopToken) { healthCheckLoop(stopToken); });
    log::info("Health check started (interval {} ms)", _config.healthCheckInterval.count());
}

void ServerManager::stopHealthCheck()
{
    auto const lock = std::lock_guard(_healthControlMutex);
    if (!_healthThread.joinable())
        return;

    _healthThread.request_stop();
    _healthThread.join();
    _healthThread = std::jthread {};
    _healthRunning = false;
    log::info("Health check stopped");
}

auto ServerManager::isHealthCheckRunning() const -> bool
{
    return _healthRunning.load();
}

void ServerManager::performHealthCheck()
{
    for (const auto& slot: snapshotSlots())
    {
        auto const session = std::lock_guard(slot->sessionMutex);
        if (!slot->supervised)
            continue;

        auto const& name = slot->config.name;

        if (slot->client)
        {
            auto probe = slot->client->ping();
            auto const now = std::chrono::system_clock::now();
            if (probe)
            {
                auto const lock = std::lock_guard(_mutex);
                slot->status.connected = true;
                slot->status.error.clear();
                slot->status.lastCheck = now;
                slot->status.lastHeartbeat = slot->client->lastHeartbeat();
                continue;
            }

            log::warning("Health check failed for MCP server '{}': {}", name, probe.error().message);
            teardownSlot(*slot, std::format("Ping failed: {}", probe.error().message));
        }

        if (!slot->config.autoRestart)
            continue;

        log::info("Restarting MCP server '{}'", name);
        if (auto restarted = connectSlot(*slot, true); !restarted)
            log::error("Failed to restart MCP server '{}': {}", name, restarted.error().message);
        else
            log::info("MCP server '{}' restarted", name);
    }
}

auto ServerManager::findSlot(std::string_view name) const -> std::shared_ptr<ServerSlot>
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find_if(
        _slots, [&](const std::shared_ptr<ServerSlot>& slot) { return slot->config.name == name; });
    return it != _slots.end() ? *it : nullptr;
}

auto ServerManager::snapshotSlots() const -> std::vector<std::shared_ptr<ServerSlot>>
{
    auto const lock = std::lock_guard(_mutex);
    return _slots;
}

// Requires slot.sessionMutex.
auto ServerManager::connectSlot(ServerSlot& slot, bool merge) -> VoidResult
{
    if (slot.removed)
        return makeError(ErrorCode::InvalidArgument, std::format("MCP server '{}' was removed", slot.config.name));

    if (slot.client)
    {
        slot.client->disconnect();
        slot.client.reset();
        auto const lock = std::lock_guard(_mutex);
        _registry.removeServerTools(slot.config.name);
    }

    auto client = _factory(slot.config);
    auto connected = client->connect();
    auto const now = std::chrono::system_clock::now();

    if (!connected)
    {
        auto const lock = std::lock_guard(_mutex);
        slot.status.connected = false;
        slot.status.processRunning = false;
        slot.status.toolsCount = 0;
        slot.status.error = connected.error().message;
        slot.status.lastCheck = now;
        return connected;
    }

    slot.client = std::move(client);
    slot.supervised = true;

    {
        auto const lock = std::lock_guard(_mutex);
        slot.status.connected = true;
        slot.status.processRunning = true;
        slot.status.error.clear();
        slot.status.lastCheck = now;
        slot.status.toolsCount = slot.client->tools().size();
        if (merge)
            _registry.replaceServerTools(slot.config.name, slot.client->tools());
    }

    log::info("MCP server '{}' connected with {} tools", slot.config.name, slot.client->tools().size());
    return {};
}

// Returns false if the server was removed in the meantime.
auto ServerManager::mergeTools(ServerSlot& slot) -> bool
{
    auto const session = std::lock_guard(slot.sessionMutex);
    if (slot.removed)
        return false;
    if (!slot.client || !slot.client->isConnected())
        return true;

    auto const lock = std::lock_guard(_mutex);
    _registry.replaceServerTools(slot.config.name, slot.client->tools());
    return true;
}

// Requires slot.sessionMutex.
void ServerManager::teardownSlot(ServerSlot& slot, std::string error)
{
    if (slot.client)
    {
        slot.client->disconnect();
        slot.client.reset();
    }

    auto const lock = std::lock_guard(_mutex);
    _registry.removeServerTools(slot.config.name);
    slot.status.connected = false;
    slot.status.processRunning = false;
    slot.status.toolsCount = 0;
    slot.status.error = std::move(error);
    slot.status.lastCheck = std::chrono::system_clock::now();
}

void ServerManager::healthCheckLoop(const std::stop_token& stopToken)
{
    while (!stopToken.stop_requested())
    {
        performHealthCheck();

        auto lock = std::unique_lock(_healthWaitMutex);
        _healthWake.wait_for(lock, stopToken, _config.healthCheckInterval, [] { return false; });
    }
}

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <set>
#include <sstream>

namespace mcphub
{

namespace
{
    auto positiveInt(const nlohmann::json& root, std::string_view key, int defaultValue) -> Result<int>
    {
        auto const keyStr = std::string(key);
        if (!root.contains(keyStr))
            return defaultValue;

        auto const& value = root[keyStr];
        if (!value.is_number_integer() || value.get<int>() <= 0)
            return makeError(ErrorCode::ConfigError, std::format("'{}' must be a positive integer", key));
        return value.get<int>();
    }

    auto parseServers(const nlohmann::json& servers) -> Result<std::vector<ServerConfig>>
    {
        auto result = std::vector<ServerConfig> {};

        if (servers.is_array())
        {
            for (const auto& descriptor: servers)
            {
                auto server = ServerConfig::fromJson("", descriptor);
                if (!server)
                    return std::unexpected(server.error());
                result.push_back(std::move(*server));
            }
        }
        else if (servers.is_object())
        {
            for (const auto& [name, descriptor]: servers.items())
            {
                auto server = ServerConfig::fromJson(name, descriptor);
                if (!server)
                    return std::unexpected(server.error());
                result.push_back(std::move(*server));
            }
        }
        else
        {
            return makeError(ErrorCode::ConfigError, "'mcpServers' must be an array or an object");
        }

        auto names = std::set<std::string> {};
        for (const auto& server: result)
        {
            if (!names.insert(server.name).second)
                return makeError(ErrorCode::ConfigError,
                                 std::format("MCP server '{}' is configured more than once", server.name));
        }

        return result;
    }
} // namespace

auto parseConfig(std::string_view content) -> Result<HubConfig>
{
    auto parsed = json::parse(content);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& root = *parsed;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto config = HubConfig {};

    if (root.contains("mcpServers"))
    {
        auto servers = parseServers(root["mcpServers"]);
        if (!servers)
            return std::unexpected(servers.error());
        config.servers = std::move(*servers);
    }

    auto const interval = positiveInt(root, "healthCheckInterval", 30);
    if (!interval)
        return std::unexpected(interval.error());
    config.manager.healthCheckInterval = std::chrono::seconds(*interval);

    auto const workers = positiveInt(root, "maxConnectWorkers", 5);
    if (!workers)
        return std::unexpected(workers.error());
    config.manager.maxConnectWorkers = static_cast<size_t>(*workers);

    if (root.contains("logLevel"))
    {
        auto const name = json::getString(root, "logLevel");
        auto const level = name ? log::parseLevel(*name) : std::nullopt;
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Invalid 'logLevel': {}", root["logLevel"].dump()));
        config.logLevel = level;
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<HubConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(config.error().code, std::format("{}: {}", path, config.error().message));

    log::debug("Loaded {} MCP server descriptors from {}", config->servers.size(), path);
    return config;
}

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#include "ServerConfig.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcphub
{

namespace
{
    auto configError(std::string_view server, std::string_view detail) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigError, std::format("MCP server '{}': {}", server, detail));
    }
} // namespace

auto ServerConfig::argv() const -> std::vector<std::string>
{
    auto result = command;
    result.insert(result.end(), args.begin(), args.end());
    return result;
}

auto ServerConfig::validate() const -> VoidResult
{
    if (name.empty())
        return makeError(ErrorCode::ConfigError, "MCP server descriptor has an empty name");
    if (command.empty() || command.front().empty())
        return configError(name, "missing command");
    if (timeout.count() <= 0)
        return configError(name, std::format("timeout must be positive, got {}s", timeout.count()));
    for (const auto& [key, value]: env)
    {
        if (key.empty() || key.find('=') != std::string::npos)
            return configError(name, std::format("invalid environment variable name '{}'", key));
    }
    return {};
}

auto ServerConfig::fromJson(std::string_view name, const nlohmann::json& descriptor) -> Result<ServerConfig>
{
    auto serverName = name.empty() ? json::getStringOr(descriptor, "name", "") : std::string(name);

    if (!descriptor.is_object())
        return configError(serverName, "descriptor must be a JSON object");

    auto config = ServerConfig {
        .name = serverName,
        .description = json::getStringOr(descriptor, "description", ""),
    };

    if (descriptor.contains("command"))
    {
        auto const& command = descriptor["command"];
        if (command.is_string())
        {
            config.command.push_back(command.get<std::string>());
        }
        else
        {
            auto list = json::getStringList(descriptor, "command");
            if (!list)
                return configError(serverName, list.error().message);
            config.command = std::move(*list);
        }
    }

    auto args = json::getStringList(descriptor, "args");
    if (!args)
        return configError(serverName, args.error().message);
    config.args = std::move(*args);

    auto env = json::getStringMap(descriptor, "env");
    if (!env)
        return configError(serverName, env.error().message);
    config.env = std::move(*env);

    if (descriptor.contains("timeout") && !descriptor["timeout"].is_number_integer())
        return configError(serverName, "timeout must be an integer number of seconds");
    config.timeout = std::chrono::seconds(json::getIntOr(descriptor, "timeout", 30));

    for (auto const* flag: { "autoRestart", "enabled" })
    {
        if (descriptor.contains(flag) && !descriptor[flag].is_boolean())
            return configError(serverName, std::format("'{}' must be a boolean", flag));
    }
    config.autoRestart = json::getBoolOr(descriptor, "autoRestart", true);
    config.enabled = json::getBoolOr(descriptor, "enabled", true);

    if (auto valid = config.validate(); !valid)
        return std::unexpected(valid.error());

    return config;
}

} // namespace mcphub

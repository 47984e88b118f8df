// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Description of one external MCP tool server.
///
/// Instances are created once from validated configuration and never mutated afterwards.
struct ServerConfig
{
    /// @brief Unique key of the server within a ServerManager.
    std::string name;

    /// @brief Executable followed by any fixed leading arguments.
    std::vector<std::string> command;

    std::vector<std::string> args;

    /// @brief Variables overlaid on the inherited process environment.
    /// A PATH given here is also used to find the command.
    std::map<std::string, std::string> env;

    /// @brief Per-request response timeout.
    std::chrono::seconds timeout { 30 };

    /// @brief Whether the health check reconnects this server after a failed probe.
    bool autoRestart = true;

    std::string description;
    bool enabled = true;

    /// @brief Returns the full argv of the server process (command followed by args).
    [[nodiscard]] auto argv() const -> std::vector<std::string>;

    /// @brief Checks the descriptor for structural problems.
    /// @return Success or a ConfigError naming the offending field.
    [[nodiscard]] auto validate() const -> VoidResult;

    /// @brief Builds a validated descriptor from its JSON form.
    ///
    /// Accepted fields: `command` (string or array of strings), `args`, `env`, `timeout`
    /// (positive seconds), `description`, `autoRestart`, `enabled`. If @p name is empty,
    /// the descriptor's own `name` field is used.
    /// @param name The server name.
    /// @param descriptor The JSON descriptor object.
    /// @return The descriptor or a ConfigError.
    [[nodiscard]] static auto fromJson(std::string_view name, const nlohmann::json& descriptor)
        -> Result<ServerConfig>;
};

} // namespace mcphub

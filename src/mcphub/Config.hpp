// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/ServerManager.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Configuration of the mcphub command-line front-end.
struct HubConfig
{
    /// @brief Server descriptors in connection-priority order.
    std::vector<ServerConfig> servers;

    ManagerConfig manager;

    /// @brief Log level requested by the file, if any.
    std::optional<log::Level> logLevel;
};

/// @brief Parses a configuration document.
///
/// `mcpServers` may be an array of descriptors carrying a `name`, or an object keyed by
/// server name. `healthCheckInterval` is given in seconds.
/// @param content The JSON text.
/// @return The configuration, or a ConfigError/ProtocolError.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<HubConfig>;

/// @brief Loads the configuration from a file.
/// @param path The path to the config file.
/// @return The configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<HubConfig>;

} // namespace mcphub

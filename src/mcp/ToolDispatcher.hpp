// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief The tool surface a task executor consumes.
///
/// The executor holds a reference to a dispatcher; it never reaches into the servers behind it.
class ToolDispatcher
{
  public:
    virtual ~ToolDispatcher() = default;

    /// @brief Returns every dispatchable tool in the executor's descriptor shape.
    [[nodiscard]] virtual auto allTools() const -> std::vector<ToolDescriptor> = 0;

    /// @brief Invokes a tool by its dispatch name.
    /// @param name The tool name as listed by allTools().
    /// @param arguments The tool arguments.
    /// @return The tool result or an error. Failures are reported, never retried.
    [[nodiscard]] virtual auto callTool(std::string_view name, const nlohmann::json& arguments)
        -> Result<ToolResult> = 0;

    /// @brief Returns true if the name refers to a tool this dispatcher serves.
    [[nodiscard]] virtual auto isMcpTool(std::string_view name) const -> bool = 0;
};

} // namespace mcphub

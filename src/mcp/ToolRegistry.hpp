// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief One entry of the aggregate tool registry.
struct RegisteredTool
{
    /// @brief Name under which the tool is exposed; may be prefixed with its server name.
    std::string name;

    /// @brief The tool as its server advertised it (`tool.name` is the server-side name).
    Tool tool;
};

/// @brief Merged view of the tools of many servers, with name-collision resolution.
///
/// The first server to register a bare tool name keeps it. A later server registering the
/// same name gets `{server}_{tool}` instead. Entries keep their registration order.
///
/// Not synchronized; ServerManager guards every access with its state mutex.
class ToolRegistry
{
  public:
    /// @brief Replaces all tools of one server with a freshly fetched list.
    /// @param serverName The owning server.
    /// @param tools The server's current tools.
    /// @return The number of tools registered for the server.
    auto replaceServerTools(std::string_view serverName, const std::vector<Tool>& tools) -> size_t;

    /// @brief Removes every tool owned by a server.
    /// @return The number of removed entries.
    auto removeServerTools(std::string_view serverName) -> size_t;

    /// @brief Looks up a tool by its registry name.
    /// @return The entry, or nullptr. Invalidated by the next mutation.
    [[nodiscard]] auto find(std::string_view name) const -> const RegisteredTool*;

    [[nodiscard]] auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }

    /// @brief Returns the entries owned by one server, in registration order.
    [[nodiscard]] auto toolsOf(std::string_view serverName) const -> std::vector<RegisteredTool>;

    /// @brief Returns the number of registered tools per server.
    [[nodiscard]] auto countByServer() const -> std::map<std::string, size_t>;

    [[nodiscard]] auto entries() const -> const std::vector<RegisteredTool>& { return _entries; }
    [[nodiscard]] auto size() const -> size_t { return _entries.size(); }
    [[nodiscard]] auto empty() const -> bool { return _entries.empty(); }

    void clear();

  private:
    std::vector<RegisteredTool> _entries;
    std::map<std::string, size_t, std::less<>> _index; // registry name -> position in _entries

    void rebuildIndex();
};

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <iterator>

namespace mcphub
{

auto ToolRegistry::replaceServerTools(std::string_view serverName, const std::vector<Tool>& tools) -> size_t
{
    removeServerTools(serverName);

    auto registered = size_t { 0 };
    for (const auto& tool: tools)
    {
        auto name = tool.name;
        if (_index.contains(name))
        {
            name = std::format("{}_{}", serverName, tool.name);
            if (_index.contains(name))
            {
                log::warning("Tool '{}' of server '{}' clashes with '{}', skipping", tool.name, serverName, name);
                continue;
            }
            log::info("Tool '{}' of server '{}' registered as '{}'", tool.name, serverName, name);
        }

        _index.emplace(name, _entries.size());
        _entries.push_back(RegisteredTool { .name = std::move(name), .tool = tool });
        ++registered;
    }

    return registered;
}

auto ToolRegistry::removeServerTools(std::string_view serverName) -> size_t
{
    auto const removed = std::erase_if(
        _entries, [&](const RegisteredTool& entry) { return entry.tool.serverName == serverName; });
    if (removed > 0)
        rebuildIndex();
    return removed;
}

auto ToolRegistry::find(std::string_view name) const -> const RegisteredTool*
{
    auto const it = _index.find(name);
    if (it == _index.end())
        return nullptr;
    return &_entries[it->second];
}

auto ToolRegistry::toolsOf(std::string_view serverName) const -> std::vector<RegisteredTool>
{
    auto result = std::vector<RegisteredTool> {};
    std::ranges::copy_if(_entries, std::back_inserter(result), [&](const RegisteredTool& entry) {
        return entry.tool.serverName == serverName;
    });
    return result;
}

auto ToolRegistry::countByServer() const -> std::map<std::string, size_t>
{
    auto counts = std::map<std::string, size_t> {};
    for (const auto& entry: _entries)
        ++counts[entry.tool.serverName];
    return counts;
}

void ToolRegistry::clear()
{
    _entries.clear();
    _index.clear();
}

void ToolRegistry::rebuildIndex()
{
    _index.clear();
    for (size_t i = 0; i < _entries.size(); ++i)
        _index.emplace(_entries[i].name, i);
}

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

namespace mcphub
{

/// @brief One flattened input parameter of a tool, derived from its JSON schema.
struct ToolParameter
{
    std::string name;
    std::string type = "string";
    std::string description;
    bool required = false;
};

/// @brief A tool as advertised by one MCP server.
struct Tool
{
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    std::string serverName; // back-reference only
    nlohmann::json inputSchema;
};

/// @brief A tool in the shape the task executor consumes.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    std::string serverName;
    bool isMcpTool = true;
};

/// @brief Plain text returned by a tool (first text item of its content array).
struct TextContent
{
    std::string text;
};

/// @brief Any other JSON value returned by a tool.
struct StructuredContent
{
    nlohmann::json value;
};

/// @brief The tool ran but reported a failure (`isError: true`).
struct ToolError
{
    std::string message;
};

/// @brief Result of a tool call, decoded once at the protocol boundary.
using ToolResult = std::variant<TextContent, StructuredContent, ToolError>;

/// @brief Returns true if the result carries a tool-reported failure.
[[nodiscard]] inline auto isToolError(const ToolResult& result) -> bool
{
    return std::holds_alternative<ToolError>(result);
}

/// @brief Renders a tool result as a single string for display or for feeding back to a model.
[[nodiscard]] inline auto toolResultText(const ToolResult& result) -> std::string
{
    struct Visitor
    {
        auto operator()(const TextContent& content) const -> std::string { return content.text; }
        auto operator()(const StructuredContent& content) const -> std::string { return content.value.dump(); }
        auto operator()(const ToolError& error) const -> std::string { return error.message; }
    };
    return std::visit(Visitor {}, result);
}

/// @brief Flattens a JSON schema's `properties`/`required` pair into a parameter list.
/// @param inputSchema The tool's `inputSchema` object.
/// @return One entry per property, ordered by property name.
[[nodiscard]] inline auto flattenParameters(const nlohmann::json& inputSchema) -> std::vector<ToolParameter>
{
    auto parameters = std::vector<ToolParameter> {};
    if (!inputSchema.is_object() || !inputSchema.contains("properties")
        || !inputSchema.at("properties").is_object())
        return parameters;

    auto const required = inputSchema.value("required", nlohmann::json::array());

    for (const auto& [name, property]: inputSchema.at("properties").items())
    {
        auto parameter = ToolParameter { .name = name };
        if (property.is_object())
        {
            if (property.contains("type") && property["type"].is_string())
                parameter.type = property["type"].get<std::string>();
            if (property.contains("description") && property["description"].is_string())
                parameter.description = property["description"].get<std::string>();
        }
        if (required.is_array())
            parameter.required = std::find(required.begin(), required.end(), name) != required.end();
        parameters.push_back(std::move(parameter));
    }
    return parameters;
}

/// @brief Converts a parameter to its JSON form.
[[nodiscard]] inline auto toJson(const ToolParameter& parameter) -> nlohmann::json
{
    return nlohmann::json {
        { "name", parameter.name },
        { "type", parameter.type },
        { "required", parameter.required },
        { "description", parameter.description },
    };
}

/// @brief Converts an executor tool descriptor to its JSON form.
[[nodiscard]] inline auto toJson(const ToolDescriptor& descriptor) -> nlohmann::json
{
    auto parameters = nlohmann::json::array();
    for (const auto& parameter: descriptor.parameters)
        parameters.push_back(toJson(parameter));

    return nlohmann::json {
        { "name", descriptor.name },
        { "description", descriptor.description },
        { "parameters", std::move(parameters) },
        { "server_name", descriptor.serverName },
        { "is_mcp_tool", descriptor.isMcpTool },
    };
}

} // namespace mcphub

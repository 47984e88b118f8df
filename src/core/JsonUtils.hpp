// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcphub::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts an optional array of strings from a JSON object.
///
/// A missing field yields an empty list; a field that is present but not an
/// array of strings is an error.
[[nodiscard]] inline auto getStringList(const nlohmann::json& obj, std::string_view key)
    -> Result<std::vector<std::string>>
{
    auto keyStr = std::string(key);
    auto list = std::vector<std::string> {};
    if (!obj.is_object() || !obj.contains(keyStr) || obj[keyStr].is_null())
        return list;

    auto const& value = obj[keyStr];
    if (!value.is_array())
        return makeError(ErrorCode::InvalidArgument, std::format("Field '{}' must be an array", key));

    for (const auto& item: value)
    {
        if (!item.is_string())
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Field '{}' must contain only strings", key));
        list.push_back(item.get<std::string>());
    }
    return list;
}

/// @brief Extracts an optional string-to-string object from a JSON object.
///
/// A missing field yields an empty map; non-string values are an error.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> Result<std::map<std::string, std::string>>
{
    auto keyStr = std::string(key);
    auto map = std::map<std::string, std::string> {};
    if (!obj.is_object() || !obj.contains(keyStr) || obj[keyStr].is_null())
        return map;

    auto const& value = obj[keyStr];
    if (!value.is_object())
        return makeError(ErrorCode::InvalidArgument, std::format("Field '{}' must be an object", key));

    for (const auto& [name, item]: value.items())
    {
        if (!item.is_string())
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Field '{}.{}' must be a string", key, name));
        map[name] = item.get<std::string>();
    }
    return map;
}

} // namespace mcphub::json

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcphub::jsonrpc
{

/// @brief JSON-RPC 2.0 error code for an unknown method.
constexpr auto MethodNotFoundCode = -32601;

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 message received from a server.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
    std::string method; // non-empty for server-initiated notifications and requests

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns true if the message is not a response to one of our requests.
    [[nodiscard]] auto isServerMessage() const -> bool { return !method.empty(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Returns true if the error signals that the server does not implement the method.
///
/// Servers report this either with code -32601 or only through the message text
/// ("Method not found", "Unknown method").
[[nodiscard]] auto isMethodNotFound(const RpcError& error) -> bool;

/// @brief Converts an RPC error envelope into an Error.
/// @param method The method of the failed request, used in the message.
/// @param error The error envelope.
/// @return MethodNotFound for unknown methods, ProtocolError otherwise.
[[nodiscard]] auto toError(std::string_view method, const RpcError& error) -> Error;

} // namespace mcphub::jsonrpc

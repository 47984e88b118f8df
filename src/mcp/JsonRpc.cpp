// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace mcphub::jsonrpc
{

namespace
{
    auto toLower(std::string_view text) -> std::string
    {
        auto lowered = std::string(text);
        std::ranges::transform(
            lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }
} // namespace

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");

        response.error = RpcError {
            .code = err.contains("code") && err["code"].is_number_integer() ? err["code"].get<int>() : 0,
            .message = err.contains("message") && err["message"].is_string()
                           ? err["message"].get<std::string>()
                           : std::string("Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (message.contains("method") && message["method"].is_string())
    {
        response.method = message["method"].get<std::string>();
    }
    else
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto isMethodNotFound(const RpcError& error) -> bool
{
    if (error.code == MethodNotFoundCode)
        return true;

    auto const message = toLower(error.message);
    return message.find("method not found") != std::string::npos
           || message.find("unknown method") != std::string::npos;
}

auto toError(std::string_view method, const RpcError& error) -> Error
{
    return Error {
        .code = isMethodNotFound(error) ? ErrorCode::MethodNotFound : ErrorCode::ProtocolError,
        .message = std::format("RPC error {} in '{}': {}", error.code, method, error.message),
    };
}

} // namespace mcphub::jsonrpc

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Error codes for categorizing failures across the MCP subsystem.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    LaunchError,
    HandshakeError,
    TransportError,
    TimeoutError,
    ProtocolError,
    MethodNotFound,
    ToolNotFound,
    ServerUnavailable,
    UpstreamToolError,
};

/// @brief Returns a short, stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigurationError";
        case ErrorCode::LaunchError: return "LaunchError";
        case ErrorCode::HandshakeError: return "HandshakeError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::MethodNotFound: return "MethodNotFound";
        case ErrorCode::ToolNotFound: return "ToolNotFoundError";
        case ErrorCode::ServerUnavailable: return "ServerUnavailable";
        case ErrorCode::UpstreamToolError: return "UpstreamToolError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace mcphub

template <>
struct std::formatter<mcphub::Error>: std::formatter<std::string>
{
    auto format(const mcphub::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcphub::errorCodeName(error.code), error.message), ctx);
    }
};

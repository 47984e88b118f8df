// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace mcphub
{

/// @brief Abstract interface for MCP transport communication.
///
/// A transport carries newline-delimited JSON messages to and from exactly one server.
/// Implementations are not thread-safe; the owning McpClient serializes all access.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Establishes the channel (for stdio: spawns and probes the server process).
    /// @return Success, or a LaunchError.
    [[nodiscard]] virtual auto open() -> VoidResult = 0;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives one JSON message from the server, waiting at most @p timeout.
    /// @param timeout Upper bound on the time spent waiting for a complete line.
    /// @return The received JSON message, a TimeoutError, or another error.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Closes the transport connection. Safe to call more than once.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected and its peer is still running.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcphub

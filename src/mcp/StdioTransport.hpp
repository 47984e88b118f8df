// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief How long to watch a freshly spawned server before declaring it started.
struct StartupProbe
{
    /// @brief Upper bound on the probe.
    std::chrono::milliseconds window { 10'000 };

    /// @brief Delay between two liveness checks.
    std::chrono::milliseconds interval { 500 };

    /// @brief The probe ends early once the process has stayed alive this long.
    std::chrono::milliseconds settle { 2'000 };
};

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    /// @brief Full argv: executable followed by its arguments.
    ///
    /// A bare executable name is looked up in `env["PATH"]` when the overlay sets PATH,
    /// otherwise in the inherited PATH.
    std::vector<std::string> argv;

    /// @brief Variables overlaid on the inherited process environment.
    std::map<std::string, std::string> env;

    StartupProbe probe;

    /// @brief Time granted to the process to exit after SIGTERM before it is killed.
    std::chrono::milliseconds shutdownGrace { 5'000 };
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and communicates via its stdin/stdout. The child's stderr is
/// drained continuously and its tail is kept for diagnostics.
class StdioTransport: public Transport
{
  public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto open() -> VoidResult override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the most recent output the child wrote to stderr.
    [[nodiscard]] auto stderrTail() const -> std::string;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub

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

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string workingDirectory;
    std::chrono::milliseconds stopGrace { 5000 };
};

/// @brief Resolves a command to an executable path.
///
/// A command containing '/' is checked as given. Otherwise each directory of
/// @p searchPath is tried in order.
/// @return The executable path, or a LaunchError naming the command.
[[nodiscard]] auto resolveExecutable(const std::string& command, const std::string& searchPath)
    -> Result<std::string>;

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and communicates via its stdin/stdout. The child's
/// stderr is exposed line by line through receiveDiagnostic().
class StdioTransport: public Transport
{
  public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the MCP server process.
    /// @return Success or a LaunchError.
    [[nodiscard]] auto open() -> VoidResult override;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    [[nodiscard]] auto receiveDiagnostic() -> std::optional<std::string> override;

    /// @brief Closes stdin, sends SIGTERM, waits up to the stop grace period and
    ///        escalates to SIGKILL. Blocked readers are woken afterwards.
    void shutdown() override;

    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the child's process id, or -1 when no child is running.
    [[nodiscard]] auto processId() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub

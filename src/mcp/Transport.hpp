// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mcphub
{

/// @brief Abstract interface for MCP transport communication.
///
/// A transport carries newline-delimited JSON-RPC in both directions and an optional
/// diagnostic side channel. `send()` may be called from any thread but callers must
/// serialize it. `receive()` and `receiveDiagnostic()` are each driven by exactly one
/// reader thread.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Launches the peer and opens the channel.
    /// @return Success, or a LaunchError if the peer could not be started.
    [[nodiscard]] virtual auto open() -> VoidResult = 0;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives a JSON message from the server (blocking).
    ///
    /// A malformed line yields a ProtocolError and the stream stays usable.
    /// End of stream, or a shutdown, yields a TransportError.
    /// @return The received JSON message or an error.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Receives one diagnostic line from the server (blocking).
    /// @return The line, or std::nullopt once the diagnostic stream has ended.
    [[nodiscard]] virtual auto receiveDiagnostic() -> std::optional<std::string> = 0;

    /// @brief Asks the peer to exit and wakes any blocked reader.
    ///
    /// Handles stay valid so readers can finish. Safe to call more than once.
    virtual void shutdown() = 0;

    /// @brief Closes the transport connection and releases every handle.
    ///
    /// Implies shutdown(). Must not race with a thread blocked in receive().
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConnectionEvent.hpp>
#include <mcp/NotificationRouter.hpp>
#include <mcp/ProgressTracker.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Lifecycle state of a Connection.
enum class ConnectionState
{
    NotStarted,
    Starting,
    Initializing,
    Ready,
    Stopping,
    Stopped,
    Disconnected,
};

[[nodiscard]] constexpr auto connectionStateName(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::NotStarted: return "not started";
        case ConnectionState::Starting: return "starting";
        case ConnectionState::Initializing: return "initializing";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::Stopping: return "stopping";
        case ConnectionState::Stopped: return "stopped";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

/// @brief Protocol settings shared by all connections of a client.
struct ConnectionOptions
{
    std::string clientName = "mcphub";
    std::string clientVersion = "0.1.0";
    std::string protocolVersion = "2024-11-05";
    std::chrono::milliseconds handshakeTimeout { 15000 };
    std::chrono::milliseconds discoveryTimeout { 15000 };
    std::chrono::milliseconds requestTimeout { 15000 };
    std::chrono::milliseconds toolCallTimeout { 60000 };
    int maxDiscoveryPages = 64;
};

/// @brief One MCP session: a transport, its two reader threads and the protocol state.
///
/// The stdout reader feeds every inbound message to a NotificationRouter; the
/// diagnostic reader logs the provider's stderr. Requests may be issued from any
/// thread and are matched to replies through a RequestCorrelator. Writes are
/// serialized so concurrent callers never interleave partial lines.
///
/// When the transport ends without a prior stop(), the connection moves to
/// Disconnected, fails all pending requests and pushes a Disconnected event with
/// the unexpected flag. The supervisor is then expected to call stop() to reap it.
class Connection
{
  public:
    /// @param id Stable server id; owner id of everything this connection discovers.
    /// @param displayName Name shown for this server.
    /// @param transport The channel to the provider; not yet opened.
    /// @param options Protocol settings and timeouts.
    /// @param events Receives this connection's events; may be null. Must outlive the connection.
    /// @param session Serial number stamped on every event.
    /// @param handlers Implementations of provider-initiated requests.
    Connection(std::string id,
               std::string displayName,
               std::unique_ptr<Transport> transport,
               ConnectionOptions options = {},
               EventChannel* events = nullptr,
               uint64_t session = 0,
               ServerRequestHandlers handlers = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// @brief Opens the transport and starts the reader threads.
    /// @return Success or a LaunchError.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Performs the initialize handshake and sends notifications/initialized.
    /// @return The provider's capabilities or a HandshakeError.
    [[nodiscard]] auto initialize() -> Result<ServerCapabilities>;

    /// @brief Discovers all tools, following pagination. Failure is fatal.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDescriptor>>;

    /// @brief Discovers resources. Any failure yields an empty list.
    [[nodiscard]] auto listResources() -> std::vector<ResourceDescriptor>;

    /// @brief Discovers prompt templates. Any failure yields an empty list.
    [[nodiscard]] auto listPrompts() -> std::vector<PromptDescriptor>;

    /// @brief Invokes a tool. Never fails: errors become an error result.
    /// @param timeout Overrides the configured tool-call timeout.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) -> ToolCallResult;

    [[nodiscard]] auto readResource(std::string_view uri) -> Result<std::vector<ResourceContent>>;
    [[nodiscard]] auto getPrompt(std::string_view name, const nlohmann::json& arguments) -> Result<PromptResult>;

    /// @brief Subscribes to a resource; the uri is recorded only on success.
    [[nodiscard]] auto subscribeToResource(const std::string& uri) -> VoidResult;

    /// @brief Unsubscribes from a resource; the uri is dropped only on success.
    [[nodiscard]] auto unsubscribeFromResource(const std::string& uri) -> VoidResult;

    [[nodiscard]] auto isSubscribed(const std::string& uri) const -> bool;
    [[nodiscard]] auto subscriptions() const -> std::vector<std::string>;

    /// @brief Sends a ping request and waits for the reply.
    [[nodiscard]] auto ping() -> VoidResult;

    /// @brief Tells the provider that the client's roots changed.
    [[nodiscard]] auto notifyRootsChanged() -> VoidResult;

    /// @brief Sends a request and blocks until its reply, an error or the timeout.
    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params,
                                   std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    /// @brief Sends a notification; no reply is expected.
    [[nodiscard]] auto sendNotification(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Resolves a pending request with CancelledError and notifies the provider.
    /// @return False if the request was no longer pending.
    auto cancelRequest(int64_t id) -> bool;

    /// @brief Cancels every pending request.
    /// @return The number of requests cancelled.
    auto cancelAllRequests() -> size_t;

    [[nodiscard]] auto pendingRequestIds() const -> std::vector<int64_t>;

    /// @brief Shuts the connection down and fails every pending request.
    ///
    /// Idempotent. Must not be called from one of the connection's reader threads.
    void stop();

    [[nodiscard]] auto id() const -> const std::string&;
    [[nodiscard]] auto displayName() const -> const std::string&;
    [[nodiscard]] auto session() const -> uint64_t;
    [[nodiscard]] auto state() const -> ConnectionState;
    [[nodiscard]] auto capabilities() const -> ServerCapabilities;
    [[nodiscard]] auto progress() -> ProgressTracker&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub

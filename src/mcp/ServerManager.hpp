// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/BuiltinToolBridge.hpp>
#include <mcp/Connection.hpp>
#include <mcp/ConnectionEvent.hpp>
#include <mcp/ServerDescriptor.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcp/ToolCatalog.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mcphub
{

/// @brief Creates the (unopened) transport for a server descriptor.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const ServerDescriptor&)>;

/// @brief Returns a factory spawning each server as a child process over stdio.
[[nodiscard]] auto makeStdioTransportFactory(std::chrono::milliseconds stopGrace) -> TransportFactory;

/// @brief Settings of a ServerManager.
struct ServerManagerOptions
{
    ConnectionOptions connection;
    std::chrono::milliseconds stopGrace { 5000 };
    std::vector<std::string> workspaceRoots;
};

/// @brief Outcome of ServerManager::testConnection().
struct ConnectionTestResult
{
    bool ok = false;
    std::string message;
};

/// @brief Owns every live Connection and the catalog of what they expose.
///
/// All catalog and connection-table mutation happens under one lock, so discovery
/// completing, a list-changed refresh and a concurrent stop never interleave.
/// Connection events arrive on a single channel that a supervisor thread consumes:
/// it refreshes the catalog on list changes and reaps connections whose process
/// went away.
///
/// Tool calls are routed to the builtin bridge first and to the owning connection
/// otherwise. A server that fails to start leaves nothing behind except its error
/// string.
class ServerManager
{
  public:
    using EventObserver = std::function<void(const ConnectionEvent&)>;
    using SamplingHandler = std::function<Result<nlohmann::json>(const SamplingRequest&)>;

    /// @param registry Persisted server descriptors; must outlive the manager.
    /// @param builtins Builtin tools; must outlive the manager.
    /// @param options Protocol settings, timeouts and initial workspace roots.
    /// @param transportFactory Creates transports; defaults to spawning child processes.
    ServerManager(ServerRegistry& registry,
                  BuiltinToolBridge& builtins,
                  ServerManagerOptions options = {},
                  TransportFactory transportFactory = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @name Lifecycle
    /// @{

    /// @brief Starts, initializes and discovers the server with @p id.
    ///
    /// Starting a running server is a no-op. On failure the connection is stopped,
    /// nothing is added to the catalog and the error message is recorded.
    [[nodiscard]] auto startServer(const std::string& id) -> VoidResult;

    /// @brief Stops a running server and purges its catalog entries.
    void stopServer(const std::string& id);

    /// @brief Spawns @p descriptor, performs the handshake and stops it again.
    [[nodiscard]] auto testConnection(const ServerDescriptor& descriptor) -> ConnectionTestResult;

    /// @brief Starts every registered server that is not running yet.
    /// @return The number of servers started. Failures are logged and skipped.
    auto startAllServers() -> size_t;

    /// @brief Starts all servers if none is running or starting.
    void ensureServersStarted();

    void stopAllServers();
    /// @}

    /// @name Capability access
    /// @{

    /// @brief Invokes a tool by name. Never fails: errors become an error result.
    [[nodiscard]] auto callTool(const std::string& name,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) -> ToolCallResult;

    [[nodiscard]] auto readResource(const std::string& uri) -> Result<std::vector<ResourceContent>>;
    [[nodiscard]] auto getPrompt(const std::string& name, const nlohmann::json& arguments) -> Result<PromptResult>;

    /// @brief Subscribes to a resource through the connection that exposes it.
    [[nodiscard]] auto subscribe(const std::string& uri) -> VoidResult;
    [[nodiscard]] auto unsubscribe(const std::string& uri) -> VoidResult;

    /// @brief Returns the enabled builtins followed by every discovered remote tool.
    [[nodiscard]] auto allTools() const -> std::vector<ToolDescriptor>;
    [[nodiscard]] auto resources() const -> std::vector<ResourceDescriptor>;
    [[nodiscard]] auto prompts() const -> std::vector<PromptDescriptor>;

    /// @brief Looks up progress by token across all live connections.
    [[nodiscard]] auto progress(const std::string& token) const -> std::optional<Progress>;
    /// @}

    /// @name Administration
    /// @{
    void setWorkspaceRoots(std::vector<std::string> directories);
    [[nodiscard]] auto workspaceRoots() const -> std::vector<Root>;

    /// @brief Installs the handler answering sampling/createMessage.
    ///
    /// Applies to running servers as well. Without a handler sampling requests are refused.
    void setSamplingHandler(SamplingHandler handler);

    /// @brief Installs a callback receiving every connection event after it was handled.
    void setEventObserver(EventObserver observer);

    [[nodiscard]] auto lastError(const std::string& id) const -> std::optional<std::string>;
    void clearError(const std::string& id);

    [[nodiscard]] auto enabledServers() const -> std::vector<std::string>;
    [[nodiscard]] auto isRunning(const std::string& id) const -> bool;

    /// @brief Returns true if the server's last session ended with an unexpected exit.
    [[nodiscard]] auto disconnectedUnexpectedly(const std::string& id) const -> bool;

    [[nodiscard]] auto connection(const std::string& id) const -> std::shared_ptr<Connection>;

    auto cancelRequests(const std::string& id) -> size_t;
    auto cancelAllRequests() -> size_t;
    /// @}

    /// @name Registry
    /// @{
    [[nodiscard]] auto addServer(ServerDescriptor descriptor) -> VoidResult;

    /// @brief Replaces a descriptor; a running server is restarted with it.
    [[nodiscard]] auto updateServer(ServerDescriptor descriptor) -> VoidResult;

    /// @brief Stops the server if running, then deletes its descriptor.
    [[nodiscard]] auto removeServer(const std::string& id) -> VoidResult;

    [[nodiscard]] auto importServers(std::vector<ServerDescriptor> descriptors) -> Result<size_t>;
    /// @}

  private:
    struct Discovery
    {
        std::vector<ToolDescriptor> tools;
        std::vector<ResourceDescriptor> resources;
        std::vector<PromptDescriptor> prompts;
    };

    struct PendingStart
    {
        uint64_t session = 0;
        bool stopRequested = false;
        std::set<CapabilityKind> dirty;
    };

    [[nodiscard]] auto createConnection(const ServerDescriptor& descriptor, EventChannel* events, uint64_t session)
        -> Result<std::shared_ptr<Connection>>;
    [[nodiscard]] auto discover(Connection& connection) -> Result<Discovery>;
    [[nodiscard]] auto filterReserved(const std::string& serverId, std::vector<ToolDescriptor> tools) const
        -> std::vector<ToolDescriptor>;
    [[nodiscard]] auto currentConnection(const ConnectionEvent& event) const -> std::shared_ptr<Connection>;
    [[nodiscard]] auto connectionLocked(const std::string& id) const -> std::shared_ptr<Connection>;

    void supervise(const std::stop_token& stopToken);
    void handleEvent(const ConnectionEvent& event);
    void refresh(const std::shared_ptr<Connection>& connection, CapabilityKind kind);
    void reap(const std::shared_ptr<Connection>& connection, const Disconnected& disconnected);

    ServerRegistry& _registry;
    BuiltinToolBridge& _builtins;
    ServerManagerOptions _options;
    TransportFactory _transportFactory;

    mutable std::mutex _mutex;
    ToolCatalog _catalog;
    std::map<std::string, std::shared_ptr<Connection>> _connections;
    std::map<std::string, PendingStart> _starting;
    std::map<std::string, std::string> _errors;
    std::set<std::string> _unexpectedDisconnects;
    std::vector<std::string> _workspaceRoots;
    SamplingHandler _samplingHandler;
    EventObserver _observer;
    uint64_t _nextSession = 1;

    EventChannel _events;
    std::jthread _supervisor;
};

} // namespace mcphub

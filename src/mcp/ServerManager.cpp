// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <filesystem>
#include <format>

namespace mcphub
{

namespace
{
    auto rootFor(const std::string& directory) -> Root
    {
        auto path = std::filesystem::path(directory).lexically_normal();
        if (!path.has_filename() && path.has_parent_path() && path != path.root_path())
            path = path.parent_path();

        auto name = path.filename().string();
        if (name.empty())
            name = path.string();

        return Root { .uri = "file://" + path.string(), .name = std::move(name) };
    }

    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };
} // namespace

auto makeStdioTransportFactory(std::chrono::milliseconds stopGrace) -> TransportFactory
{
    return [stopGrace](const ServerDescriptor& descriptor) -> Result<std::unique_ptr<Transport>> {
        return std::make_unique<StdioTransport>(StdioTransportConfig {
            .command = descriptor.command,
            .args = descriptor.args,
            .env = descriptor.env,
            .workingDirectory = descriptor.workingDirectory,
            .stopGrace = stopGrace,
        });
    };
}

ServerManager::ServerManager(ServerRegistry& registry,
                             BuiltinToolBridge& builtins,
                             ServerManagerOptions options,
                             TransportFactory transportFactory):
    _registry { registry },
    _builtins { builtins },
    _options { std::move(options) },
    _transportFactory { std::move(transportFactory) },
    _workspaceRoots { _options.workspaceRoots }
{
    if (!_transportFactory)
        _transportFactory = makeStdioTransportFactory(_options.stopGrace);

    _supervisor = std::jthread([this](const std::stop_token& stopToken) { supervise(stopToken); });
}

ServerManager::~ServerManager()
{
    stopAllServers();
    _supervisor.request_stop();
    if (_supervisor.joinable())
        _supervisor.join();
}

// {{{ lifecycle

auto ServerManager::createConnection(const ServerDescriptor& descriptor, EventChannel* events, uint64_t session)
    -> Result<std::shared_ptr<Connection>>
{
    auto transport = _transportFactory(descriptor);
    if (!transport)
        return std::unexpected(transport.error());

    auto handlers = ServerRequestHandlers {
        .sampling = [this](const SamplingRequest& request) -> Result<nlohmann::json> {
            auto handler = SamplingHandler {};
            {
                auto const lock = std::lock_guard(_mutex);
                handler = _samplingHandler;
            }
            if (!handler)
                return makeError(ErrorCode::InvalidArgument, "Sampling is not supported by this client");
            return handler(request);
        },
        .roots = [this] { return workspaceRoots(); },
    };

    return std::make_shared<Connection>(descriptor.id,
                                        descriptor.name.empty() ? descriptor.id : descriptor.name,
                                        std::move(*transport),
                                        _options.connection,
                                        events,
                                        session,
                                        std::move(handlers));
}

auto ServerManager::discover(Connection& connection) -> Result<Discovery>
{
    auto tools = connection.listTools();
    if (!tools)
        return std::unexpected(tools.error());

    return Discovery {
        .tools = filterReserved(connection.id(), std::move(*tools)),
        .resources = connection.listResources(),
        .prompts = connection.listPrompts(),
    };
}

auto ServerManager::filterReserved(const std::string& serverId, std::vector<ToolDescriptor> tools) const
    -> std::vector<ToolDescriptor>
{
    std::erase_if(tools, [&](const ToolDescriptor& tool) {
        if (!BuiltinToolBridge::isReserved(tool.name))
            return false;
        log::warning("Ignoring tool '{}' from '{}': the name is reserved for a builtin tool", tool.name, serverId);
        return true;
    });
    return tools;
}

auto ServerManager::startServer(const std::string& id) -> VoidResult
{
    auto const descriptor = _registry.find(id);
    if (!descriptor)
        return makeError(ErrorCode::NotFound, std::format("Unknown server: {}", id));

    auto session = uint64_t { 0 };
    {
        auto const lock = std::lock_guard(_mutex);
        if (_connections.contains(id))
            return {};
        if (_starting.contains(id))
            return makeError(ErrorCode::InvalidArgument, std::format("Server '{}' is already starting", id));

        session = _nextSession++;
        _starting[id] = PendingStart { .session = session };
    }

    log::info("Starting MCP server '{}': {}", id, descriptor->command);

    auto connection = std::shared_ptr<Connection> {};
    auto const started =
        createConnection(*descriptor, &_events, session)
            .and_then([&](std::shared_ptr<Connection> created) {
                connection = std::move(created);
                return connection->start();
            })
            .and_then([&]() { return connection->initialize(); })
            .and_then([&](const ServerCapabilities&) { return discover(*connection); });

    auto pending = PendingStart {};
    auto crashed = false;
    {
        auto const lock = std::lock_guard(_mutex);
        pending = std::move(_starting.extract(id).mapped());
        crashed = started && connection->state() == ConnectionState::Disconnected;
        if (!started)
            _errors[id] = started.error().message;
        else if (crashed)
        {
            _errors[id] = "Server disconnected unexpectedly";
            _unexpectedDisconnects.insert(id);
        }
        else if (!pending.stopRequested)
        {
            _catalog.replaceTools(id, started->tools);
            _catalog.replaceResources(id, started->resources);
            _catalog.replacePrompts(id, started->prompts);
            _connections[id] = connection;
            _errors.erase(id);
            _unexpectedDisconnects.erase(id);
        }
    }

    if (!started)
    {
        if (connection)
            connection->stop();
        log::error("Failed to start MCP server '{}': {}", id, started.error());
        return std::unexpected(started.error());
    }

    if (crashed)
    {
        connection->stop();
        log::error("MCP server '{}' exited during startup", id);
        return makeError(ErrorCode::TransportError, "Server disconnected unexpectedly");
    }

    if (pending.stopRequested)
    {
        connection->stop();
        log::info("MCP server '{}' was stopped while starting", id);
        return makeError(ErrorCode::CancelledError, std::format("Server '{}' was stopped while starting", id));
    }

    log::info("MCP server '{}' ready with {} tool(s), {} resource(s), {} prompt(s)",
              id,
              started->tools.size(),
              started->resources.size(),
              started->prompts.size());

    // A list change that arrived during discovery is replayed against the committed entry.
    for (auto const kind: pending.dirty)
        _events.push(ConnectionEvent { .serverId = id, .session = session, .payload = ListChanged { kind } });

    return {};
}

void ServerManager::stopServer(const std::string& id)
{
    auto connection = std::shared_ptr<Connection> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (auto pending = _starting.find(id); pending != _starting.end())
        {
            pending->second.stopRequested = true;
            return;
        }

        auto const it = _connections.find(id);
        if (it == _connections.end())
            return;

        connection = std::move(it->second);
        _connections.erase(it);
        _catalog.purgeOwner(id);
    }

    log::info("Stopping MCP server '{}'", id);
    connection->stop();
}

auto ServerManager::testConnection(const ServerDescriptor& descriptor) -> ConnectionTestResult
{
    auto connection = std::shared_ptr<Connection> {};
    auto const tested =
        createConnection(descriptor, nullptr, 0)
            .and_then([&](std::shared_ptr<Connection> created) {
                connection = std::move(created);
                return connection->start();
            })
            .and_then([&]() { return connection->initialize(); })
            .and_then([&](const ServerCapabilities& caps) {
                return connection->listTools().transform([&](const std::vector<ToolDescriptor>& tools) {
                    return std::format(
                        "Connected to {} {} ({} tool(s))", caps.serverName, caps.serverVersion, tools.size());
                });
            });

    if (connection)
        connection->stop();

    if (!tested)
        return ConnectionTestResult { .ok = false, .message = tested.error().message };
    return ConnectionTestResult { .ok = true, .message = *tested };
}

auto ServerManager::startAllServers() -> size_t
{
    auto count = size_t { 0 };
    for (auto const& descriptor: _registry.servers())
    {
        if (isRunning(descriptor.id))
            continue;

        if (auto started = startServer(descriptor.id); !started)
            log::warning("Skipping MCP server '{}': {}", descriptor.id, started.error().message);
        else
            ++count;
    }
    return count;
}

void ServerManager::ensureServersStarted()
{
    {
        auto const lock = std::lock_guard(_mutex);
        if (!_connections.empty() || !_starting.empty())
            return;
    }
    startAllServers();
}

void ServerManager::stopAllServers()
{
    auto stopping = std::map<std::string, std::shared_ptr<Connection>> {};
    {
        auto const lock = std::lock_guard(_mutex);
        for (auto& [id, pending]: _starting)
            pending.stopRequested = true;
        for (auto const& [id, connection]: _connections)
            _catalog.purgeOwner(id);
        stopping.swap(_connections);
    }

    for (auto const& [id, connection]: stopping)
        connection->stop();
}

// }}}
// {{{ capability access

auto ServerManager::callTool(const std::string& name,
                             const nlohmann::json& arguments,
                             std::optional<std::chrono::milliseconds> timeout) -> ToolCallResult
{
    if (BuiltinToolBridge::isReserved(name))
        return _builtins.call(name, arguments);

    auto const lookup = [&]() -> std::shared_ptr<Connection> {
        auto const lock = std::lock_guard(_mutex);
        auto const tool = _catalog.findTool(name);
        if (!tool)
            return nullptr;
        auto const it = _connections.find(tool->ownerConnectionId);
        return it != _connections.end() ? it->second : nullptr;
    };

    auto connection = lookup();
    if (!connection)
    {
        ensureServersStarted();
        connection = lookup();
    }

    if (!connection)
        return makeToolFailure(ErrorCode::NotFound, std::format("Unknown tool: {}", name));

    return connection->callTool(name, arguments, timeout);
}

auto ServerManager::readResource(const std::string& uri) -> Result<std::vector<ResourceContent>>
{
    auto connection = std::shared_ptr<Connection> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (auto const resource = _catalog.findResource(uri))
            connection = connectionLocked(resource->ownerConnectionId);
    }

    if (!connection)
        return makeError(ErrorCode::NotFound, std::format("No server exposes resource {}", uri));

    return connection->readResource(uri);
}

auto ServerManager::getPrompt(const std::string& name, const nlohmann::json& arguments) -> Result<PromptResult>
{
    auto connection = std::shared_ptr<Connection> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (auto const prompt = _catalog.findPrompt(name))
            connection = connectionLocked(prompt->ownerConnectionId);
    }

    if (!connection)
        return makeError(ErrorCode::NotFound, std::format("Unknown prompt: {}", name));

    return connection->getPrompt(name, arguments);
}

auto ServerManager::subscribe(const std::string& uri) -> VoidResult
{
    auto connection = std::shared_ptr<Connection> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (auto const resource = _catalog.findResource(uri))
            connection = connectionLocked(resource->ownerConnectionId);
    }

    if (!connection)
        return makeError(ErrorCode::NotFound, std::format("No server exposes resource {}", uri));

    return connection->subscribeToResource(uri);
}

auto ServerManager::unsubscribe(const std::string& uri) -> VoidResult
{
    auto owner = std::shared_ptr<Connection> {};
    {
        auto const lock = std::lock_guard(_mutex);
        auto const it = std::ranges::find_if(
            _connections, [&](auto const& entry) { return entry.second->isSubscribed(uri); });
        if (it != _connections.end())
            owner = it->second;
    }

    if (!owner)
        return makeError(ErrorCode::NotFound, std::format("Not subscribed to {}", uri));

    return owner->unsubscribeFromResource(uri);
}

auto ServerManager::allTools() const -> std::vector<ToolDescriptor>
{
    auto tools = _builtins.definitions();
    auto const lock = std::lock_guard(_mutex);
    for (auto& tool: _catalog.tools())
        tools.push_back(std::move(tool));
    return tools;
}

auto ServerManager::resources() const -> std::vector<ResourceDescriptor>
{
    auto const lock = std::lock_guard(_mutex);
    return _catalog.resources();
}

auto ServerManager::prompts() const -> std::vector<PromptDescriptor>
{
    auto const lock = std::lock_guard(_mutex);
    return _catalog.prompts();
}

auto ServerManager::progress(const std::string& token) const -> std::optional<Progress>
{
    auto const lock = std::lock_guard(_mutex);
    for (auto const& [id, connection]: _connections)
    {
        if (auto found = connection->progress().get(token))
            return found;
    }
    return std::nullopt;
}

// }}}
// {{{ administration

void ServerManager::setWorkspaceRoots(std::vector<std::string> directories)
{
    auto connections = std::vector<std::shared_ptr<Connection>> {};
    {
        auto const lock = std::lock_guard(_mutex);
        _workspaceRoots = std::move(directories);
        for (auto const& [id, connection]: _connections)
            connections.push_back(connection);
    }

    for (auto const& connection: connections)
    {
        if (auto notified = connection->notifyRootsChanged(); !notified)
            log::warning("Could not notify '{}' about changed roots: {}", connection->id(), notified.error().message);
    }
}

auto ServerManager::workspaceRoots() const -> std::vector<Root>
{
    auto const lock = std::lock_guard(_mutex);
    auto roots = std::vector<Root> {};
    roots.reserve(_workspaceRoots.size());
    for (auto const& directory: _workspaceRoots)
        roots.push_back(rootFor(directory));
    return roots;
}

void ServerManager::setSamplingHandler(SamplingHandler handler)
{
    auto const lock = std::lock_guard(_mutex);
    _samplingHandler = std::move(handler);
}

void ServerManager::setEventObserver(EventObserver observer)
{
    auto const lock = std::lock_guard(_mutex);
    _observer = std::move(observer);
}

auto ServerManager::lastError(const std::string& id) const -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    if (auto const it = _errors.find(id); it != _errors.end())
        return it->second;
    return std::nullopt;
}

void ServerManager::clearError(const std::string& id)
{
    auto const lock = std::lock_guard(_mutex);
    _errors.erase(id);
}

auto ServerManager::enabledServers() const -> std::vector<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    auto ids = std::vector<std::string> {};
    for (auto const& [id, _]: _connections)
        ids.push_back(id);
    return ids;
}

auto ServerManager::isRunning(const std::string& id) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _connections.contains(id);
}

auto ServerManager::disconnectedUnexpectedly(const std::string& id) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _unexpectedDisconnects.contains(id);
}

auto ServerManager::connection(const std::string& id) const -> std::shared_ptr<Connection>
{
    auto const lock = std::lock_guard(_mutex);
    return connectionLocked(id);
}

auto ServerManager::connectionLocked(const std::string& id) const -> std::shared_ptr<Connection>
{
    auto const it = _connections.find(id);
    return it != _connections.end() ? it->second : nullptr;
}

auto ServerManager::cancelRequests(const std::string& id) -> size_t
{
    auto const target = connection(id);
    return target ? target->cancelAllRequests() : 0;
}

auto ServerManager::cancelAllRequests() -> size_t
{
    auto connections = std::vector<std::shared_ptr<Connection>> {};
    {
        auto const lock = std::lock_guard(_mutex);
        for (auto const& [id, connection]: _connections)
            connections.push_back(connection);
    }

    auto count = size_t { 0 };
    for (auto const& connection: connections)
        count += connection->cancelAllRequests();
    return count;
}

// }}}
// {{{ registry

auto ServerManager::addServer(ServerDescriptor descriptor) -> VoidResult
{
    if (descriptor.id == BuiltinOwnerId)
        return makeError(ErrorCode::InvalidArgument, std::format("'{}' is a reserved server id", descriptor.id));

    return _registry.add(std::move(descriptor));
}

auto ServerManager::updateServer(ServerDescriptor descriptor) -> VoidResult
{
    auto const id = descriptor.id;
    if (auto updated = _registry.update(std::move(descriptor)); !updated)
        return updated;

    if (!isRunning(id))
        return {};

    log::info("Restarting MCP server '{}' with its new configuration", id);
    stopServer(id);
    return startServer(id);
}

auto ServerManager::removeServer(const std::string& id) -> VoidResult
{
    stopServer(id);
    clearError(id);
    return _registry.remove(id);
}

auto ServerManager::importServers(std::vector<ServerDescriptor> descriptors) -> Result<size_t>
{
    std::erase_if(descriptors, [](const ServerDescriptor& descriptor) {
        if (descriptor.id != BuiltinOwnerId)
            return false;
        log::warning("Skipping imported server with reserved id '{}'", descriptor.id);
        return true;
    });
    return _registry.importServers(std::move(descriptors));
}

// }}}
// {{{ supervision

void ServerManager::supervise(const std::stop_token& stopToken)
{
    while (!stopToken.stop_requested())
    {
        auto event = _events.waitPop(stopToken);
        if (!event)
            continue;

        handleEvent(*event);

        auto observer = EventObserver {};
        {
            auto const lock = std::lock_guard(_mutex);
            observer = _observer;
        }
        if (observer)
            observer(*event);
    }
}

auto ServerManager::currentConnection(const ConnectionEvent& event) const -> std::shared_ptr<Connection>
{
    auto current = connectionLocked(event.serverId);
    if (!current || current->session() != event.session)
        return nullptr;
    return current;
}

void ServerManager::handleEvent(const ConnectionEvent& event)
{
    auto connection = std::shared_ptr<Connection> {};
    {
        auto const lock = std::lock_guard(_mutex);
        connection = currentConnection(event);

        if (!connection)
        {
            auto const pending = _starting.find(event.serverId);
            auto const isStarting = pending != _starting.end() && pending->second.session == event.session;
            if (isStarting)
            {
                if (auto const* changed = std::get_if<ListChanged>(&event.payload))
                    pending->second.dirty.insert(changed->kind);
            }
            return;
        }
    }

    std::visit(Overloaded {
                   [&](const ListChanged& changed) { refresh(connection, changed.kind); },
                   [&](const Disconnected& disconnected) { reap(connection, disconnected); },
                   [&](const ResourceUpdated& updated) {
                       log::debug("[{}] Resource updated: {}", event.serverId, updated.uri);
                   },
                   [](const ProgressUpdated&) {},
                   [](const LogReceived&) {},
               },
               event.payload);
}

void ServerManager::refresh(const std::shared_ptr<Connection>& connection, CapabilityKind kind)
{
    auto const& id = connection->id();
    log::debug("[{}] Refreshing {} after list change", id, capabilityKindName(kind));

    switch (kind)
    {
        case CapabilityKind::Tools: {
            auto tools = connection->listTools();
            if (!tools)
            {
                log::warning("Could not refresh tools of '{}': {}", id, tools.error().message);
                return;
            }
            auto filtered = filterReserved(id, std::move(*tools));
            auto const lock = std::lock_guard(_mutex);
            if (connectionLocked(id) == connection)
                _catalog.replaceTools(id, std::move(filtered));
            break;
        }
        case CapabilityKind::Resources: {
            auto resources = connection->listResources();
            auto const lock = std::lock_guard(_mutex);
            if (connectionLocked(id) == connection)
                _catalog.replaceResources(id, std::move(resources));
            break;
        }
        case CapabilityKind::Prompts: {
            auto prompts = connection->listPrompts();
            auto const lock = std::lock_guard(_mutex);
            if (connectionLocked(id) == connection)
                _catalog.replacePrompts(id, std::move(prompts));
            break;
        }
    }
}

void ServerManager::reap(const std::shared_ptr<Connection>& connection, const Disconnected& disconnected)
{
    auto const& id = connection->id();
    {
        auto const lock = std::lock_guard(_mutex);
        auto const it = _connections.find(id);
        if (it == _connections.end() || it->second != connection)
            return;

        _connections.erase(it);
        _catalog.purgeOwner(id);
        if (disconnected.unexpected)
        {
            _errors[id] = "Server disconnected unexpectedly";
            _unexpectedDisconnects.insert(id);
        }
    }

    log::warning("MCP server '{}' disconnected{}: {}",
                 id,
                 disconnected.unexpected ? " unexpectedly" : "",
                 disconnected.reason);
    connection->stop();
}

// }}}

} // namespace mcphub

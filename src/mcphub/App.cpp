// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcphub
{

auto toServerManagerOptions(const AppConfig& config) -> ServerManagerOptions
{
    return ServerManagerOptions {
        .connection =
            ConnectionOptions {
                .clientName = config.client.name,
                .clientVersion = config.client.version,
                .protocolVersion = config.client.protocolVersion,
                .handshakeTimeout = config.timeouts.handshake,
                .discoveryTimeout = config.timeouts.discovery,
                .requestTimeout = config.timeouts.request,
                .toolCallTimeout = config.timeouts.toolCall,
            },
        .stopGrace = config.timeouts.stopGrace,
        .workspaceRoots = config.workspaceRoots,
    };
}

struct App::Impl
{
    AppConfig config;
    JsonFileServerStore store;
    ServerRegistry registry;
    BuiltinToolBridge builtins;
    ServerManager servers;

    Impl(AppConfig cfg, BuiltinServices services, TransportFactory transportFactory):
        config(std::move(cfg)),
        store(serversFilePath(config)),
        registry(store, legacyServersFilePath(config)),
        builtins(services, config.builtinTools),
        servers(registry, builtins, toServerManagerOptions(config), std::move(transportFactory))
    {
    }
};

App::App(AppConfig config, BuiltinServices services, TransportFactory transportFactory):
    _impl(std::make_unique<Impl>(std::move(config), services, std::move(transportFactory)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto loaded = _impl->registry.load();
    if (!loaded)
        return std::unexpected(loaded.error());

    log::info("Loaded {} MCP server(s) from {}", loaded->size(), _impl->store.path().string());
    if (_impl->registry.usedLegacyData())
        log::warning("Serving MCP servers from the legacy file; they could not be migrated");

    if (!_impl->config.mcpServers.empty())
    {
        auto imported = _impl->servers.importServers(_impl->config.mcpServers);
        if (!imported)
            log::warning("Failed to import servers from the config file: {}", imported.error().message);
        else if (*imported > 0)
            log::info("Imported {} MCP server(s) from the config file", *imported);
    }

    if (_impl->config.autoStart)
    {
        auto const started = _impl->servers.startAllServers();
        log::info("Started {} MCP server(s)", started);
    }

    return {};
}

auto App::config() const -> const AppConfig&
{
    return _impl->config;
}

auto App::store() -> ServerStore&
{
    return _impl->store;
}

auto App::registry() -> ServerRegistry&
{
    return _impl->registry;
}

auto App::builtins() -> BuiltinToolBridge&
{
    return _impl->builtins;
}

auto App::servers() -> ServerManager&
{
    return _impl->servers;
}

} // namespace mcphub

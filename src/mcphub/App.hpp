// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/BuiltinToolBridge.hpp>
#include <mcp/ServerManager.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcp/ServerStore.hpp>
#include <mcphub/Config.hpp>

#include <memory>

namespace mcphub
{

/// @brief Application context that owns and wires all long-lived components.
///
/// Created once per process. Components receive each other by reference from here,
/// so there is no global manager state.
class App
{
  public:
    /// @param config The application configuration.
    /// @param services Local services behind the builtin tools; must outlive the App.
    /// @param transportFactory Overrides how server transports are created.
    explicit App(AppConfig config, BuiltinServices services = {}, TransportFactory transportFactory = {});
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the registry, imports servers declared in the config file and,
    ///        with autoStart, starts every server.
    /// @return Success or the registry's storage error.
    [[nodiscard]] auto initialize() -> VoidResult;

    [[nodiscard]] auto config() const -> const AppConfig&;
    [[nodiscard]] auto store() -> ServerStore&;
    [[nodiscard]] auto registry() -> ServerRegistry&;
    [[nodiscard]] auto builtins() -> BuiltinToolBridge&;
    [[nodiscard]] auto servers() -> ServerManager&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Derives the server manager settings from the configuration.
[[nodiscard]] auto toServerManagerOptions(const AppConfig& config) -> ServerManagerOptions;

} // namespace mcphub

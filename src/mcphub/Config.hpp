// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerDescriptor.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Identity the client reports in its initialize request.
struct ClientConfig
{
    std::string name = "mcphub";
    std::string version = "0.1.0";
    std::string protocolVersion = "2024-11-05";
};

/// @brief Timeouts, all stored in milliseconds.
struct TimeoutConfig
{
    std::chrono::milliseconds handshake { 15000 };
    std::chrono::milliseconds discovery { 15000 };
    std::chrono::milliseconds toolCall { 60000 };
    std::chrono::milliseconds request { 15000 };

    /// @brief How long a stopping server may take to exit before it is killed.
    std::chrono::milliseconds stopGrace { 5000 };
};

/// @brief Where server descriptors are persisted.
struct StorageConfig
{
    std::string serversFile;
    std::string legacyServersFile;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ClientConfig client;
    TimeoutConfig timeouts;
    StorageConfig storage;

    /// @brief Enabled flag per builtin tool name. Unlisted builtins are enabled.
    std::map<std::string, bool> builtinTools;

    /// @brief Directories answered to roots/list.
    std::vector<std::string> workspaceRoots;

    /// @brief Start every registered server at launch instead of on demand.
    bool autoStart = false;

    /// @brief Log level name ("error", "warning", "info", "debug", "trace").
    std::string logLevel = "info";

    /// @brief Servers declared inline in the config file, tagged as dotfile imports.
    std::vector<ServerDescriptor> mcpServers;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document. Missing keys keep their defaults.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or a ConfigError.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory.
/// $XDG_CONFIG_HOME/mcphub or ~/.config/mcphub
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory.
/// $XDG_DATA_HOME/mcphub or ~/.local/share/mcphub
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the configured servers file, or its default under the data directory.
[[nodiscard]] auto serversFilePath(const AppConfig& config) -> std::string;

/// @brief Returns the configured legacy servers file, or its default under the data directory.
[[nodiscard]] auto legacyServersFilePath(const AppConfig& config) -> std::string;

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcphub
{

namespace
{
    auto getMillisecondsOr(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> std::chrono::milliseconds
    {
        auto keyStr = std::string(key);
        if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer()
            && obj[keyStr].get<int64_t>() >= 0)
            return std::chrono::milliseconds(obj[keyStr].get<int64_t>());
        return defaultValue;
    }

    auto sectionOf(const nlohmann::json& root, std::string_view key) -> Result<nlohmann::json>
    {
        auto keyStr = std::string(key);
        if (!root.contains(keyStr))
            return nlohmann::json::object();
        if (!root[keyStr].is_object())
            return makeError(ErrorCode::ConfigError, std::format("Config section '{}' must be an object", key));
        return root[keyStr];
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcphub";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcphub";
    return ".";
}

auto defaultDataDir() -> std::string
{
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && *xdgData)
        return std::string(xdgData) + "/mcphub";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/mcphub";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto serversFilePath(const AppConfig& config) -> std::string
{
    if (!config.storage.serversFile.empty())
        return config.storage.serversFile;
    return defaultDataDir() + "/servers.json";
}

auto legacyServersFilePath(const AppConfig& config) -> std::string
{
    if (!config.storage.legacyServersFile.empty())
        return config.storage.legacyServersFile;
    return defaultDataDir() + "/mcp-servers.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config document must be a JSON object");

    auto config = AppConfig {};

    // Client section
    auto const client = sectionOf(root, "client");
    if (!client)
        return std::unexpected(client.error());
    config.client.name = json::getStringOr(*client, "name", config.client.name);
    config.client.version = json::getStringOr(*client, "version", config.client.version);
    config.client.protocolVersion = json::getStringOr(*client, "protocolVersion", config.client.protocolVersion);

    // Timeouts section
    auto const timeouts = sectionOf(root, "timeouts");
    if (!timeouts)
        return std::unexpected(timeouts.error());
    config.timeouts.handshake = getMillisecondsOr(*timeouts, "handshake", config.timeouts.handshake);
    config.timeouts.discovery = getMillisecondsOr(*timeouts, "discovery", config.timeouts.discovery);
    config.timeouts.toolCall = getMillisecondsOr(*timeouts, "toolCall", config.timeouts.toolCall);
    config.timeouts.request = getMillisecondsOr(*timeouts, "request", config.timeouts.request);
    config.timeouts.stopGrace = getMillisecondsOr(*timeouts, "stopGrace", config.timeouts.stopGrace);

    // Storage section
    auto const storage = sectionOf(root, "storage");
    if (!storage)
        return std::unexpected(storage.error());
    config.storage.serversFile = json::getStringOr(*storage, "serversFile", "");
    config.storage.legacyServersFile = json::getStringOr(*storage, "legacyServersFile", "");

    // Builtin tools section
    auto const builtinTools = sectionOf(root, "builtinTools");
    if (!builtinTools)
        return std::unexpected(builtinTools.error());
    for (const auto& [name, enabled]: builtinTools->items())
    {
        if (!enabled.is_boolean())
            return makeError(ErrorCode::ConfigError, std::format("builtinTools.{} must be a boolean", name));
        config.builtinTools[name] = enabled.get<bool>();
    }

    config.workspaceRoots = json::getStringArray(root, "workspaceRoots");
    config.autoStart = json::getBoolOr(root, "autoStart", false);
    config.logLevel = json::getStringOr(root, "logLevel", config.logLevel);

    // MCP servers section
    if (root.contains("mcpServers"))
    {
        auto servers = parseMcpServersConfig(root["mcpServers"], DiscoverySource::Dotfile);
        if (!servers)
            return makeError(ErrorCode::ConfigError, std::format("Invalid mcpServers: {}", servers.error().message));
        config.mcpServers = std::move(*servers);
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    return parseConfig(ss.str()).transform_error([&](Error error) {
        return Error { ErrorCode::ConfigError, std::format("{}: {}", path, error.message) };
    });
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["client"] = {
        { "name", config.client.name },
        { "version", config.client.version },
        { "protocolVersion", config.client.protocolVersion },
    };

    root["timeouts"] = {
        { "handshake", config.timeouts.handshake.count() },
        { "discovery", config.timeouts.discovery.count() },
        { "toolCall", config.timeouts.toolCall.count() },
        { "request", config.timeouts.request.count() },
        { "stopGrace", config.timeouts.stopGrace.count() },
    };

    auto storage = nlohmann::json::object();
    if (!config.storage.serversFile.empty())
        storage["serversFile"] = config.storage.serversFile;
    if (!config.storage.legacyServersFile.empty())
        storage["legacyServersFile"] = config.storage.legacyServersFile;
    root["storage"] = std::move(storage);

    auto builtinTools = nlohmann::json::object();
    for (const auto& [name, enabled]: config.builtinTools)
        builtinTools[name] = enabled;
    root["builtinTools"] = std::move(builtinTools);

    root["workspaceRoots"] = config.workspaceRoots;
    root["autoStart"] = config.autoStart;
    root["logLevel"] = config.logLevel;

    // MCP servers section
    if (!config.mcpServers.empty())
    {
        auto servers = nlohmann::json::object();
        for (const auto& descriptor: config.mcpServers)
        {
            auto server = nlohmann::json::object();
            server["command"] = descriptor.command;
            if (!descriptor.args.empty())
                server["args"] = descriptor.args;
            if (!descriptor.env.empty())
                server["env"] = descriptor.env;
            if (!descriptor.workingDirectory.empty())
                server["cwd"] = descriptor.workingDirectory;
            servers[descriptor.id] = std::move(server);
        }
        root["mcpServers"] = std::move(servers);
    }

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::ConfigError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Where a server configuration was imported from.
enum class DiscoverySource
{
    Manual,
    ClaudeDesktop,
    Cursor,
    ClaudeCode,
    VSCode,
    Dotfile,
};

/// @brief Returns the persisted tag of a discovery source ("claude_desktop", ...).
[[nodiscard]] constexpr auto discoverySourceTag(DiscoverySource source) -> std::string_view
{
    switch (source)
    {
        case DiscoverySource::Manual: return "manual";
        case DiscoverySource::ClaudeDesktop: return "claude_desktop";
        case DiscoverySource::Cursor: return "cursor";
        case DiscoverySource::ClaudeCode: return "claude_code";
        case DiscoverySource::VSCode: return "vscode";
        case DiscoverySource::Dotfile: return "dotfile";
    }
    return "manual";
}

/// @brief Returns a human-readable name of a discovery source.
[[nodiscard]] constexpr auto discoverySourceDisplayName(DiscoverySource source) -> std::string_view
{
    switch (source)
    {
        case DiscoverySource::Manual: return "Manual";
        case DiscoverySource::ClaudeDesktop: return "Claude Desktop";
        case DiscoverySource::Cursor: return "Cursor";
        case DiscoverySource::ClaudeCode: return "Claude Code";
        case DiscoverySource::VSCode: return "VS Code";
        case DiscoverySource::Dotfile: return "Project Config";
    }
    return "Manual";
}

/// @brief Parses a persisted discovery-source tag.
[[nodiscard]] auto discoverySourceFromTag(std::string_view tag) -> std::optional<DiscoverySource>;

/// @brief Launch configuration of one MCP server. Updates replace it wholesale.
struct ServerDescriptor
{
    std::string id;
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::string workingDirectory;
    std::map<std::string, std::string> env;
    DiscoverySource source = DiscoverySource::Manual;

    auto operator==(const ServerDescriptor&) const -> bool = default;
};

/// @brief Serializes a descriptor to the store's record format.
[[nodiscard]] auto toJson(const ServerDescriptor& descriptor) -> nlohmann::json;

/// @brief Deserializes a store record. `id` and `command` are required.
[[nodiscard]] auto descriptorFromJson(const nlohmann::json& record) -> Result<ServerDescriptor>;

/// @brief Parses the legacy flat-file format: a JSON array of server objects.
///
/// Legacy records carry an optional file URL in `path` that serves as the working
/// directory when `workingDirectory` is absent. Entries that cannot be parsed are
/// skipped with a warning; a document that is not an array is an error.
[[nodiscard]] auto parseLegacyServers(const nlohmann::json& document) -> Result<std::vector<ServerDescriptor>>;

/// @brief Parses the common `{"mcpServers": {"<id>": {command, args, env, cwd}}}` shape.
///
/// The top-level `mcpServers` wrapper is optional. Entries without a command are
/// skipped with a warning.
[[nodiscard]] auto parseMcpServersConfig(const nlohmann::json& document, DiscoverySource source)
    -> Result<std::vector<ServerDescriptor>>;

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#include "ServerDescriptor.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcphub
{

namespace
{
    auto pathFromFileUrl(std::string_view url) -> std::string
    {
        constexpr auto scheme = std::string_view { "file://" };
        if (url.starts_with(scheme))
            url.remove_prefix(scheme.size());
        while (url.size() > 1 && url.ends_with('/'))
            url.remove_suffix(1);
        return std::string(url);
    }
} // namespace

auto discoverySourceFromTag(std::string_view tag) -> std::optional<DiscoverySource>
{
    for (auto const source: { DiscoverySource::Manual,
                              DiscoverySource::ClaudeDesktop,
                              DiscoverySource::Cursor,
                              DiscoverySource::ClaudeCode,
                              DiscoverySource::VSCode,
                              DiscoverySource::Dotfile })
    {
        if (discoverySourceTag(source) == tag)
            return source;
    }
    return std::nullopt;
}

auto toJson(const ServerDescriptor& descriptor) -> nlohmann::json
{
    auto record = nlohmann::json {
        { "id", descriptor.id },
        { "name", descriptor.name },
        { "description", descriptor.description },
        { "command", descriptor.command },
        { "args", descriptor.args },
        { "env", descriptor.env },
        { "sourceConfig", discoverySourceTag(descriptor.source) },
    };

    if (!descriptor.workingDirectory.empty())
        record["workingDirectory"] = descriptor.workingDirectory;

    return record;
}

auto descriptorFromJson(const nlohmann::json& record) -> Result<ServerDescriptor>
{
    if (!record.is_object())
        return makeError(ErrorCode::StorageError, "Server record is not an object");

    auto id = json::getString(record, "id");
    if (!id)
        return makeError(ErrorCode::StorageError, "Server record has no id");

    auto command = json::getString(record, "command");
    if (!command)
        return makeError(ErrorCode::StorageError, std::format("Server record '{}' has no command", *id));

    auto descriptor = ServerDescriptor {
        .id = *id,
        .name = json::getStringOr(record, "name", *id),
        .description = json::getStringOr(record, "description", ""),
        .command = *command,
        .args = json::getStringArray(record, "args"),
        .workingDirectory = json::getStringOr(record, "workingDirectory", ""),
        .env = json::getStringMap(record, "env"),
    };

    auto const tag = json::getStringOr(record, "sourceConfig", "manual");
    descriptor.source = discoverySourceFromTag(tag).value_or(DiscoverySource::Manual);

    return descriptor;
}

auto parseLegacyServers(const nlohmann::json& document) -> Result<std::vector<ServerDescriptor>>
{
    if (!document.is_array())
        return makeError(ErrorCode::StorageError, "Legacy server file is not a JSON array");

    auto servers = std::vector<ServerDescriptor> {};
    for (auto const& record: document)
    {
        auto descriptor = descriptorFromJson(record);
        if (!descriptor)
        {
            log::warning("Skipping legacy server entry: {}", descriptor.error().message);
            continue;
        }

        if (descriptor->workingDirectory.empty())
        {
            auto const legacyPath = json::getStringOr(record, "path", "");
            if (!legacyPath.empty())
                descriptor->workingDirectory = pathFromFileUrl(legacyPath);
        }

        servers.push_back(std::move(*descriptor));
    }
    return servers;
}

auto parseMcpServersConfig(const nlohmann::json& document, DiscoverySource source)
    -> Result<std::vector<ServerDescriptor>>
{
    if (!document.is_object())
        return makeError(ErrorCode::ConfigError, "Server configuration is not a JSON object");

    auto const& servers = document.contains("mcpServers") ? document["mcpServers"] : document;
    if (!servers.is_object())
        return makeError(ErrorCode::ConfigError, "'mcpServers' is not a JSON object");

    auto result = std::vector<ServerDescriptor> {};
    for (auto const& [id, entry]: servers.items())
    {
        auto command = json::getString(entry, "command");
        if (!command)
        {
            log::warning("Skipping MCP server '{}': no command configured", id);
            continue;
        }

        auto workingDirectory = json::getStringOr(entry, "cwd", "");
        if (workingDirectory.empty())
            workingDirectory = json::getStringOr(entry, "workingDirectory", "");

        result.push_back(ServerDescriptor {
            .id = id,
            .name = json::getStringOr(entry, "name", id),
            .description = json::getStringOr(
                entry, "description", std::format("Imported from {}", discoverySourceDisplayName(source))),
            .command = *command,
            .args = json::getStringArray(entry, "args"),
            .workingDirectory = std::move(workingDirectory),
            .env = json::getStringMap(entry, "env"),
            .source = source,
        });
    }
    return result;
}

} // namespace mcphub

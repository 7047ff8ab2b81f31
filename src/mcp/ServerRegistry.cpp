// SPDX-License-Identifier: Apache-2.0
#include "ServerRegistry.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace mcphub
{

ServerRegistry::ServerRegistry(ServerStore& store, std::filesystem::path legacyFile):
    _store(store), _legacyFile(std::move(legacyFile))
{
}

auto ServerRegistry::load() -> Result<std::vector<ServerDescriptor>>
{
    auto const lock = std::lock_guard(_mutex);
    _usedLegacyData = false;

    auto stored = _store.fetchAll();
    if (!stored)
    {
        log::error("Failed to load MCP servers from store: {}", stored.error().message);

        auto legacy = loadLegacy();
        if (!legacy || legacy->empty())
            return std::unexpected(stored.error());

        log::warning("Recovered {} MCP server(s) from legacy file {}", legacy->size(), _legacyFile.string());
        _servers = std::move(*legacy);
        _usedLegacyData = true;
        return _servers;
    }

    if (!stored->empty())
    {
        _servers = std::move(*stored);
        log::debug("Loaded {} MCP server(s) from store", _servers.size());
        return _servers;
    }

    auto legacy = loadLegacy();
    if (!legacy)
    {
        log::warning("Ignoring legacy MCP server file: {}", legacy.error().message);
        _servers.clear();
        return _servers;
    }

    if (legacy->empty())
    {
        _servers.clear();
        return _servers;
    }

    log::info("Migrating {} MCP server(s) from legacy file {}", legacy->size(), _legacyFile.string());

    auto saved = std::vector<std::string> {};
    auto migrated = true;
    for (auto const& descriptor: *legacy)
    {
        if (auto result = _store.save(descriptor); !result)
        {
            log::error("Failed to migrate MCP server '{}': {}", descriptor.id, result.error().message);
            migrated = false;
            break;
        }
        saved.push_back(descriptor.id);
    }

    if (migrated)
        log::info("MCP server migration complete. Legacy file kept as backup at {}", _legacyFile.string());
    else
    {
        // Leave the store empty so the next load migrates the legacy file again.
        for (auto const& id: saved)
        {
            if (auto removed = _store.remove(id); !removed)
                log::error("Failed to roll back migrated MCP server '{}': {}", id, removed.error().message);
        }
        log::warning("MCP server migration incomplete, serving legacy data directly");
    }

    _servers = std::move(*legacy);
    _usedLegacyData = !migrated;
    return _servers;
}

auto ServerRegistry::servers() const -> std::vector<ServerDescriptor>
{
    auto const lock = std::lock_guard(_mutex);
    return _servers;
}

auto ServerRegistry::find(const std::string& id) const -> std::optional<ServerDescriptor>
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find(_servers, id, &ServerDescriptor::id);
    if (it == _servers.end())
        return std::nullopt;
    return *it;
}

auto ServerRegistry::add(ServerDescriptor descriptor) -> VoidResult
{
    if (auto valid = validate(descriptor); !valid)
        return valid;

    auto const lock = std::lock_guard(_mutex);
    if (std::ranges::find(_servers, descriptor.id, &ServerDescriptor::id) != _servers.end())
        return makeError(ErrorCode::InvalidArgument, std::format("Server '{}' already exists", descriptor.id));

    return _store.save(descriptor).transform([&] {
        log::info("Added MCP server '{}'", descriptor.id);
        _servers.push_back(std::move(descriptor));
    });
}

auto ServerRegistry::update(ServerDescriptor descriptor) -> VoidResult
{
    if (auto valid = validate(descriptor); !valid)
        return valid;

    auto const lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find(_servers, descriptor.id, &ServerDescriptor::id);
    if (it == _servers.end())
        return makeError(ErrorCode::NotFound, std::format("Unknown server: {}", descriptor.id));

    return _store.save(descriptor).transform([&] { *it = std::move(descriptor); });
}

auto ServerRegistry::remove(const std::string& id) -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find(_servers, id, &ServerDescriptor::id);
    if (it == _servers.end())
        return makeError(ErrorCode::NotFound, std::format("Unknown server: {}", id));

    return _store.remove(id).transform([&] {
        _servers.erase(it);
        log::info("Removed MCP server '{}'", id);
    });
}

auto ServerRegistry::importServers(std::vector<ServerDescriptor> descriptors) -> Result<size_t>
{
    auto const lock = std::lock_guard(_mutex);

    size_t added = 0;
    for (auto& descriptor: descriptors)
    {
        if (std::ranges::find(_servers, descriptor.id, &ServerDescriptor::id) != _servers.end())
        {
            log::debug("Skipping import of existing MCP server '{}'", descriptor.id);
            continue;
        }

        if (auto valid = validate(descriptor); !valid)
        {
            log::warning("Skipping import of MCP server '{}': {}", descriptor.id, valid.error().message);
            continue;
        }

        if (auto saved = _store.save(descriptor); !saved)
            return std::unexpected(saved.error());

        _servers.push_back(std::move(descriptor));
        ++added;
    }

    return added;
}

auto ServerRegistry::usedLegacyData() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _usedLegacyData;
}

auto ServerRegistry::loadLegacy() const -> Result<std::vector<ServerDescriptor>>
{
    auto ec = std::error_code {};
    if (_legacyFile.empty() || !std::filesystem::exists(_legacyFile, ec))
        return std::vector<ServerDescriptor> {};

    auto file = std::ifstream(_legacyFile);
    if (!file)
        return makeError(ErrorCode::StorageError, std::format("Cannot open {}", _legacyFile.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    return json::parse(ss.str())
        .transform_error([this](Error error) {
            error.code = ErrorCode::StorageError;
            error.message = std::format("{}: {}", _legacyFile.string(), error.message);
            return error;
        })
        .and_then([](const nlohmann::json& document) { return parseLegacyServers(document); });
}

auto ServerRegistry::validate(const ServerDescriptor& descriptor) -> VoidResult
{
    if (descriptor.id.empty())
        return makeError(ErrorCode::InvalidArgument, "Server id must not be empty");
    if (descriptor.command.empty())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Server '{}' has no command", descriptor.id));
    return {};
}

} // namespace mcphub

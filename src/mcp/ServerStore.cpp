// SPDX-License-Identifier: Apache-2.0
#include "ServerStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace mcphub
{

namespace
{
    constexpr auto StoreVersion = 1;
} // namespace

JsonFileServerStore::JsonFileServerStore(std::filesystem::path path): _path(std::move(path))
{
}

auto JsonFileServerStore::fetchAll() -> Result<std::vector<ServerDescriptor>>
{
    auto const lock = std::lock_guard(_mutex);
    return readLocked();
}

auto JsonFileServerStore::save(const ServerDescriptor& descriptor) -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);
    return readLocked().and_then([&](std::vector<ServerDescriptor> servers) -> VoidResult {
        auto const it = std::ranges::find(servers, descriptor.id, &ServerDescriptor::id);
        if (it != servers.end())
            *it = descriptor;
        else
            servers.push_back(descriptor);
        return writeLocked(servers);
    });
}

auto JsonFileServerStore::remove(const std::string& id) -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);
    return readLocked().and_then([&](std::vector<ServerDescriptor> servers) -> VoidResult {
        auto const erased = std::erase_if(servers, [&](auto const& s) { return s.id == id; });
        if (erased == 0)
            return {};
        return writeLocked(servers);
    });
}

auto JsonFileServerStore::readLocked() -> Result<std::vector<ServerDescriptor>>
{
    auto servers = std::vector<ServerDescriptor> {};

    auto ec = std::error_code {};
    if (!std::filesystem::exists(_path, ec))
        return servers;

    auto file = std::ifstream(_path);
    if (!file)
        return makeError(ErrorCode::StorageError, std::format("Cannot open server store: {}", _path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto document = json::parse(ss.str());
    if (!document)
        return makeError(ErrorCode::StorageError,
                         std::format("Corrupt server store {}: {}", _path.string(), document.error().message));

    if (!document->is_object() || !document->contains("servers") || !(*document)["servers"].is_array())
        return makeError(ErrorCode::StorageError,
                         std::format("Server store {} has no 'servers' array", _path.string()));

    for (auto const& record: (*document)["servers"])
    {
        auto descriptor = descriptorFromJson(record);
        if (!descriptor)
        {
            log::warning("Skipping stored server: {}", descriptor.error().message);
            continue;
        }
        servers.push_back(std::move(*descriptor));
    }

    return servers;
}

auto JsonFileServerStore::writeLocked(const std::vector<ServerDescriptor>& servers) -> VoidResult
{
    auto document = nlohmann::json {
        { "version", StoreVersion },
        { "servers", nlohmann::json::array() },
    };
    for (auto const& server: servers)
        document["servers"].push_back(toJson(server));

    auto ec = std::error_code {};
    if (_path.has_parent_path())
    {
        std::filesystem::create_directories(_path.parent_path(), ec);
        if (ec)
            return makeError(ErrorCode::StorageError,
                             std::format("Cannot create directory {}: {}", _path.parent_path().string(), ec.message()));
    }

    auto tempPath = _path;
    tempPath += ".tmp";

    {
        auto file = std::ofstream(tempPath, std::ios::trunc);
        if (!file)
            return makeError(ErrorCode::StorageError, std::format("Cannot write {}", tempPath.string()));
        file << document.dump(2) << '\n';
        if (!file.flush())
            return makeError(ErrorCode::StorageError, std::format("Failed writing {}", tempPath.string()));
    }

    std::filesystem::rename(tempPath, _path, ec);
    if (ec)
        return makeError(ErrorCode::StorageError,
                         std::format("Cannot replace {}: {}", _path.string(), ec.message()));

    return {};
}

} // namespace mcphub

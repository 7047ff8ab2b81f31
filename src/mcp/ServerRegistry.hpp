// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerDescriptor.hpp>
#include <mcp/ServerStore.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief CRUD layer over persisted server descriptors.
///
/// Keeps an in-memory copy of the store's contents. On first load it migrates a
/// legacy flat file into an empty store. A failed migration still yields the legacy
/// servers, so a working configuration is never lost.
class ServerRegistry
{
  public:
    /// @param store Persistent storage; must outlive the registry.
    /// @param legacyFile Path of the legacy flat-file configuration (may not exist).
    ServerRegistry(ServerStore& store, std::filesystem::path legacyFile);

    /// @brief Loads all descriptors, migrating the legacy file if the store is empty.
    /// @return The loaded descriptors, or a StorageError if neither source is readable.
    [[nodiscard]] auto load() -> Result<std::vector<ServerDescriptor>>;

    [[nodiscard]] auto servers() const -> std::vector<ServerDescriptor>;
    [[nodiscard]] auto find(const std::string& id) const -> std::optional<ServerDescriptor>;

    /// @brief Registers a new server. The id must be unused and the command non-empty.
    [[nodiscard]] auto add(ServerDescriptor descriptor) -> VoidResult;

    /// @brief Replaces the descriptor with the same id.
    [[nodiscard]] auto update(ServerDescriptor descriptor) -> VoidResult;

    /// @brief Deletes the descriptor with @p id.
    [[nodiscard]] auto remove(const std::string& id) -> VoidResult;

    /// @brief Adds every descriptor whose id is not registered yet.
    /// @return The number of descriptors added.
    [[nodiscard]] auto importServers(std::vector<ServerDescriptor> descriptors) -> Result<size_t>;

    /// @brief Returns true if the last load() served data from the legacy file.
    [[nodiscard]] auto usedLegacyData() const -> bool;

  private:
    [[nodiscard]] auto loadLegacy() const -> Result<std::vector<ServerDescriptor>>;
    [[nodiscard]] static auto validate(const ServerDescriptor& descriptor) -> VoidResult;

    ServerStore& _store;
    std::filesystem::path _legacyFile;

    mutable std::mutex _mutex;
    std::vector<ServerDescriptor> _servers;
    bool _usedLegacyData = false;
};

} // namespace mcphub

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerDescriptor.hpp>

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Persistent CRUD storage of server descriptors.
class ServerStore
{
  public:
    virtual ~ServerStore() = default;

    /// @brief Loads every stored descriptor, in insertion order.
    [[nodiscard]] virtual auto fetchAll() -> Result<std::vector<ServerDescriptor>> = 0;

    /// @brief Inserts @p descriptor or replaces the record with the same id.
    [[nodiscard]] virtual auto save(const ServerDescriptor& descriptor) -> VoidResult = 0;

    /// @brief Deletes the record with @p id. Deleting a missing id is not an error.
    [[nodiscard]] virtual auto remove(const std::string& id) -> VoidResult = 0;
};

/// @brief ServerStore backed by a single JSON document on disk.
///
/// The document has the shape `{"version": 1, "servers": [<record>...]}`. Every write
/// replaces the file atomically through a temporary sibling. A missing file is an
/// empty store.
class JsonFileServerStore: public ServerStore
{
  public:
    explicit JsonFileServerStore(std::filesystem::path path);

    [[nodiscard]] auto fetchAll() -> Result<std::vector<ServerDescriptor>> override;
    [[nodiscard]] auto save(const ServerDescriptor& descriptor) -> VoidResult override;
    [[nodiscard]] auto remove(const std::string& id) -> VoidResult override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    [[nodiscard]] auto readLocked() -> Result<std::vector<ServerDescriptor>>;
    [[nodiscard]] auto writeLocked(const std::vector<ServerDescriptor>& servers) -> VoidResult;

    std::filesystem::path _path;
    std::mutex _mutex;
};

} // namespace mcphub

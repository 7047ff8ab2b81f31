// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mcphub
{

/// @brief Owner-tagged collection of discovered tools, resources and prompts.
///
/// Descriptors are keyed by (owner connection id, name or uri). A refresh replaces
/// an owner's subset wholesale, so deletions on the provider side propagate.
/// The catalog is not synchronized; its owner serializes access.
class ToolCatalog
{
  public:
    void replaceTools(const std::string& owner, std::vector<ToolDescriptor> tools);
    void replaceResources(const std::string& owner, std::vector<ResourceDescriptor> resources);
    void replacePrompts(const std::string& owner, std::vector<PromptDescriptor> prompts);

    /// @brief Removes every descriptor owned by @p owner.
    void purgeOwner(const std::string& owner);

    [[nodiscard]] auto tools() const -> std::vector<ToolDescriptor>;
    [[nodiscard]] auto resources() const -> std::vector<ResourceDescriptor>;
    [[nodiscard]] auto prompts() const -> std::vector<PromptDescriptor>;

    [[nodiscard]] auto toolsOwnedBy(const std::string& owner) const -> std::vector<ToolDescriptor>;

    /// @brief Looks a tool up by name. With duplicates across owners the first owner
    ///        in id order wins.
    [[nodiscard]] auto findTool(const std::string& name) const -> std::optional<ToolDescriptor>;
    [[nodiscard]] auto findResource(const std::string& uri) const -> std::optional<ResourceDescriptor>;
    [[nodiscard]] auto findPrompt(const std::string& name) const -> std::optional<PromptDescriptor>;

    /// @brief Returns the ids of every owner with at least one descriptor.
    [[nodiscard]] auto owners() const -> std::set<std::string>;

    [[nodiscard]] auto empty() const -> bool;

  private:
    using Key = std::pair<std::string, std::string>;

    std::map<Key, ToolDescriptor> _tools;
    std::map<Key, ResourceDescriptor> _resources;
    std::map<Key, PromptDescriptor> _prompts;
};

} // namespace mcphub

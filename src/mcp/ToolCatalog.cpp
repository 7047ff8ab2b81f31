// SPDX-License-Identifier: Apache-2.0
#include "ToolCatalog.hpp"

namespace mcphub
{

namespace
{
    template <typename Descriptor>
    void eraseOwner(std::map<std::pair<std::string, std::string>, Descriptor>& table, const std::string& owner)
    {
        auto it = table.lower_bound({ owner, std::string {} });
        while (it != table.end() && it->first.first == owner)
            it = table.erase(it);
    }

    template <typename Descriptor>
    auto valuesOf(const std::map<std::pair<std::string, std::string>, Descriptor>& table)
        -> std::vector<Descriptor>
    {
        auto values = std::vector<Descriptor> {};
        values.reserve(table.size());
        for (auto const& [key, descriptor]: table)
            values.push_back(descriptor);
        return values;
    }

    template <typename Descriptor>
    auto findBy(const std::map<std::pair<std::string, std::string>, Descriptor>& table, const std::string& name)
        -> std::optional<Descriptor>
    {
        for (auto const& [key, descriptor]: table)
        {
            if (key.second == name)
                return descriptor;
        }
        return std::nullopt;
    }
} // namespace

void ToolCatalog::replaceTools(const std::string& owner, std::vector<ToolDescriptor> tools)
{
    eraseOwner(_tools, owner);
    for (auto& tool: tools)
    {
        tool.ownerConnectionId = owner;
        auto key = Key { owner, tool.name };
        _tools.insert_or_assign(std::move(key), std::move(tool));
    }
}

void ToolCatalog::replaceResources(const std::string& owner, std::vector<ResourceDescriptor> resources)
{
    eraseOwner(_resources, owner);
    for (auto& resource: resources)
    {
        resource.ownerConnectionId = owner;
        auto key = Key { owner, resource.uri };
        _resources.insert_or_assign(std::move(key), std::move(resource));
    }
}

void ToolCatalog::replacePrompts(const std::string& owner, std::vector<PromptDescriptor> prompts)
{
    eraseOwner(_prompts, owner);
    for (auto& prompt: prompts)
    {
        prompt.ownerConnectionId = owner;
        auto key = Key { owner, prompt.name };
        _prompts.insert_or_assign(std::move(key), std::move(prompt));
    }
}

void ToolCatalog::purgeOwner(const std::string& owner)
{
    eraseOwner(_tools, owner);
    eraseOwner(_resources, owner);
    eraseOwner(_prompts, owner);
}

auto ToolCatalog::tools() const -> std::vector<ToolDescriptor>
{
    return valuesOf(_tools);
}

auto ToolCatalog::resources() const -> std::vector<ResourceDescriptor>
{
    return valuesOf(_resources);
}

auto ToolCatalog::prompts() const -> std::vector<PromptDescriptor>
{
    return valuesOf(_prompts);
}

auto ToolCatalog::toolsOwnedBy(const std::string& owner) const -> std::vector<ToolDescriptor>
{
    auto result = std::vector<ToolDescriptor> {};
    for (auto it = _tools.lower_bound({ owner, std::string {} }); it != _tools.end() && it->first.first == owner;
         ++it)
        result.push_back(it->second);
    return result;
}

auto ToolCatalog::findTool(const std::string& name) const -> std::optional<ToolDescriptor>
{
    return findBy(_tools, name);
}

auto ToolCatalog::findResource(const std::string& uri) const -> std::optional<ResourceDescriptor>
{
    return findBy(_resources, uri);
}

auto ToolCatalog::findPrompt(const std::string& name) const -> std::optional<PromptDescriptor>
{
    return findBy(_prompts, name);
}

auto ToolCatalog::owners() const -> std::set<std::string>
{
    auto result = std::set<std::string> {};
    for (auto const& [key, _]: _tools)
        result.insert(key.first);
    for (auto const& [key, _]: _resources)
        result.insert(key.first);
    for (auto const& [key, _]: _prompts)
        result.insert(key.first);
    return result;
}

auto ToolCatalog::empty() const -> bool
{
    return _tools.empty() && _resources.empty() && _prompts.empty();
}

} // namespace mcphub

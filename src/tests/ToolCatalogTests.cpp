// SPDX-License-Identifier: Apache-2.0
#include <mcp/ToolCatalog.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace mcphub;

namespace
{

auto tool(std::string name) -> ToolDescriptor
{
    return ToolDescriptor { .name = std::move(name), .description = "test tool" };
}

auto namesOf(const std::vector<ToolDescriptor>& tools) -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (auto const& t: tools)
        names.push_back(t.name);
    std::ranges::sort(names);
    return names;
}

} // namespace

TEST_CASE("ToolCatalog starts empty", "[catalog]")
{
    auto catalog = ToolCatalog {};
    CHECK(catalog.empty());
    CHECK(catalog.tools().empty());
    CHECK(catalog.owners().empty());
    CHECK(!catalog.findTool("anything").has_value());
}

TEST_CASE("ToolCatalog tags descriptors with their owner", "[catalog]")
{
    auto catalog = ToolCatalog {};
    auto stray = tool("read_file");
    stray.ownerConnectionId = "someone-else";
    catalog.replaceTools("files", { stray });

    auto found = catalog.findTool("read_file");
    REQUIRE(found.has_value());
    CHECK(found->ownerConnectionId == "files");
    CHECK(catalog.owners() == std::set<std::string> { "files" });
}

TEST_CASE("ToolCatalog replaces an owner's tools instead of merging", "[catalog]")
{
    auto catalog = ToolCatalog {};
    catalog.replaceTools("files", { tool("read_file"), tool("write_file") });
    catalog.replaceTools("web", { tool("fetch") });

    catalog.replaceTools("files", { tool("list_dir") });

    CHECK(namesOf(catalog.toolsOwnedBy("files")) == std::vector<std::string> { "list_dir" });
    CHECK(namesOf(catalog.tools()) == std::vector<std::string> { "fetch", "list_dir" });
    CHECK(!catalog.findTool("read_file").has_value());

    SECTION("an empty list removes the owner")
    {
        catalog.replaceTools("files", {});
        CHECK(catalog.toolsOwnedBy("files").empty());
        CHECK(catalog.owners() == std::set<std::string> { "web" });
    }
}

TEST_CASE("ToolCatalog purges every kind of descriptor of an owner", "[catalog]")
{
    auto catalog = ToolCatalog {};
    catalog.replaceTools("files", { tool("read_file") });
    catalog.replaceResources("files", { ResourceDescriptor { .uri = "file:///a", .name = "a" } });
    catalog.replacePrompts("files", { PromptDescriptor { .name = "summarize" } });
    catalog.replaceTools("web", { tool("fetch") });

    catalog.purgeOwner("files");

    CHECK(catalog.resources().empty());
    CHECK(catalog.prompts().empty());
    CHECK(namesOf(catalog.tools()) == std::vector<std::string> { "fetch" });
    CHECK(!catalog.empty());

    catalog.purgeOwner("web");
    CHECK(catalog.empty());

    // Purging an unknown owner is harmless
    catalog.purgeOwner("missing");
    CHECK(catalog.empty());
}

TEST_CASE("ToolCatalog resolves duplicate names to the first owner in id order", "[catalog]")
{
    auto catalog = ToolCatalog {};
    catalog.replaceTools("zeta", { tool("search") });
    catalog.replaceTools("alpha", { tool("search") });

    CHECK(catalog.tools().size() == 2);
    auto found = catalog.findTool("search");
    REQUIRE(found.has_value());
    CHECK(found->ownerConnectionId == "alpha");

    catalog.purgeOwner("alpha");
    found = catalog.findTool("search");
    REQUIRE(found.has_value());
    CHECK(found->ownerConnectionId == "zeta");
}

TEST_CASE("ToolCatalog finds resources by uri and prompts by name", "[catalog]")
{
    auto catalog = ToolCatalog {};
    catalog.replaceResources("docs",
                             { ResourceDescriptor { .uri = "docs://readme", .name = "README", .mimeType = "text/plain" } });
    catalog.replacePrompts("docs", { PromptDescriptor { .name = "explain", .description = "Explain a file" } });

    auto resource = catalog.findResource("docs://readme");
    REQUIRE(resource.has_value());
    CHECK(resource->name == "README");
    CHECK(resource->ownerConnectionId == "docs");
    CHECK(!catalog.findResource("README").has_value());

    auto prompt = catalog.findPrompt("explain");
    REQUIRE(prompt.has_value());
    CHECK(prompt->description == "Explain a file");
    CHECK(prompt->ownerConnectionId == "docs");
}

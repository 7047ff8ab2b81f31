// SPDX-License-Identifier: Apache-2.0
#include "BuiltinToolBridge.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <regex>
#include <span>
#include <sstream>

namespace mcphub
{

namespace
{
    struct BuiltinTool
    {
        std::string_view name;
        std::string_view displayName;
        std::string_view description;
    };

    constexpr auto BuiltinTools = std::array {
        BuiltinTool { "web_search", "Web search", "Search the web for current information. Returns titles, URLs and snippets of the top results." },
        BuiltinTool { "execute_code", "Code execution", "Execute code in a sandboxed environment and return its exit code, stdout and stderr." },
        BuiltinTool { "create_artifact", "Artifact creation", "Create a self-contained visual artifact (React component, HTML page, SVG image or Mermaid diagram)." },
        BuiltinTool { "browser_action", "Browser control", "Control the integrated browser: navigate, click, type, extract content, take screenshots, find elements or scroll." },
    };

    constexpr auto ArtifactTypes = std::array<std::string_view, 4> { "react", "html", "svg", "mermaid" };
    constexpr auto BrowserActions =
        std::array<std::string_view, 7> { "navigate", "click", "type", "extract", "screenshot", "find", "scroll" };

    auto enumOf(std::span<const std::string_view> names) -> nlohmann::json
    {
        auto values = nlohmann::json::array();
        for (auto const name: names)
            values.push_back(std::string(name));
        return values;
    }

    auto inputSchemaFor(std::string_view name) -> nlohmann::json
    {
        if (name == "web_search")
        {
            return {
                { "type", "object" },
                { "properties",
                  { { "query", { { "type", "string" }, { "description", "Search query" } } },
                    { "max_results",
                      { { "type", "integer" }, { "description", "Number of results (1-10)" }, { "default", 5 } } } } },
                { "required", { "query" } },
            };
        }

        if (name == "execute_code")
        {
            return {
                { "type", "object" },
                { "properties",
                  { { "language", { { "type", "string" }, { "description", "Programming language" } } },
                    { "code", { { "type", "string" }, { "description", "Complete program to execute" } } },
                    { "timeout",
                      { { "type", "number" }, { "description", "Timeout in seconds" }, { "default", 30 } } },
                    { "capabilities",
                      { { "type", "array" },
                        { "items", { { "type", "string" } } },
                        { "description", "Capabilities the code requires (filesystem.read, network, ...)" } } } } },
                { "required", { "language", "code" } },
            };
        }

        if (name == "create_artifact")
        {
            return {
                { "type", "object" },
                { "properties",
                  { { "type", { { "type", "string" }, { "enum", enumOf(ArtifactTypes) } } },
                    { "title", { { "type", "string" }, { "description", "Title shown above the artifact" } } },
                    { "content", { { "type", "string" }, { "description", "Complete artifact source" } } } } },
                { "required", { "type", "title", "content" } },
            };
        }

        return {
            { "type", "object" },
            { "properties",
              { { "action", { { "type", "string" }, { "enum", enumOf(BrowserActions) } } },
                { "url", { { "type", "string" } } },
                { "selector", { { "type", "string" } } },
                { "text", { { "type", "string" } } } } },
            { "required", { "action" } },
        };
    }

    auto textResult(std::string text, bool isError = false) -> ToolCallResult
    {
        return ToolCallResult {
            .content = { ContentItem { .type = "text", .text = std::move(text) } },
            .isError = isError,
        };
    }

    auto joinNames(std::span<const std::string_view> names) -> std::string
    {
        auto joined = std::string {};
        for (auto const name: names)
        {
            if (!joined.empty())
                joined += ", ";
            joined += name;
        }
        return joined;
    }

    auto trim(std::string_view text) -> std::string
    {
        auto const isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        while (!text.empty() && isSpace(text.front()))
            text.remove_prefix(1);
        while (!text.empty() && isSpace(text.back()))
            text.remove_suffix(1);
        return std::string(text);
    }
} // namespace

auto sanitizeArtifactContent(std::string_view content) -> std::string
{
    auto result = std::string(content);

    static auto const fence =
        std::regex(R"(```(?:jsx?|tsx?|javascript|typescript|react|html|svg|mermaid)?\s*([\s\S]*?)```)");
    if (auto match = std::smatch {}; std::regex_search(result, match, fence))
        result = match[1].str();

    static auto const importFrom = std::regex(R"(import\s+[^\n]*?from\s+['"][^'"]+['"];?[ \t]*\n?)");
    static auto const importBare = std::regex(R"(import\s+['"][^'"]+['"];?[ \t]*\n?)");
    static auto const exportDefault = std::regex(R"(export\s+default\s+)");
    static auto const exportList = std::regex(R"(export\s+\{[^}]*\};?[ \t]*\n?)");
    result = std::regex_replace(result, importFrom, "");
    result = std::regex_replace(result, importBare, "");
    result = std::regex_replace(result, exportDefault, "");
    result = std::regex_replace(result, exportList, "");

    static auto const instructionLines = std::array {
        std::regex(R"(^#+ .*$)"),
        std::regex(R"(^\d+\.\s+(?:Create|Install|Run|Open|Add|Copy|First|Then|Next).*$)", std::regex::icase),
        std::regex(R"(^(?:npm|npx|yarn|pnpm)\s+.*$)", std::regex::icase),
        std::regex(R"(^(?:cd|mkdir|touch)\s+.*$)", std::regex::icase),
        std::regex(R"(^// ?(?:In|Create|Add|File:).*$)", std::regex::icase),
    };

    auto filtered = std::string {};
    auto stream = std::istringstream(result);
    auto blankRun = 0;
    for (auto line = std::string {}; std::getline(stream, line);)
    {
        auto const isInstruction = std::ranges::any_of(
            instructionLines, [&](auto const& pattern) { return std::regex_match(line, pattern); });
        if (isInstruction)
            continue;

        blankRun = trim(line).empty() ? blankRun + 1 : 0;
        if (blankRun > 1)
            continue;

        filtered += line;
        filtered += '\n';
    }

    return trim(filtered);
}

BuiltinToolBridge::BuiltinToolBridge(BuiltinServices services, const std::map<std::string, bool>& enabled):
    _services(services)
{
    for (auto const& tool: BuiltinTools)
        _enabled.emplace(std::string(tool.name), true);

    for (auto const& [name, flag]: enabled)
    {
        if (!setEnabled(name, flag))
            log::warning("Ignoring unknown builtin tool '{}' in configuration", name);
    }
}

auto BuiltinToolBridge::isReserved(std::string_view name) -> bool
{
    return std::ranges::any_of(BuiltinTools, [&](auto const& tool) { return tool.name == name; });
}

auto BuiltinToolBridge::reservedNames() -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (auto const& tool: BuiltinTools)
        names.emplace_back(tool.name);
    return names;
}

auto BuiltinToolBridge::isEnabled(std::string_view name) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = _enabled.find(name);
    return it != _enabled.end() && it->second;
}

auto BuiltinToolBridge::setEnabled(std::string_view name, bool enabled) -> bool
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = _enabled.find(name);
    if (it == _enabled.end())
        return false;

    if (it->second != enabled)
        log::info("Builtin tool '{}' {}", name, enabled ? "enabled" : "disabled");
    it->second = enabled;
    return true;
}

auto BuiltinToolBridge::definitions() const -> std::vector<ToolDescriptor>
{
    auto tools = std::vector<ToolDescriptor> {};
    for (auto const& tool: BuiltinTools)
    {
        if (!isEnabled(tool.name))
            continue;

        tools.push_back(ToolDescriptor {
            .name = std::string(tool.name),
            .description = std::string(tool.description),
            .inputSchema = inputSchemaFor(tool.name),
            .ownerConnectionId = std::string(BuiltinOwnerId),
            .ownerDisplayName = "Built-in",
        });
    }
    return tools;
}

auto BuiltinToolBridge::call(std::string_view name, const nlohmann::json& arguments) -> ToolCallResult
{
    auto const tool = std::ranges::find(BuiltinTools, name, &BuiltinTool::name);
    if (tool == BuiltinTools.end())
        return makeToolFailure(ErrorCode::NotFound, std::format("'{}' is not a builtin tool", name));

    if (!isEnabled(name))
        return makeToolFailure(
            ErrorCode::ToolCallError,
            std::format("{} tool is currently disabled. Enable it to use this feature.", tool->displayName));

    log::info("Calling builtin tool '{}'", name);

    auto const& args = arguments.is_object() ? arguments : nlohmann::json::object();
    if (name == "web_search")
        return webSearch(args);
    if (name == "execute_code")
        return executeCode(args);
    if (name == "create_artifact")
        return createArtifact(args);
    return browserAction(args);
}

auto BuiltinToolBridge::webSearch(const nlohmann::json& arguments) -> ToolCallResult
{
    auto query = json::getStringOr(arguments, "query", "");
    if (query.empty())
        query = json::getStringOr(arguments, "q", "");
    if (query.empty())
        return makeToolFailure(ErrorCode::InvalidArgument, "Error: 'query' parameter is required for web_search");

    auto const maxResults = json::getIntOr(arguments, "max_results", json::getIntOr(arguments, "maxResults", 5));

    if (!_services.webSearch)
        return makeToolFailure(ErrorCode::ToolCallError, "Web search is not available");

    auto results = _services.webSearch->search(query, maxResults);
    if (!results)
    {
        log::error("Web search failed: {}", results.error());
        return makeToolFailure(results.error().code,
                               std::format("Error performing web search: {}", results.error().message));
    }

    if (results->empty())
        return textResult(std::format("No search results found for: {}", query));

    auto text = std::format("## Web Search Results for: {}\n\n", query);
    for (size_t i = 0; i < results->size(); ++i)
    {
        auto const& hit = (*results)[i];
        text += std::format("### {}. {}\n**URL:** {}\n**Snippet:** {}\n**Source:** {}\n\n",
                            i + 1,
                            hit.title,
                            hit.url,
                            hit.snippet,
                            hit.source);
    }
    return textResult(std::move(text));
}

auto BuiltinToolBridge::executeCode(const nlohmann::json& arguments) -> ToolCallResult
{
    auto request = CodeExecutionRequest {
        .language = json::getStringOr(arguments, "language", ""),
        .code = json::getStringOr(arguments, "code", ""),
        .timeoutSeconds = json::getDoubleOr(arguments, "timeout", 30.0),
        .capabilities = json::getStringArray(arguments, "capabilities"),
    };

    if (request.language.empty() || request.code.empty())
        return makeToolFailure(ErrorCode::InvalidArgument,
                               "Error: 'language' and 'code' parameters are required for code execution");

    if (!_services.codeExecution)
        return makeToolFailure(ErrorCode::ToolCallError, "Code execution is not available");

    auto result = _services.codeExecution->execute(request);
    if (!result)
    {
        log::error("Code execution failed: {}", result.error());
        return makeToolFailure(result.error().code, std::format("Error executing code: {}", result.error().message));
    }

    auto text = std::format("## Code Execution Result\n\n**Exit Code:** {}\n**Duration:** {:.2f}s\n\n",
                            result->exitCode,
                            result->durationSeconds);
    if (!result->standardOutput.empty())
        text += std::format("### Output\n```\n{}\n```\n\n", result->standardOutput);
    if (!result->standardError.empty())
        text += std::format("### Errors\n```\n{}\n```\n\n", result->standardError);

    return textResult(std::move(text), result->exitCode != 0);
}

auto BuiltinToolBridge::createArtifact(const nlohmann::json& arguments) -> ToolCallResult
{
    auto const type = json::getStringOr(arguments, "type", "");
    auto const title = json::getStringOr(arguments, "title", "");
    auto const rawContent = json::getString(arguments, "content");

    if (type.empty() || title.empty() || !rawContent)
        return makeToolFailure(ErrorCode::InvalidArgument,
                               "Error: 'type', 'title', and 'content' parameters are required for create_artifact");

    if (std::ranges::find(ArtifactTypes, type) == ArtifactTypes.end())
        return makeToolFailure(
            ErrorCode::InvalidArgument,
            std::format("Error: Invalid artifact type '{}'. Must be one of: {}", type, joinNames(ArtifactTypes)));

    auto content = sanitizeArtifactContent(*rawContent);
    if (content.empty())
        return makeToolFailure(ErrorCode::InvalidArgument,
                               "Error: Artifact content is empty after sanitization. Provide the artifact source, "
                               "not setup instructions.");

    log::info("Creating artifact: type={}, title={}, {} bytes (sanitized from {})",
              type,
              title,
              content.size(),
              rawContent->size());

    auto const artifact = nlohmann::json {
        { "artifact_type", type },
        { "artifact_title", title },
        { "artifact_content", std::move(content) },
    };

    return ToolCallResult {
        .content = { ContentItem { .type = "artifact", .text = artifact.dump() } },
    };
}

auto BuiltinToolBridge::browserAction(const nlohmann::json& arguments) -> ToolCallResult
{
    auto action = json::getStringOr(arguments, "action", "");
    if (action.empty())
        return makeToolFailure(ErrorCode::InvalidArgument, "Error: 'action' parameter is required for browser_action");

    std::ranges::transform(action, action.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (std::ranges::find(BrowserActions, action) == BrowserActions.end())
        return makeToolFailure(
            ErrorCode::InvalidArgument,
            std::format("Error: Unknown action '{}'. Valid actions: {}", action, joinNames(BrowserActions)));

    auto const requireString = [&](std::string_view key) { return !json::getStringOr(arguments, key, "").empty(); };
    if (action == "navigate" && !requireString("url"))
        return makeToolFailure(ErrorCode::InvalidArgument, "Error: 'url' parameter is required for navigate action");
    if (action == "click" && !requireString("selector"))
        return makeToolFailure(ErrorCode::InvalidArgument, "Error: 'selector' parameter is required for click action");
    if (action == "type" && (!requireString("selector") || !arguments.contains("text")))
        return makeToolFailure(ErrorCode::InvalidArgument,
                               "Error: 'selector' and 'text' parameters are required for type action");

    if (!_services.browser)
        return makeToolFailure(ErrorCode::ToolCallError, "Browser automation is not available");

    auto report = _services.browser->perform(action, arguments);
    if (!report)
    {
        log::error("Browser action '{}' failed: {}", action, report.error());
        return makeToolFailure(report.error().code, std::format("Browser action failed: {}", report.error().message));
    }

    return textResult(std::move(*report));
}

} // namespace mcphub

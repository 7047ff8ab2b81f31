// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcphub/App.hpp>
#include <mcphub/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <fstream>
#include <map>
#include <print>
#include <sstream>
#include <string>
#include <vector>

namespace
{

auto parseArguments(const std::string& text) -> mcphub::Result<nlohmann::json>
{
    if (text.empty())
        return nlohmann::json::object();

    return mcphub::json::parse(text).and_then([](nlohmann::json value) -> mcphub::Result<nlohmann::json> {
        if (!value.is_object())
            return mcphub::makeError(mcphub::ErrorCode::InvalidArgument, "Arguments must be a JSON object");
        return value;
    });
}

auto parseEnvAssignments(const std::vector<std::string>& assignments)
    -> mcphub::Result<std::map<std::string, std::string>>
{
    auto env = std::map<std::string, std::string> {};
    for (auto const& assignment: assignments)
    {
        auto const equals = assignment.find('=');
        if (equals == std::string::npos || equals == 0)
            return mcphub::makeError(mcphub::ErrorCode::InvalidArgument,
                                     std::format("Expected KEY=VALUE, got '{}'", assignment));
        env[assignment.substr(0, equals)] = assignment.substr(equals + 1);
    }
    return env;
}

auto readFile(const std::string& path) -> mcphub::Result<std::string>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return mcphub::makeError(mcphub::ErrorCode::IoError, std::format("Cannot open {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

auto fail(const mcphub::Error& error) -> int
{
    std::println(stderr, "Error: {}", error.message);
    return 1;
}

void printServers(mcphub::App& app)
{
    auto& manager = app.servers();
    auto const servers = app.registry().servers();
    if (servers.empty())
    {
        std::println("No MCP servers configured.");
        return;
    }

    for (auto const& server: servers)
    {
        auto status = std::string(manager.isRunning(server.id) ? "running" : "stopped");
        if (auto const error = manager.lastError(server.id))
            status = std::format("error: {}", *error);

        std::println("{:<20} {:<16} {} [{}]",
                     server.id,
                     mcphub::discoverySourceDisplayName(server.source),
                     server.command,
                     status);
    }
}

void printTools(mcphub::App& app)
{
    for (auto const& tool: app.servers().allTools())
        std::println("{:<24} {:<16} {}", tool.name, tool.ownerConnectionId, tool.description);
}

auto printToolResult(const mcphub::ToolCallResult& result) -> int
{
    for (auto const& item: result.content)
    {
        if (item.type == "text" || item.type == "artifact")
            std::println("{}", item.text);
        else if (!item.uri.empty())
            std::println("[{}: {}]", item.type, item.uri);
        else
            std::println("[{} {}]", item.type, item.mimeType);
    }
    return result.isError ? 1 : 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcphub - MCP server manager and tool client" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* const serversCmd = app.add_subcommand("servers", "List configured MCP servers and their status");

    auto newServer = mcphub::ServerDescriptor {};
    auto envAssignments = std::vector<std::string> {};
    auto* const addCmd = app.add_subcommand("add", "Register an MCP server");
    addCmd->add_option("id", newServer.id, "Server id")->required();
    addCmd->add_option("command", newServer.command, "Executable to launch")->required();
    addCmd->add_option("args", newServer.args, "Arguments passed to the executable");
    addCmd->add_option("--name", newServer.name, "Display name");
    addCmd->add_option("--description", newServer.description, "Description");
    addCmd->add_option("--cwd", newServer.workingDirectory, "Working directory");
    addCmd->add_option("-e,--env", envAssignments, "Environment override KEY=VALUE");

    auto removeId = std::string {};
    auto* const removeCmd = app.add_subcommand("remove", "Remove an MCP server");
    removeCmd->add_option("id", removeId, "Server id")->required();

    auto testId = std::string {};
    auto* const testCmd = app.add_subcommand("test", "Spawn a server, perform the handshake and stop it");
    testCmd->add_option("id", testId, "Server id")->required();

    auto importFile = std::string {};
    auto importSource = std::string { "manual" };
    auto* const importCmd = app.add_subcommand("import", "Import servers from an mcpServers JSON file");
    importCmd->add_option("file", importFile, "Config file to import")->required()->check(CLI::ExistingFile);
    importCmd->add_option("--source", importSource, "Discovery source tag")
        ->check(CLI::IsMember({ "manual", "claude_desktop", "cursor", "claude_code", "vscode", "dotfile" }));

    auto* const toolsCmd = app.add_subcommand("tools", "Start servers and list every available tool");

    auto toolName = std::string {};
    auto toolArguments = std::string {};
    auto* const callCmd = app.add_subcommand("call", "Invoke a tool");
    callCmd->add_option("tool", toolName, "Tool name")->required();
    callCmd->add_option("arguments", toolArguments, "Arguments as a JSON object");

    auto resourceUri = std::string {};
    auto* const readCmd = app.add_subcommand("read", "Read a resource");
    readCmd->add_option("uri", resourceUri, "Resource uri")->required();

    auto promptName = std::string {};
    auto promptArguments = std::string {};
    auto* const promptCmd = app.add_subcommand("prompt", "Expand a prompt template");
    promptCmd->add_option("name", promptName, "Prompt name")->required();
    promptCmd->add_option("arguments", promptArguments, "Arguments as a JSON object");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? mcphub::loadConfig() : mcphub::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcphub::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    if (verbose)
        mcphub::log::setLevel(mcphub::log::Level::Debug);
    else if (auto const level = mcphub::log::levelFromString(configResult->logLevel))
        mcphub::log::setLevel(*level);
    else
        mcphub::log::warning("Unknown log level '{}' in config", configResult->logLevel);

    auto application = mcphub::App(std::move(*configResult));
    if (auto initResult = application.initialize(); !initResult)
    {
        mcphub::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    auto& manager = application.servers();

    if (serversCmd->parsed())
    {
        printServers(application);
        return 0;
    }

    if (addCmd->parsed())
    {
        auto env = parseEnvAssignments(envAssignments);
        if (!env)
            return fail(env.error());
        newServer.env = std::move(*env);
        newServer.source = mcphub::DiscoverySource::Manual;

        auto const id = newServer.id;
        if (auto added = manager.addServer(std::move(newServer)); !added)
            return fail(added.error());
        std::println("Added MCP server '{}'.", id);
        return 0;
    }

    if (removeCmd->parsed())
    {
        if (auto removed = manager.removeServer(removeId); !removed)
            return fail(removed.error());
        std::println("Removed MCP server '{}'.", removeId);
        return 0;
    }

    if (testCmd->parsed())
    {
        auto const descriptor = application.registry().find(testId);
        if (!descriptor)
            return fail(mcphub::Error { mcphub::ErrorCode::NotFound, std::format("Unknown server: {}", testId) });

        auto const outcome = manager.testConnection(*descriptor);
        std::println("{}: {}", outcome.ok ? "OK" : "FAILED", outcome.message);
        return outcome.ok ? 0 : 1;
    }

    if (importCmd->parsed())
    {
        auto const source = mcphub::discoverySourceFromTag(importSource).value_or(mcphub::DiscoverySource::Manual);
        auto imported = readFile(importFile)
                            .and_then([](const std::string& text) { return mcphub::json::parse(text); })
                            .and_then([&](const nlohmann::json& document) {
                                return mcphub::parseMcpServersConfig(document, source);
                            })
                            .and_then([&](std::vector<mcphub::ServerDescriptor> descriptors) {
                                return manager.importServers(std::move(descriptors));
                            });
        if (!imported)
            return fail(imported.error());
        std::println("Imported {} MCP server(s).", *imported);
        return 0;
    }

    if (toolsCmd->parsed())
    {
        manager.ensureServersStarted();
        printTools(application);
        return 0;
    }

    if (callCmd->parsed())
    {
        auto arguments = parseArguments(toolArguments);
        if (!arguments)
            return fail(arguments.error());
        return printToolResult(manager.callTool(toolName, *arguments));
    }

    if (readCmd->parsed())
    {
        manager.ensureServersStarted();
        auto contents = manager.readResource(resourceUri);
        if (!contents)
            return fail(contents.error());

        for (auto const& content: *contents)
        {
            if (content.text)
                std::println("{}", *content.text);
            else if (content.blob)
                std::println("[{} bytes of {}]", content.blob->size(), content.mimeType);
        }
        return 0;
    }

    if (promptCmd->parsed())
    {
        manager.ensureServersStarted();
        auto arguments = parseArguments(promptArguments);
        if (!arguments)
            return fail(arguments.error());

        auto prompt = manager.getPrompt(promptName, *arguments);
        if (!prompt)
            return fail(prompt.error());

        if (!prompt->description.empty())
            std::println("# {}\n", prompt->description);
        for (auto const& message: prompt->messages)
            std::println("{}: {}", message.role, message.content.text);
        return 0;
    }

    return 0;
}

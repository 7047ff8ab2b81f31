// SPDX-License-Identifier: Apache-2.0
#include <mcp/ServerManager.hpp>

#include <tests/FakeTransport.hpp>
#include <tests/MemoryServerStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <mutex>
#include <set>
#include <thread>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

auto tool(std::string name) -> nlohmann::json
{
    return nlohmann::json {
        { "name", std::move(name) },
        { "description", "test tool" },
        { "inputSchema", { { "type", "object" } } },
    };
}

/// Plays every provider the manager launches; one FakeTransport per start.
class FakeFleet
{
  public:
    void setTools(const std::string& id, nlohmann::json tools)
    {
        auto const lock = std::lock_guard(_mutex);
        _tools[id] = std::move(tools);
    }

    void setCapabilities(const std::string& id, nlohmann::json capabilities)
    {
        auto const lock = std::lock_guard(_mutex);
        _capabilities[id] = std::move(capabilities);
    }

    void setResources(const std::string& id, nlohmann::json resources)
    {
        auto const lock = std::lock_guard(_mutex);
        _resources[id] = std::move(resources);
    }

    void setPrompts(const std::string& id, nlohmann::json prompts)
    {
        auto const lock = std::lock_guard(_mutex);
        _prompts[id] = std::move(prompts);
    }

    void failLaunchOf(const std::string& id)
    {
        auto const lock = std::lock_guard(_mutex);
        _failing.insert(id);
    }

    [[nodiscard]] auto transport(const std::string& id) -> test::FakeTransport*
    {
        auto const lock = std::lock_guard(_mutex);
        auto const it = _latest.find(id);
        return it != _latest.end() ? it->second : nullptr;
    }

    [[nodiscard]] auto launches(const std::string& id) -> int
    {
        auto const lock = std::lock_guard(_mutex);
        auto const it = _launches.find(id);
        return it != _launches.end() ? it->second : 0;
    }

    [[nodiscard]] auto factory() -> TransportFactory
    {
        return [this](const ServerDescriptor& descriptor) -> Result<std::unique_ptr<Transport>> {
            auto const id = descriptor.id;
            auto transport = std::make_unique<test::FakeTransport>(
                [this, id](test::FakeTransport& fake, const nlohmann::json& message) { respond(id, fake, message); });

            auto const lock = std::lock_guard(_mutex);
            transport->failOpen = _failing.contains(id);
            _latest[id] = transport.get();
            ++_launches[id];
            return transport;
        };
    }

  private:
    void respond(const std::string& id, test::FakeTransport& fake, const nlohmann::json& message)
    {
        auto script = test::ProviderScript {};
        {
            auto const lock = std::lock_guard(_mutex);
            if (auto const it = _capabilities.find(id); it != _capabilities.end())
                script.capabilities = it->second;
            if (auto const it = _tools.find(id); it != _tools.end())
                script.tools = it->second;
            if (auto const it = _resources.find(id); it != _resources.end())
                script.resources = it->second;
            if (auto const it = _prompts.find(id); it != _prompts.end())
                script.prompts = it->second;
        }
        test::scriptedProvider(std::move(script))(fake, message);
    }

    std::mutex _mutex;
    std::map<std::string, nlohmann::json> _tools;
    std::map<std::string, nlohmann::json> _capabilities;
    std::map<std::string, nlohmann::json> _resources;
    std::map<std::string, nlohmann::json> _prompts;
    std::set<std::string> _failing;
    std::map<std::string, test::FakeTransport*> _latest;
    std::map<std::string, int> _launches;
};

struct ManagerFixture
{
    FakeFleet fleet;
    test::MemoryServerStore store;
    ServerRegistry registry { store, {} };
    BuiltinToolBridge builtins;
    std::unique_ptr<ServerManager> manager;

    explicit ManagerFixture(ServerManagerOptions options = {})
    {
        manager = std::make_unique<ServerManager>(registry, builtins, std::move(options), fleet.factory());
    }

    ~ManagerFixture() { manager.reset(); }

    void addServer(const std::string& id, nlohmann::json tools)
    {
        fleet.setTools(id, std::move(tools));
        REQUIRE(registry.add(ServerDescriptor { .id = id, .name = id, .command = "fake-" + id }).has_value());
    }

    [[nodiscard]] auto toolNames() const -> std::set<std::string>
    {
        auto names = std::set<std::string> {};
        for (auto const& descriptor: manager->allTools())
            names.insert(descriptor.name);
        return names;
    }
};

/// Polls @p condition until it holds or two seconds elapsed.
auto eventually(const std::function<bool()>& condition) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

/// Waits for the reply the client sent to the server request @p id.
auto replyTo(test::FakeTransport& transport, const nlohmann::json& id) -> std::optional<nlohmann::json>
{
    auto reply = std::optional<nlohmann::json> {};
    eventually([&] {
        for (auto const& message: transport.sent())
        {
            if (!message.contains("method") && message.contains("id") && message["id"] == id)
            {
                reply = message;
                return true;
            }
        }
        return false;
    });
    return reply;
}

} // namespace

TEST_CASE("ServerManager starts registered servers and merges their tools", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));
    fixture.addServer("beta", nlohmann::json::array({ tool("lookup") }));

    CHECK(fixture.manager->startAllServers() == 2);
    CHECK(fixture.manager->isRunning("alpha"));
    CHECK(fixture.manager->isRunning("beta"));
    CHECK(fixture.manager->enabledServers() == std::vector<std::string> { "alpha", "beta" });

    auto const names = fixture.toolNames();
    CHECK(names.contains("echo"));
    CHECK(names.contains("lookup"));
    for (auto const& builtin: BuiltinToolBridge::reservedNames())
        CHECK(names.contains(builtin));

    auto const tools = fixture.manager->allTools();
    REQUIRE(!tools.empty());
    CHECK(tools.front().ownerConnectionId == BuiltinOwnerId);

    auto const result = fixture.manager->callTool("lookup", { { "key", "k" } });
    CHECK(!result.isError);
    CHECK(result.text() == "lookup:{\"key\":\"k\"}");
    CHECK(fixture.fleet.transport("beta")->sentWithMethod("tools/call").size() == 1);
    CHECK(fixture.fleet.transport("alpha")->sentWithMethod("tools/call").empty());
}

TEST_CASE("ServerManager treats starting a running server as a no-op", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));

    REQUIRE(fixture.manager->startServer("alpha").has_value());
    REQUIRE(fixture.manager->startServer("alpha").has_value());
    CHECK(fixture.fleet.launches("alpha") == 1);
}

TEST_CASE("ServerManager reports unknown server ids", "[manager]")
{
    auto fixture = ManagerFixture {};

    auto started = fixture.manager->startServer("ghost");
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::NotFound);
}

TEST_CASE("ServerManager rolls back a failed start", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("broken", nlohmann::json::array({ tool("never") }));
    fixture.fleet.failLaunchOf("broken");

    auto started = fixture.manager->startServer("broken");
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::LaunchError);

    CHECK(!fixture.manager->isRunning("broken"));
    CHECK(!fixture.toolNames().contains("never"));
    REQUIRE(fixture.manager->lastError("broken").has_value());
    CHECK(*fixture.manager->lastError("broken") == started.error().message);

    fixture.manager->clearError("broken");
    CHECK(!fixture.manager->lastError("broken").has_value());
}

TEST_CASE("ServerManager skips failing servers when starting all", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));
    fixture.addServer("broken", nlohmann::json::array({ tool("never") }));
    fixture.fleet.failLaunchOf("broken");

    CHECK(fixture.manager->startAllServers() == 1);
    CHECK(fixture.manager->isRunning("alpha"));
    CHECK(fixture.manager->lastError("broken").has_value());
}

TEST_CASE("ServerManager never lets a provider shadow a builtin tool", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("rogue", nlohmann::json::array({ tool("web_search"), tool("harmless") }));
    REQUIRE(fixture.manager->startServer("rogue").has_value());

    auto const tools = fixture.manager->allTools();
    auto const webSearches = std::ranges::count_if(tools, [](auto const& t) { return t.name == "web_search"; });
    CHECK(webSearches == 1);
    CHECK(fixture.toolNames().contains("harmless"));

    auto const result = fixture.manager->callTool("web_search", { { "query", "weather" } });
    CHECK(result.isError);
    CHECK(result.text() == "Web search is not available");
    CHECK(fixture.fleet.transport("rogue")->sentWithMethod("tools/call").empty());
}

TEST_CASE("ServerManager reports disabled builtins instead of routing them", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.builtins.setEnabled("execute_code", false);

    CHECK(!fixture.toolNames().contains("execute_code"));

    auto const result = fixture.manager->callTool("execute_code", { { "language", "python" }, { "code", "print(1)" } });
    CHECK(result.isError);
    CHECK(result.text() == "Code execution tool is currently disabled. Enable it to use this feature.");
}

TEST_CASE("ServerManager starts servers on demand for unknown tools", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));
    CHECK(!fixture.manager->isRunning("alpha"));

    auto const result = fixture.manager->callTool("echo", nlohmann::json::object());
    CHECK(!result.isError);
    CHECK(fixture.manager->isRunning("alpha"));

    auto const missing = fixture.manager->callTool("nope", nlohmann::json::object());
    CHECK(missing.isError);
    CHECK(missing.failure == ErrorCode::NotFound);
    CHECK(missing.text() == "Unknown tool: nope");
}

TEST_CASE("ServerManager reaps a crashed server", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));
    fixture.addServer("beta", nlohmann::json::array({ tool("lookup") }));
    REQUIRE(fixture.manager->startAllServers() == 2);

    auto observed = std::atomic<bool> { false };
    fixture.manager->setEventObserver([&](const ConnectionEvent& event) {
        if (event.serverId == "alpha" && std::holds_alternative<Disconnected>(event.payload))
            observed = true;
    });

    fixture.fleet.transport("alpha")->crash();

    REQUIRE(eventually([&] { return !fixture.manager->isRunning("alpha"); }));
    CHECK(eventually([&] { return observed.load(); }));
    CHECK(fixture.manager->disconnectedUnexpectedly("alpha"));
    CHECK(fixture.manager->lastError("alpha") == "Server disconnected unexpectedly");
    CHECK(fixture.manager->enabledServers() == std::vector<std::string> { "beta" });

    auto const names = fixture.toolNames();
    CHECK(!names.contains("echo"));
    CHECK(names.contains("lookup"));
    CHECK(!fixture.manager->disconnectedUnexpectedly("beta"));

    // A restart clears the crash marker.
    REQUIRE(fixture.manager->startServer("alpha").has_value());
    CHECK(!fixture.manager->disconnectedUnexpectedly("alpha"));
    CHECK(!fixture.manager->lastError("alpha").has_value());
}

TEST_CASE("ServerManager refreshes the catalog after a list change", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("old") }));
    REQUIRE(fixture.manager->startServer("alpha").has_value());
    REQUIRE(fixture.toolNames().contains("old"));

    fixture.fleet.setTools("alpha", nlohmann::json::array({ tool("new") }));
    fixture.fleet.transport("alpha")->push(jsonrpc::makeNotification("notifications/tools/list_changed"));

    CHECK(eventually([&] {
        auto const names = fixture.toolNames();
        return names.contains("new") && !names.contains("old");
    }));
}

TEST_CASE("ServerManager stops a server and purges its catalog entries", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));
    REQUIRE(fixture.manager->startServer("alpha").has_value());

    fixture.manager->stopServer("alpha");

    CHECK(!fixture.manager->isRunning("alpha"));
    CHECK(!fixture.toolNames().contains("echo"));
    CHECK(!fixture.manager->disconnectedUnexpectedly("alpha"));
    CHECK(!fixture.manager->lastError("alpha").has_value());

    fixture.manager->stopServer("alpha");
    REQUIRE(fixture.manager->startServer("alpha").has_value());
    CHECK(fixture.fleet.launches("alpha") == 2);
}

TEST_CASE("ServerManager routes resources and prompts to their owners", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.fleet.setCapabilities("docs",
                                  {
                                      { "tools", nlohmann::json::object() },
                                      { "resources", { { "subscribe", true } } },
                                      { "prompts", nlohmann::json::object() },
                                  });
    fixture.fleet.setResources("docs", nlohmann::json::array({ { { "uri", "file:///readme" }, { "name", "readme" } } }));
    fixture.fleet.setPrompts("docs", nlohmann::json::array({ { { "name", "greet" } } }));
    fixture.addServer("docs", nlohmann::json::array());
    REQUIRE(fixture.manager->startServer("docs").has_value());

    REQUIRE(fixture.manager->resources().size() == 1);
    CHECK(fixture.manager->resources()[0].ownerConnectionId == "docs");
    REQUIRE(fixture.manager->prompts().size() == 1);

    auto contents = fixture.manager->readResource("file:///readme");
    REQUIRE(contents.has_value());
    CHECK((*contents)[0].text == "hello");

    auto prompt = fixture.manager->getPrompt("greet", nlohmann::json::object());
    REQUIRE(prompt.has_value());
    CHECK(prompt->messages.size() == 1);

    CHECK(fixture.manager->subscribe("file:///readme").has_value());
    CHECK(fixture.manager->connection("docs")->isSubscribed("file:///readme"));
    CHECK(fixture.manager->unsubscribe("file:///readme").has_value());
    CHECK(!fixture.manager->unsubscribe("file:///readme").has_value());

    auto missing = fixture.manager->readResource("file:///missing");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::NotFound);
    CHECK(fixture.manager->getPrompt("nope", nlohmann::json::object()).error().code == ErrorCode::NotFound);
}

TEST_CASE("ServerManager announces changed workspace roots", "[manager]")
{
    auto options = ServerManagerOptions {};
    options.workspaceRoots = { "/home/dev/project/" };
    auto fixture = ManagerFixture { options };
    fixture.addServer("alpha", nlohmann::json::array());
    REQUIRE(fixture.manager->startServer("alpha").has_value());

    auto roots = fixture.manager->workspaceRoots();
    REQUIRE(roots.size() == 1);
    CHECK(roots[0].uri == "file:///home/dev/project");
    CHECK(roots[0].name == "project");

    fixture.manager->setWorkspaceRoots({ "/srv/data", "/tmp" });
    CHECK(fixture.fleet.transport("alpha")->sentWithMethod("notifications/roots/list_changed").size() == 1);

    roots = fixture.manager->workspaceRoots();
    REQUIRE(roots.size() == 2);
    CHECK(roots[0].uri == "file:///srv/data");
    CHECK(roots[1].name == "tmp");
}

TEST_CASE("ServerManager answers sampling requests through its handler", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array());
    REQUIRE(fixture.manager->startServer("alpha").has_value());
    auto* transport = fixture.fleet.transport("alpha");
    REQUIRE(transport != nullptr);

    auto const params = nlohmann::json {
        { "messages", nlohmann::json::array({ { { "role", "user" }, { "content", "hi" } } }) },
        { "systemPrompt", "Be brief" },
        { "maxTokens", 64 },
    };

    transport->push({ { "jsonrpc", "2.0" }, { "id", "s-1" }, { "method", "sampling/createMessage" }, { "params", params } });
    auto refused = replyTo(*transport, "s-1");
    REQUIRE(refused.has_value());
    CHECK((*refused)["error"]["code"] == jsonrpc::ErrorCodes::InternalError);

    // Installed after the server started; the running connection picks it up.
    auto seen = std::optional<SamplingRequest> {};
    auto seenMutex = std::mutex {};
    fixture.manager->setSamplingHandler([&](const SamplingRequest& request) -> Result<nlohmann::json> {
        auto const lock = std::lock_guard(seenMutex);
        seen = request;
        return nlohmann::json { { "role", "assistant" }, { "content", { { "type", "text" }, { "text", "hello" } } } };
    });

    transport->push({ { "jsonrpc", "2.0" }, { "id", "s-2" }, { "method", "sampling/createMessage" }, { "params", params } });
    auto answered = replyTo(*transport, "s-2");
    REQUIRE(answered.has_value());
    CHECK((*answered)["result"]["role"] == "assistant");
    CHECK((*answered)["result"]["content"]["text"] == "hello");

    auto const lock = std::lock_guard(seenMutex);
    REQUIRE(seen.has_value());
    CHECK(seen->maxTokens == 64);
    CHECK(seen->systemPrompt == "Be brief");
    CHECK(seen->messages.size() == 1);
}

TEST_CASE("ServerManager looks up progress across its servers", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array());
    fixture.addServer("beta", nlohmann::json::array());
    CHECK(fixture.manager->startAllServers() == 2);

    CHECK(!fixture.manager->progress("job-1").has_value());

    fixture.fleet.transport("beta")->push({
        { "jsonrpc", "2.0" },
        { "method", "notifications/progress" },
        { "params", { { "progressToken", "job-1" }, { "progress", 1 }, { "total", 4 }, { "message", "indexing" } } },
    });
    fixture.fleet.transport("alpha")->push({
        { "jsonrpc", "2.0" },
        { "method", "notifications/progress" },
        { "params", { { "progressToken", 7 }, { "progress", 0.5 } } },
    });

    REQUIRE(eventually([&] { return fixture.manager->progress("job-1").has_value(); }));
    auto const job = fixture.manager->progress("job-1");
    CHECK(job->progress == 1.0);
    CHECK(job->total == 4.0);
    CHECK(job->message == "indexing");
    CHECK(!job->isComplete());

    REQUIRE(eventually([&] { return fixture.manager->progress("7").has_value(); }));
    CHECK(fixture.manager->progress("7")->progress == 0.5);
    CHECK(!fixture.manager->progress("7")->total.has_value());

    fixture.manager->stopServer("beta");
    CHECK(!fixture.manager->progress("job-1").has_value());
}

TEST_CASE("ServerManager restarts a running server on update", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));
    REQUIRE(fixture.manager->startServer("alpha").has_value());
    auto const firstSession = fixture.manager->connection("alpha")->session();

    auto updated = *fixture.registry.find("alpha");
    updated.args = { "--verbose" };
    REQUIRE(fixture.manager->updateServer(updated).has_value());

    CHECK(fixture.fleet.launches("alpha") == 2);
    REQUIRE(fixture.manager->isRunning("alpha"));
    CHECK(fixture.manager->connection("alpha")->session() != firstSession);
    CHECK(fixture.registry.find("alpha")->args == std::vector<std::string> { "--verbose" });
}

TEST_CASE("ServerManager removes a running server", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));
    REQUIRE(fixture.manager->startServer("alpha").has_value());

    REQUIRE(fixture.manager->removeServer("alpha").has_value());
    CHECK(!fixture.manager->isRunning("alpha"));
    CHECK(!fixture.registry.find("alpha").has_value());
    CHECK(fixture.store.size() == 0);

    CHECK(fixture.manager->removeServer("alpha").error().code == ErrorCode::NotFound);
}

TEST_CASE("ServerManager reserves the builtin server id", "[manager]")
{
    auto fixture = ManagerFixture {};

    auto added = fixture.manager->addServer(ServerDescriptor { .id = "builtin", .command = "x" });
    REQUIRE(!added.has_value());
    CHECK(added.error().code == ErrorCode::InvalidArgument);

    auto imported = fixture.manager->importServers({
        ServerDescriptor { .id = "builtin", .command = "x" },
        ServerDescriptor { .id = "files", .command = "fs-server" },
    });
    REQUIRE(imported.has_value());
    CHECK(*imported == 1);
    CHECK(fixture.registry.find("files").has_value());
    CHECK(!fixture.registry.find("builtin").has_value());
}

TEST_CASE("ServerManager tests a connection without keeping it", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.fleet.setTools("probe", nlohmann::json::array({ tool("a"), tool("b") }));

    auto const outcome = fixture.manager->testConnection(ServerDescriptor { .id = "probe", .command = "fake" });
    CHECK(outcome.ok);
    CHECK(outcome.message == "Connected to fake 1.0 (2 tool(s))");
    CHECK(!fixture.manager->isRunning("probe"));
    CHECK(fixture.toolNames().size() == BuiltinToolBridge::reservedNames().size());

    fixture.fleet.failLaunchOf("dead");
    auto const failed = fixture.manager->testConnection(ServerDescriptor { .id = "dead", .command = "fake" });
    CHECK(!failed.ok);
    CHECK(failed.message == "Executable not found: fake-server");
}

TEST_CASE("ServerManager stops everything on stopAllServers", "[manager]")
{
    auto fixture = ManagerFixture {};
    fixture.addServer("alpha", nlohmann::json::array({ tool("echo") }));
    fixture.addServer("beta", nlohmann::json::array({ tool("lookup") }));
    REQUIRE(fixture.manager->startAllServers() == 2);

    fixture.manager->stopAllServers();

    CHECK(fixture.manager->enabledServers().empty());
    CHECK(fixture.toolNames().size() == BuiltinToolBridge::reservedNames().size());
}

// SPDX-License-Identifier: Apache-2.0
#include <mcp/NotificationRouter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

/// Collects what the router writes back to the provider.
struct Outbox
{
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<nlohmann::json> messages;

    auto send(const nlohmann::json& message) -> VoidResult
    {
        {
            auto const lock = std::lock_guard(mutex);
            messages.push_back(message);
        }
        cv.notify_all();
        return {};
    }

    auto waitForReply(const nlohmann::json& id, std::chrono::milliseconds timeout = 2s) -> std::optional<nlohmann::json>
    {
        auto lock = std::unique_lock(mutex);
        auto found = std::optional<nlohmann::json> {};
        cv.wait_for(lock, timeout, [&] {
            for (auto const& message: messages)
            {
                if (message.contains("id") && message["id"] == id && !message.contains("method"))
                {
                    found = message;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    auto count() -> size_t
    {
        auto const lock = std::lock_guard(mutex);
        return messages.size();
    }
};

struct RouterFixture
{
    RequestCorrelator correlator;
    ProgressTracker progress;
    EventChannel events;
    Outbox outbox;
    std::set<std::string> subscriptions;

    auto makeRouter(ServerRequestHandlers handlers = {}) -> std::unique_ptr<NotificationRouter>
    {
        return std::make_unique<NotificationRouter>(
            correlator,
            progress,
            NotificationRouter::Hooks {
                .serverId = "alpha",
                .session = 7,
                .send = [this](const nlohmann::json& message) { return outbox.send(message); },
                .isSubscribed = [this](const std::string& uri) { return subscriptions.contains(uri); },
                .events = &events,
            },
            std::move(handlers));
    }
};

auto serverRequest(nlohmann::json id, std::string method, nlohmann::json params = nlohmann::json::object())
    -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "method", std::move(method) },
        { "params", std::move(params) },
    };
}

} // namespace

TEST_CASE("NotificationRouter resolves responses through the correlator", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    auto received = std::optional<Result<nlohmann::json>> {};
    auto const id = fixture.correlator.add([&](Result<nlohmann::json> result) { received = std::move(result); });

    router->dispatch(jsonrpc::makeResult(id, { { "value", 42 } }));

    REQUIRE(received.has_value());
    REQUIRE(received->has_value());
    CHECK((**received)["value"] == 42);
}

TEST_CASE("NotificationRouter turns error responses into RemoteError", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    auto received = std::optional<Result<nlohmann::json>> {};
    auto const id = fixture.correlator.add([&](Result<nlohmann::json> result) { received = std::move(result); });

    router->dispatch(jsonrpc::makeErrorResponse(id, -32000, "boom"));

    REQUIRE(received.has_value());
    REQUIRE(!received->has_value());
    CHECK(received->error().code == ErrorCode::RemoteError);
    CHECK(received->error().remoteCode == -32000);
    CHECK(received->error().message == "boom");
}

TEST_CASE("NotificationRouter discards responses with unknown ids", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    auto calls = 0;
    (void) fixture.correlator.add([&](Result<nlohmann::json>) { ++calls; });

    router->dispatch(jsonrpc::makeResult(999, nlohmann::json::object()));

    CHECK(calls == 0);
    CHECK(fixture.correlator.size() == 1);
    CHECK(fixture.events.size() == 0);
}

TEST_CASE("NotificationRouter emits ListChanged for both spellings", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    router->dispatch(jsonrpc::makeNotification("notifications/tools/list_changed"));
    router->dispatch(jsonrpc::makeNotification("notifications/prompts/listChanged"));

    auto first = fixture.events.popFor(100ms);
    REQUIRE(first.has_value());
    CHECK(first->serverId == "alpha");
    CHECK(first->session == 7);
    REQUIRE(std::holds_alternative<ListChanged>(first->payload));
    CHECK(std::get<ListChanged>(first->payload).kind == CapabilityKind::Tools);

    auto second = fixture.events.popFor(100ms);
    REQUIRE(second.has_value());
    REQUIRE(std::holds_alternative<ListChanged>(second->payload));
    CHECK(std::get<ListChanged>(second->payload).kind == CapabilityKind::Prompts);
}

TEST_CASE("NotificationRouter only forwards updates of subscribed resources", "[router]")
{
    auto fixture = RouterFixture {};
    fixture.subscriptions.insert("file:///watched.txt");
    auto router = fixture.makeRouter();

    router->dispatch(jsonrpc::makeNotification("notifications/resources/updated", { { "uri", "file:///other.txt" } }));
    CHECK(fixture.events.size() == 0);

    router->dispatch(jsonrpc::makeNotification("notifications/resources/updated", { { "uri", "file:///watched.txt" } }));
    auto event = fixture.events.popFor(100ms);
    REQUIRE(event.has_value());
    REQUIRE(std::holds_alternative<ResourceUpdated>(event->payload));
    CHECK(std::get<ResourceUpdated>(event->payload).uri == "file:///watched.txt");
}

TEST_CASE("NotificationRouter records progress notifications", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    router->dispatch(jsonrpc::makeNotification("notifications/progress",
                                               {
                                                   { "progressToken", "job-1" },
                                                   { "progress", 3 },
                                                   { "total", 10 },
                                                   { "message", "working" },
                                               }));

    auto const stored = fixture.progress.get("job-1");
    REQUIRE(stored.has_value());
    CHECK(stored->progress == 3.0);
    CHECK(stored->total == 10.0);
    CHECK(stored->message == "working");

    auto event = fixture.events.popFor(100ms);
    REQUIRE(event.has_value());
    REQUIRE(std::holds_alternative<ProgressUpdated>(event->payload));
    CHECK(std::get<ProgressUpdated>(event->payload).progress.token == "job-1");
}

TEST_CASE("NotificationRouter stringifies numeric progress tokens", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    router->dispatch(jsonrpc::makeNotification("notifications/progress", { { "progressToken", 17 }, { "progress", 1 } }));

    CHECK(fixture.progress.get("17").has_value());
}

TEST_CASE("NotificationRouter forwards provider log messages", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    router->dispatch(jsonrpc::makeNotification("notifications/message",
                                               { { "level", "warning" }, { "data", "disk almost full" } }));

    auto event = fixture.events.popFor(100ms);
    REQUIRE(event.has_value());
    REQUIRE(std::holds_alternative<LogReceived>(event->payload));
    auto const& message = std::get<LogReceived>(event->payload).message;
    CHECK(message.level == "warning");
    CHECK(message.logger == "alpha");
    CHECK(message.data == "disk almost full");
}

TEST_CASE("NotificationRouter resolves requests the server cancelled", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    auto received = std::optional<Result<nlohmann::json>> {};
    auto const id = fixture.correlator.add([&](Result<nlohmann::json> result) { received = std::move(result); });

    router->dispatch(
        jsonrpc::makeNotification("notifications/cancelled", { { "requestId", id }, { "reason", "shutting down" } }));

    REQUIRE(received.has_value());
    REQUIRE(!received->has_value());
    CHECK(received->error().code == ErrorCode::CancelledError);
    CHECK(!fixture.correlator.contains(id));
}

TEST_CASE("NotificationRouter answers ping", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    router->dispatch(serverRequest("p-1", "ping"));

    auto reply = fixture.outbox.waitForReply("p-1");
    REQUIRE(reply.has_value());
    CHECK((*reply)["result"] == nlohmann::json::object());
}

TEST_CASE("NotificationRouter answers roots/list from the handler", "[router]")
{
    auto fixture = RouterFixture {};

    SECTION("with a handler")
    {
        auto router = fixture.makeRouter(ServerRequestHandlers {
            .roots = [] { return std::vector<Root> { Root { .uri = "file:///work", .name = "work" } }; },
        });
        router->dispatch(serverRequest(1, "roots/list"));

        auto reply = fixture.outbox.waitForReply(1);
        REQUIRE(reply.has_value());
        auto const& roots = (*reply)["result"]["roots"];
        REQUIRE(roots.size() == 1);
        CHECK(roots[0]["uri"] == "file:///work");
        CHECK(roots[0]["name"] == "work");
    }

    SECTION("without a handler")
    {
        auto router = fixture.makeRouter();
        router->dispatch(serverRequest(1, "roots/list"));

        auto reply = fixture.outbox.waitForReply(1);
        REQUIRE(reply.has_value());
        CHECK((*reply)["result"]["roots"].empty());
    }
}

TEST_CASE("NotificationRouter answers sampling requests", "[router]")
{
    auto fixture = RouterFixture {};
    auto const messages = nlohmann::json::array({ { { "role", "user" }, { "content", "hi" } } });

    SECTION("without a handler it reports an internal error")
    {
        auto router = fixture.makeRouter();
        router->dispatch(serverRequest(5, "sampling/createMessage", { { "messages", messages } }));

        auto reply = fixture.outbox.waitForReply(5);
        REQUIRE(reply.has_value());
        CHECK((*reply)["error"]["code"] == jsonrpc::ErrorCodes::InternalError);
    }

    SECTION("without messages it reports invalid params")
    {
        auto router = fixture.makeRouter(ServerRequestHandlers {
            .sampling = [](const SamplingRequest&) -> Result<nlohmann::json> { return nlohmann::json::object(); },
        });
        router->dispatch(serverRequest(6, "sampling/createMessage", { { "maxTokens", 10 } }));

        auto reply = fixture.outbox.waitForReply(6);
        REQUIRE(reply.has_value());
        CHECK((*reply)["error"]["code"] == jsonrpc::ErrorCodes::InvalidParams);
    }

    SECTION("with a handler it returns the handler's result")
    {
        auto seenTokens = 0;
        auto router = fixture.makeRouter(ServerRequestHandlers {
            .sampling = [&](const SamplingRequest& request) -> Result<nlohmann::json> {
                seenTokens = request.maxTokens;
                return nlohmann::json { { "role", "assistant" }, { "content", { { "type", "text" }, { "text", "ok" } } } };
            },
        });
        router->dispatch(serverRequest(7, "sampling/createMessage", { { "messages", messages }, { "maxTokens", 64 } }));

        auto reply = fixture.outbox.waitForReply(7);
        REQUIRE(reply.has_value());
        CHECK((*reply)["result"]["role"] == "assistant");
        CHECK(seenTokens == 64);
    }
}

TEST_CASE("NotificationRouter rejects unknown server methods", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    router->dispatch(serverRequest(3, "elicitation/create"));

    auto reply = fixture.outbox.waitForReply(3);
    REQUIRE(reply.has_value());
    CHECK((*reply)["error"]["code"] == jsonrpc::ErrorCodes::MethodNotFound);
}

TEST_CASE("NotificationRouter rejects a reused in-flight request id", "[router]")
{
    auto fixture = RouterFixture {};

    auto release = std::promise<void> {};
    auto released = release.get_future().share();
    auto router = fixture.makeRouter(ServerRequestHandlers {
        .roots =
            [released] {
                released.wait();
                return std::vector<Root> {};
            },
    });

    router->dispatch(serverRequest(11, "roots/list"));
    router->dispatch(serverRequest(11, "roots/list"));

    auto duplicate = fixture.outbox.waitForReply(11);
    REQUIRE(duplicate.has_value());
    CHECK((*duplicate)["error"]["code"] == jsonrpc::ErrorCodes::InvalidRequest);
    CHECK(router->inFlightCount() == 1);

    release.set_value();
    router->shutdown();
}

TEST_CASE("NotificationRouter ignores invalid messages", "[router]")
{
    auto fixture = RouterFixture {};
    auto router = fixture.makeRouter();

    router->dispatch({ { "jsonrpc", "1.0" }, { "method", "ping" } });
    router->dispatch(nlohmann::json::array());

    CHECK(fixture.events.size() == 0);
    CHECK(fixture.outbox.count() == 0);
}

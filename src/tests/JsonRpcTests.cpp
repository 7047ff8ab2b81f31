// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <variant>

using namespace mcphub;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("makeErrorResponse echoes a string id verbatim", "[jsonrpc]")
{
    auto reply = jsonrpc::makeErrorResponse("req-7", jsonrpc::ErrorCodes::MethodNotFound, "Method not found: x");

    CHECK(reply["id"] == "req-7");
    CHECK(reply["error"]["code"] == -32601);
    CHECK(reply["error"]["message"] == "Method not found: x");
}

TEST_CASE("classify recognizes a success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto classified = jsonrpc::classify(msg);
    auto const* response = std::get_if<jsonrpc::Response>(&classified);
    REQUIRE(response != nullptr);
    CHECK(response->id == 1);
    CHECK(response->isSuccess());
    CHECK(response->result->at("status") == "ok");
}

TEST_CASE("classify recognizes an error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 3 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto classified = jsonrpc::classify(msg);
    auto const* response = std::get_if<jsonrpc::Response>(&classified);
    REQUIRE(response != nullptr);
    CHECK(!response->isSuccess());
    REQUIRE(response->error.has_value());
    CHECK(response->error->code == -32600);
    CHECK(response->error->message == "Invalid Request");
}

TEST_CASE("classify treats a method without id as a notification", "[jsonrpc]")
{
    SECTION("id absent")
    {
        auto classified = jsonrpc::classify({ { "jsonrpc", "2.0" }, { "method", "notifications/progress" } });
        REQUIRE(std::holds_alternative<jsonrpc::Notification>(classified));
        CHECK(std::get<jsonrpc::Notification>(classified).method == "notifications/progress");
    }

    SECTION("id null")
    {
        auto classified =
            jsonrpc::classify({ { "jsonrpc", "2.0" }, { "id", nullptr }, { "method", "notifications/message" } });
        CHECK(std::holds_alternative<jsonrpc::Notification>(classified));
    }
}

TEST_CASE("classify treats a method with id as a server request", "[jsonrpc]")
{
    SECTION("integer id")
    {
        auto classified = jsonrpc::classify({ { "jsonrpc", "2.0" }, { "id", 1 }, { "method", "roots/list" } });
        auto const* request = std::get_if<jsonrpc::ServerRequest>(&classified);
        REQUIRE(request != nullptr);
        CHECK(request->id == 1);
        CHECK(request->method == "roots/list");
    }

    SECTION("string id")
    {
        auto classified = jsonrpc::classify({ { "jsonrpc", "2.0" }, { "id", "abc" }, { "method", "ping" } });
        auto const* request = std::get_if<jsonrpc::ServerRequest>(&classified);
        REQUIRE(request != nullptr);
        CHECK(request->id == "abc");
    }
}

TEST_CASE("classify rejects malformed messages", "[jsonrpc]")
{
    CHECK(std::holds_alternative<jsonrpc::Invalid>(jsonrpc::classify(nlohmann::json::array())));
    CHECK(std::holds_alternative<jsonrpc::Invalid>(jsonrpc::classify({ { "version", "1.0" } })));
    CHECK(std::holds_alternative<jsonrpc::Invalid>(jsonrpc::classify({ { "jsonrpc", "2.0" }, { "id", 1 } })));
    CHECK(std::holds_alternative<jsonrpc::Invalid>(
        jsonrpc::classify({ { "jsonrpc", "2.0" }, { "id", "x" }, { "result", nlohmann::json::object() } })));
    CHECK(std::holds_alternative<jsonrpc::Invalid>(
        jsonrpc::classify({ { "jsonrpc", "2.0" }, { "id", 1.5 }, { "method", "ping" } })));
}

TEST_CASE("encodeLine writes one line per message", "[jsonrpc]")
{
    auto const line = jsonrpc::encodeLine({ { "text", "a\nb" } });

    CHECK(line.back() == '\n');
    CHECK(line.find('\n') == line.size() - 1);
}

TEST_CASE("decodeLine parses objects and strips line endings", "[jsonrpc]")
{
    auto decoded = jsonrpc::decodeLine("{\"jsonrpc\":\"2.0\",\"id\":5}\r\n");
    REQUIRE(decoded.has_value());
    CHECK((*decoded)["id"] == 5);
}

TEST_CASE("decodeLine rejects malformed input", "[jsonrpc]")
{
    auto garbage = jsonrpc::decodeLine("not json");
    REQUIRE(!garbage.has_value());
    CHECK(garbage.error().code == ErrorCode::ProtocolError);

    auto array = jsonrpc::decodeLine("[1,2,3]");
    REQUIRE(!array.has_value());
    CHECK(array.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("listChangedKind accepts both spellings", "[jsonrpc]")
{
    CHECK(jsonrpc::listChangedKind("notifications/tools/listChanged") == "tools");
    CHECK(jsonrpc::listChangedKind("notifications/tools/list_changed") == "tools");
    CHECK(jsonrpc::listChangedKind("notifications/resources/list_changed") == "resources");
    CHECK(jsonrpc::listChangedKind("notifications/prompts/listChanged") == "prompts");
    CHECK(!jsonrpc::listChangedKind("notifications/resources/updated"));
    CHECK(!jsonrpc::listChangedKind("notifications/widgets/listChanged"));
}

// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcphub::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error",
          nlohmann::json {
              { "code", code },
              { "message", message },
          } },
    };
}

auto classify(const nlohmann::json& message) -> Message
{
    if (!message.is_object())
        return Invalid { "Message is not a JSON object" };

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return Invalid { "Not a valid JSON-RPC 2.0 message" };

    auto const hasId = message.contains("id") && !message["id"].is_null();

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return Invalid { "JSON-RPC method is not a string" };

        auto method = message["method"].get<std::string>();
        auto params = message.value("params", nlohmann::json::object());

        if (!hasId)
            return Notification { .method = std::move(method), .params = std::move(params) };

        auto const& id = message["id"];
        if (!id.is_number_integer() && !id.is_string())
            return Invalid { "JSON-RPC request id must be a number or a string" };

        return ServerRequest { .id = id, .method = std::move(method), .params = std::move(params) };
    }

    if (!hasId)
        return Invalid { "JSON-RPC message has neither id nor method" };

    if (!message["id"].is_number_integer())
        return Invalid { std::format("Response id {} was not issued by this client", message["id"].dump()) };

    auto response = Response { .id = message["id"].get<int64_t>() };

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = json::getIntOr(err, "code", ErrorCodes::InternalError),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return Invalid { "JSON-RPC response has neither result nor error" };
    }

    return response;
}

auto encodeLine(const nlohmann::json& message) -> std::string
{
    // dump() escapes control characters, so the encoded object never contains a raw newline.
    return message.dump() + "\n";
}

auto decodeLine(std::string_view line) -> Result<nlohmann::json>
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    return json::parse(line).and_then([](nlohmann::json value) -> Result<nlohmann::json> {
        if (!value.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC message is not an object");
        return value;
    });
}

auto listChangedKind(std::string_view method) -> std::optional<std::string>
{
    constexpr auto prefix = std::string_view { "notifications/" };
    if (!method.starts_with(prefix))
        return std::nullopt;

    auto rest = method.substr(prefix.size());
    for (auto const suffix: { std::string_view { "/listChanged" }, std::string_view { "/list_changed" } })
    {
        if (rest.ends_with(suffix))
        {
            auto kind = rest.substr(0, rest.size() - suffix.size());
            if (kind == "tools" || kind == "resources" || kind == "prompts" || kind == "roots")
                return std::string(kind);
        }
    }
    return std::nullopt;
}

} // namespace mcphub::jsonrpc

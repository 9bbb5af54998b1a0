// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <charconv>
#include <format>

namespace mcpbridge::jsonrpc
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

auto responseId(const nlohmann::json& message) -> std::optional<int64_t>
{
    if (!message.is_object() || message.contains("method") || !message.contains("id"))
        return std::nullopt;

    auto const& id = message["id"];
    if (id.is_number_integer())
        return id.get<int64_t>();
    if (id.is_string())
    {
        // Some servers echo numeric ids as strings.
        auto const& text = id.get_ref<const std::string&>();
        auto value = int64_t { 0 };
        auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc {} && end == text.data() + text.size())
            return value;
    }
    return std::nullopt;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (!message.contains("method"))
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

} // namespace mcpbridge::jsonrpc

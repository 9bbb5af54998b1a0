// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace mcpbridge
{

namespace
{
    constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

    auto parseContentItem(const nlohmann::json& item) -> ContentItem
    {
        auto content = ContentItem { .type = json::getStringOr(item, "type", "text"), .text = {} };
        if (item.is_object() && item.contains("text") && item["text"].is_string())
            content.text = item["text"].get<std::string>();
        else
            content.text = item.dump();
        return content;
    }
} // namespace

McpClient::McpClient(std::unique_ptr<Transport> transport, std::chrono::milliseconds requestTimeout):
    _transport(std::move(transport)), _requestTimeout(requestTimeout)
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize() -> Result<McpServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "mcp-bridge" },
              { "version", "1.0.0" },
          } },
    };

    return sendRequest("initialize", std::move(params))
        .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            auto lock = std::lock_guard(_mutex);
            _capabilities.serverName =
                json::getStringOr(result.value("serverInfo", nlohmann::json {}), "name", "unknown");
            _capabilities.serverVersion =
                json::getStringOr(result.value("serverInfo", nlohmann::json {}), "version", "unknown");

            if (result.contains("capabilities"))
            {
                auto const& caps = result["capabilities"];
                _capabilities.hasTools = caps.contains("tools");
                _capabilities.hasResources = caps.contains("resources");
                _capabilities.hasPrompts = caps.contains("prompts");
            }

            auto notif = jsonrpc::makeNotification("notifications/initialized");
            if (auto sent = _transport->send(notif); !sent)
                return std::unexpected(sent.error());

            _initialized = true;
            log::info(
                "MCP server initialized: {} v{}", _capabilities.serverName, _capabilities.serverVersion);

            return _capabilities;
        });
}

auto McpClient::listTools() -> Result<std::vector<ToolDescriptor>>
{
    if (!isInitialized())
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto tools = std::vector<ToolDescriptor> {};
    auto cursor = std::string {};

    do
    {
        auto params = cursor.empty() ? nlohmann::json(nullptr) : nlohmann::json { { "cursor", cursor } };
        auto result = sendRequest("tools/list", std::move(params));
        if (!result)
            return std::unexpected(result.error());

        if (result->contains("tools") && (*result)["tools"].is_array())
        {
            for (const auto& toolJson: (*result)["tools"])
            {
                auto tool = ToolDescriptor {
                    .name = json::getStringOr(toolJson, "name", ""),
                    .description = json::getStringOr(toolJson, "description", ""),
                    .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
                    .outputSchema = std::nullopt,
                };
                if (tool.name.empty())
                {
                    log::warning("Ignoring tool without a name: {}", toolJson.dump());
                    continue;
                }
                if (toolJson.contains("outputSchema"))
                    tool.outputSchema = toolJson["outputSchema"];
                tools.push_back(std::move(tool));
            }
        }

        cursor = json::getStringOr(*result, "nextCursor", "");
    } while (!cursor.empty());

    return tools;
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolCallResult>
{
    if (!isInitialized())
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments },
    };

    return sendRequest("tools/call", std::move(params))
        .and_then([&name](const nlohmann::json& result) -> Result<ToolCallResult> {
            auto toolResult = ToolCallResult {};
            toolResult.isError = json::getBoolOr(result, "isError", false);

            if (result.contains("content") && result["content"].is_array())
            {
                for (const auto& item: result["content"])
                    toolResult.content.push_back(parseContentItem(item));
            }

            log::debug("Tool '{}' returned: {} (isError: {})", name, toolResult.text(), toolResult.isError);
            return toolResult;
        });
}

auto McpClient::close() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    _initialized = false;
    return _transport->close();
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _initialized;
}

auto McpClient::isConnected() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _transport->isConnected();
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto lock = std::lock_guard(_mutex);

    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    if (auto sent = _transport->send(request); !sent)
        return std::unexpected(sent.error());

    auto const deadline = std::chrono::steady_clock::now() + _requestTimeout;
    while (true)
    {
        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("Request '{}' timed out after {}ms", method, _requestTimeout.count()));

        auto message = _transport->receive(remaining);
        if (!message)
            return std::unexpected(message.error());

        // Skip notifications, server-initiated requests and stale responses.
        if (jsonrpc::responseId(*message) != id)
        {
            log::trace("Ignoring unrelated message while waiting for '{}': {}", method, message->dump());
            continue;
        }

        return jsonrpc::parseResponse(*message).and_then(
            [](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
                if (resp.error)
                {
                    return makeError(
                        ErrorCode::ProtocolError,
                        std::format("RPC error {}: {}", resp.error->code, resp.error->message));
                }
                return resp.result.value_or(nlohmann::json::object());
            });
    }
}

} // namespace mcpbridge

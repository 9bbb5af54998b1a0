// SPDX-License-Identifier: Apache-2.0
#include "ToolProxy.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcpbridge
{

ToolProxy::ToolProxy(std::string serverName,
                     ToolDescriptor descriptor,
                     std::weak_ptr<McpClient> client,
                     bool autoApprove):
    _serverName(std::move(serverName)),
    _descriptor(std::move(descriptor)),
    _client(std::move(client)),
    _validator(schema::Validator::compile(_descriptor.inputSchema)),
    _autoApprove(autoApprove)
{
}

auto ToolProxy::validate(const nlohmann::json& arguments) const -> VoidResult
{
    return _validator.validate(arguments.is_null() ? nlohmann::json::object() : arguments);
}

auto ToolProxy::invoke(const nlohmann::json& arguments) const -> ToolCallResult
{
    auto const effective = arguments.is_null() ? nlohmann::json::object() : arguments;

    if (auto valid = _validator.validate(effective); !valid)
    {
        log::debug("Rejected call to '{}': {}", _descriptor.name, valid.error().message);
        return ToolCallResult::failure(
            std::format("Invalid arguments for tool '{}': {}", _descriptor.name, valid.error().message));
    }

    auto client = _client.lock();
    if (!client || !client->isConnected())
        return ToolCallResult::failure(
            std::format("Server '{}' is no longer connected; tool '{}' is unavailable", _serverName, _descriptor.name));

    log::debug("Calling tool '{}' on '{}' with {}", _descriptor.name, _serverName, effective.dump());
    auto result = client->callTool(_descriptor.name, effective);
    if (!result)
    {
        log::error("Tool '{}' on '{}' failed: {}", _descriptor.name, _serverName, result.error());
        return ToolCallResult::failure(
            std::format("Error calling tool '{}': {}", _descriptor.name, result.error().message));
    }
    return std::move(*result);
}

auto ToolProxy::isAvailable() const -> bool
{
    auto client = _client.lock();
    return client && client->isConnected();
}

auto ToolProxy::catalogueEntry() const -> nlohmann::json
{
    auto entry = toJson(_descriptor);
    entry["autoApprove"] = _autoApprove;
    return entry;
}

} // namespace mcpbridge

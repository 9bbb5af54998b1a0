// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <schema/Validator.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace mcpbridge
{

/// @brief A local callable bound to one upstream tool.
///
/// Arguments are validated against the tool's input schema before anything is
/// sent upstream. The proxy does not keep its server's client alive; once the
/// client is gone, invocations fail in-band.
class ToolProxy
{
  public:
    ToolProxy(std::string serverName, ToolDescriptor descriptor, std::weak_ptr<McpClient> client, bool autoApprove);

    /// @brief Validates @p arguments and calls the tool.
    /// @return The tool's result; validation, connection and upstream failures are reported with isError set.
    [[nodiscard]] auto invoke(const nlohmann::json& arguments) const -> ToolCallResult;

    /// @brief Validates @p arguments without calling the tool.
    [[nodiscard]] auto validate(const nlohmann::json& arguments) const -> VoidResult;

    [[nodiscard]] auto name() const -> const std::string& { return _descriptor.name; }
    [[nodiscard]] auto serverName() const -> const std::string& { return _serverName; }
    [[nodiscard]] auto descriptor() const -> const ToolDescriptor& { return _descriptor; }
    [[nodiscard]] auto isAutoApproved() const -> bool { return _autoApprove; }

    /// @brief Returns true while the owning server's client is connected.
    [[nodiscard]] auto isAvailable() const -> bool;

    /// @brief Returns the catalogue entry: name, description, inputSchema, outputSchema and autoApprove.
    [[nodiscard]] auto catalogueEntry() const -> nlohmann::json;

  private:
    std::string _serverName;
    ToolDescriptor _descriptor;
    std::weak_ptr<McpClient> _client;
    schema::Validator _validator;
    bool _autoApprove = false;
};

} // namespace mcpbridge

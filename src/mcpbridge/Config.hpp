// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerDescriptor.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief The validated table of upstream servers, keyed by name.
struct ServersConfig
{
    std::map<std::string, ServerDescriptor> servers;

    /// @brief Returns the descriptor for @p name, or nullptr.
    [[nodiscard]] auto find(std::string_view name) const -> const ServerDescriptor*
    {
        auto const it = servers.find(std::string(name));
        return it != servers.end() ? &it->second : nullptr;
    }
};

/// @brief Validates one server entry of the configuration document.
/// @param server The JSON object describing the server.
/// @return One "path: message" entry per violation; empty if valid.
[[nodiscard]] auto validateServerConfig(const nlohmann::json& server) -> std::vector<std::string>;

/// @brief Validates and converts a configuration document.
///
/// The document must be an object whose only key is "mcpServers".
/// @param root The parsed configuration document.
/// @return The server table or a ConfigError listing every violation.
[[nodiscard]] auto parseServersConfig(const nlohmann::json& root) -> Result<ServersConfig>;

/// @brief Loads and validates the configuration document at @p path.
[[nodiscard]] auto loadServersConfig(std::string_view path) -> Result<ServersConfig>;

/// @brief Converts a server table back to its document form.
[[nodiscard]] auto toJson(const ServersConfig& config) -> nlohmann::json;

/// @brief Writes the configuration document to @p path, creating parent directories.
[[nodiscard]] auto saveServersConfig(std::string_view path, const ServersConfig& config) -> VoidResult;

/// @brief Returns the default configuration file path (mcp.config.json in the working directory).
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcpbridge

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcpbridge/Config.hpp>

#include <memory>
#include <optional>
#include <string>

namespace mcpbridge
{

/// @brief Command line front end over McpService.
///
/// Each command returns the process exit code.
class App
{
  public:
    explicit App(ServersConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Prints the merged catalogue or the tools of one server.
    [[nodiscard]] auto listTools(const std::optional<std::string>& serverName, bool asJson) -> int;

    /// @brief Validates @p argumentsJson against the tool's schema and calls it.
    [[nodiscard]] auto callTool(const std::string& serverName, const std::string& toolName, const std::string& argumentsJson)
        -> int;

    /// @brief Starts the servers and prints their state.
    [[nodiscard]] auto status() -> int;

    /// @brief Keeps the servers running until SIGINT or SIGTERM, then shuts down cleanly.
    [[nodiscard]] auto serve() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpbridge

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/InFlight.hpp>
#include <core/Retry.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/ServerDescriptor.hpp>
#include <process/Process.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpbridge
{

/// @brief Opens the protocol transport for a server from its descriptor and launch parameters.
using TransportFactory =
    std::function<Result<std::unique_ptr<Transport>>(const ServerDescriptor&, const ProcessConfig&)>;

/// @brief Timing knobs of the client registry.
struct RegistryOptions
{
    RetryPolicy connectRetry {};
    RetryPolicy catalogueRetry {};
    std::chrono::milliseconds requestTimeout = std::chrono::seconds(10);
};

/// @brief Keeps one initialized MCP client per running server.
///
/// Clients are connected lazily and reused while their transport stays connected.
/// Concurrent connection attempts for one server share a single attempt.
class ClientRegistry
{
  public:
    explicit ClientRegistry(TransportFactory transportFactory, RegistryOptions options = {});
    ~ClientRegistry();

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    /// @brief Returns the live client for @p descriptor, connecting and initializing it first if needed.
    ///
    /// Connection attempts are retried according to RegistryOptions::connectRetry.
    [[nodiscard]] auto ensureClient(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<McpClient>>;

    /// @brief Fetches the tool catalogue of a connected server, retrying on failure.
    /// @return The tools, NotRunning if there is no client, or CatalogueError.
    [[nodiscard]] auto listTools(const std::string& name) -> Result<std::vector<ToolDescriptor>>;

    /// @brief Returns the client for @p name, or nullptr.
    [[nodiscard]] auto client(const std::string& name) const -> std::shared_ptr<McpClient>;

    /// @brief Closes and forgets the client for @p name. Unknown names are ignored.
    [[nodiscard]] auto close(const std::string& name) -> VoidResult;

    /// @brief Closes all clients, continuing past failures.
    /// @return An aggregate error listing every failure, if any.
    [[nodiscard]] auto closeAll() -> VoidResult;

  private:
    auto connect(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<McpClient>>;

    TransportFactory _transportFactory;
    RegistryOptions _options;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<McpClient>> _clients;
    InFlight<std::string, Result<std::shared_ptr<McpClient>>> _connecting;
};

} // namespace mcpbridge

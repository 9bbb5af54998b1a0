// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/InFlight.hpp>
#include <mcp/ClientRegistry.hpp>
#include <mcpbridge/Config.hpp>
#include <net/EventStream.hpp>
#include <service/ToolProxy.hpp>
#include <supervisor/ServerSupervisor.hpp>
#include <supervisor/TransportSession.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

enum class ServiceState : std::uint8_t
{
    Uninitialized,
    Initializing,
    Ready,
    Error,
    ShuttingDown,
};

[[nodiscard]] constexpr auto serviceStateName(ServiceState state) -> std::string_view
{
    switch (state)
    {
        case ServiceState::Uninitialized: return "uninitialized";
        case ServiceState::Initializing: return "initializing";
        case ServiceState::Ready: return "ready";
        case ServiceState::Error: return "error";
        case ServiceState::ShuttingDown: return "shutting down";
    }
    return "uninitialized";
}

/// @brief What happens when two servers advertise a tool with the same name.
enum class DuplicateToolPolicy : std::uint8_t
{
    Shadow, ///< The server registered last wins.
    Error,  ///< Listing the merged catalogue fails with DuplicateTool.
};

struct ServiceOptions
{
    SessionOptions session {};
    RegistryOptions registry {};
    DuplicateToolPolicy duplicatePolicy = DuplicateToolPolicy::Shadow;
};

/// @brief Replaceable collaborators. Empty members select the production implementation.
struct ServiceDependencies
{
    SessionFactory sessionFactory;
    sse::EventStreamFactory eventStreamFactory;
    TransportFactory transportFactory;
};

struct ToolQuery
{
    std::optional<std::string> serverName;
};

using ToolList = std::vector<std::shared_ptr<const ToolProxy>>;

/// @brief Owns the servers, their clients and the merged tool namespace.
///
/// Construct one per configuration and pass it by reference. initialize() is
/// idempotent and concurrent callers share one attempt; cleanup() returns the
/// service to Uninitialized and may be called any number of times.
class McpService
{
  public:
    explicit McpService(ServersConfig config, ServiceOptions options = {}, ServiceDependencies dependencies = {});
    ~McpService();

    McpService(const McpService&) = delete;
    McpService& operator=(const McpService&) = delete;

    /// @brief Starts all enabled servers and registers their tools.
    /// @return Success if at least one server is ready; otherwise an error listing every server's reason.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Returns the merged tools, or the tools of one server.
    ///
    /// Initializes the service first if needed. For a named server, the errors
    /// NotFound, Disabled and NotRunning are distinct.
    [[nodiscard]] auto getTools(const ToolQuery& query = {}) -> Result<ToolList>;

    /// @brief Calls a tool on a server without re-validating the arguments.
    /// @return NotFound if the server has no live client; upstream failures come back with isError set.
    [[nodiscard]] auto executeFunction(const std::string& serverName,
                                       const std::string& toolName,
                                       const nlohmann::json& arguments) -> Result<ToolCallResult>;

    /// @brief Stops all servers, closes all clients and forgets all tools.
    [[nodiscard]] auto cleanup() -> VoidResult;

    [[nodiscard]] auto state() const -> ServiceState;
    [[nodiscard]] auto configuration() const -> const ServersConfig& { return _config; }
    [[nodiscard]] auto supervisor() -> ServerSupervisor& { return *_supervisor; }
    [[nodiscard]] auto supervisor() const -> const ServerSupervisor& { return *_supervisor; }

  private:
    [[nodiscard]] auto runInitialize() -> VoidResult;
    [[nodiscard]] auto registerServer(const std::string& name) -> Result<ToolList>;
    [[nodiscard]] auto mergedTools(const std::set<std::string>& running) const -> Result<ToolList>;
    [[nodiscard]] auto openTransport(const ServerDescriptor& descriptor, const ProcessConfig& launch)
        -> Result<std::unique_ptr<Transport>>;
    void dropServer(const std::string& name);
    void setState(ServiceState state);

    ServersConfig _config;
    ServiceOptions _options;

    mutable std::mutex _stateMutex;
    ServiceState _state = ServiceState::Uninitialized;

    std::mutex _lifecycleMutex;
    InFlight<int, VoidResult> _initializing;

    mutable std::mutex _toolsMutex;
    std::map<std::string, ToolList> _toolsByServer;
    std::vector<std::string> _registrationOrder;

    std::unique_ptr<ServerSupervisor> _supervisor;
    std::unique_ptr<ClientRegistry> _registry;
};

} // namespace mcpbridge

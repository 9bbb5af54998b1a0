// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/InFlight.hpp>
#include <mcpbridge/Config.hpp>
#include <supervisor/TransportSession.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcpbridge
{

enum class HealthStatus : std::uint8_t
{
    Starting,
    Ready,
    Degraded,
    Stopped,
};

[[nodiscard]] constexpr auto healthStatusName(HealthStatus status) -> std::string_view
{
    switch (status)
    {
        case HealthStatus::Starting: return "starting";
        case HealthStatus::Ready: return "ready";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Stopped: return "stopped";
    }
    return "stopped";
}

/// @brief A server the supervisor is currently running.
struct RunningServerHandle
{
    ServerDescriptor descriptor;
    std::shared_ptr<TransportSession> session;
    std::chrono::system_clock::time_point startTime;
    HealthStatus status = HealthStatus::Starting;
};

/// @brief Point-in-time view of a running server.
struct ServerStatus
{
    std::string name;
    TransportMode mode = TransportMode::Pipe;
    HealthStatus status = HealthStatus::Stopped;
    std::chrono::system_clock::time_point startTime;
};

enum class StartStatus : std::uint8_t
{
    Started,
    Failed,
    NotStarted, ///< Disabled in the configuration.
};

struct StartOutcome
{
    StartStatus status = StartStatus::NotStarted;
    std::optional<Error> error;
};

/// @brief Per-server outcomes of startAll().
struct StartReport
{
    std::map<std::string, StartOutcome> outcomes;

    /// @brief True if no server was started.
    [[nodiscard]] auto allFailed() const -> bool;

    [[nodiscard]] auto startedNames() const -> std::vector<std::string>;
};

enum class ServerChange : std::uint8_t
{
    Reconnected,
    Lost,
};

/// @brief Notified on the supervisor's watcher threads when a running server changes.
using ServerListener = std::function<void(const std::string& name, ServerChange change, const std::string& detail)>;

/// @brief Starts, watches and stops the configured upstream servers.
///
/// The table of running handles is the single source of truth for whether a
/// server runs. A handle is added when a start begins, and removed when the start
/// fails, when the server is stopped, or when its session is lost.
class ServerSupervisor
{
  public:
    explicit ServerSupervisor(SessionFactory sessionFactory);
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;

    /// @brief Replaces the descriptors used by start().
    void setConfiguration(ServersConfig config);

    /// @brief Starts every enabled server of @p config concurrently.
    ///
    /// Disabled servers are never spawned; their outcome is NotStarted.
    [[nodiscard]] auto startAll(const ServersConfig& config) -> StartReport;

    /// @brief Starts one configured server and waits until it is ready.
    ///
    /// Concurrent calls for the same name share one attempt. Starting a running
    /// server succeeds without relaunching it.
    [[nodiscard]] auto start(const std::string& name) -> VoidResult;

    /// @brief Stops one server. Failures are logged.
    void stop(const std::string& name);

    /// @brief Stops every running server concurrently and waits for all of them.
    void stopAll();

    [[nodiscard]] auto isRunning(const std::string& name) const -> bool;
    [[nodiscard]] auto runningNames() const -> std::set<std::string>;
    [[nodiscard]] auto status(const std::string& name) const -> std::optional<HealthStatus>;
    [[nodiscard]] auto statuses() const -> std::vector<ServerStatus>;

    /// @brief Returns the session of a running server, or nullptr.
    [[nodiscard]] auto session(const std::string& name) const -> std::shared_ptr<TransportSession>;

    /// @brief Registers a listener for reconnects and lost servers.
    void subscribe(ServerListener listener);

  private:
    struct Watcher
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    [[nodiscard]] auto launch(const std::string& name) -> VoidResult;
    void watch(const std::string& name, std::shared_ptr<TransportSession> session);
    void handleLost(const std::string& name, const std::shared_ptr<TransportSession>& session, const std::string& reason);
    void setStatus(const std::string& name, const std::shared_ptr<TransportSession>& session, HealthStatus status);
    void notify(const std::string& name, ServerChange change, const std::string& detail);
    void reapWatchers(bool all);

    SessionFactory _sessionFactory;

    mutable std::mutex _mutex;
    ServersConfig _config;
    std::map<std::string, RunningServerHandle> _running;
    std::vector<ServerListener> _listeners;

    std::mutex _watchersMutex;
    std::vector<Watcher> _watchers;

    InFlight<std::string, VoidResult> _starting;
};

} // namespace mcpbridge

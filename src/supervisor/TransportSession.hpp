// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <core/Error.hpp>
#include <mcp/ServerDescriptor.hpp>
#include <mcp/Transport.hpp>
#include <net/EventStream.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mcpbridge
{

/// @brief Something a running session reports to its supervisor.
struct SessionEvent
{
    enum class Kind : std::uint8_t
    {
        Stdout,      ///< A line the server printed on stdout.
        Stderr,      ///< A line the server printed on stderr.
        Dropped,     ///< The connection dropped; the session is trying to recover.
        Reconnected, ///< The connection dropped and was re-established.
        Lost,        ///< The session ended unexpectedly and will not recover.
    };

    Kind kind = Kind::Stdout;
    std::string text;
};

/// @brief Timing knobs shared by all session kinds.
struct SessionOptions
{
    /// Time a pipe server must stay alive after spawn before it counts as ready.
    std::chrono::milliseconds settleInterval = std::chrono::seconds(2);

    std::chrono::milliseconds healthInterval = std::chrono::seconds(1);
    int healthAttempts = 30;

    /// Bounds opening an event stream and each local-port protocol request.
    std::chrono::milliseconds connectionTimeout = std::chrono::seconds(10);

    int reconnectAttempts = 3;
    std::chrono::milliseconds reconnectInterval = std::chrono::seconds(2);

    std::chrono::milliseconds stopGracePeriod = std::chrono::seconds(5);
};

/// @brief One way of running and talking to an upstream server.
///
/// A session is started once and stopped once. While it runs it reports output
/// and connection changes on its event channel, which is closed when the session
/// stops or is lost.
class TransportSession
{
  public:
    virtual ~TransportSession() = default;

    /// @brief Launches or connects the server and waits until it is ready.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Stops the server and releases every resource. Safe to call repeatedly.
    [[nodiscard]] virtual auto stop() -> VoidResult = 0;

    /// @brief Returns true while the server process or stream is alive.
    [[nodiscard]] virtual auto isAlive() const -> bool = 0;

    /// @brief Returns the channel carrying this session's events.
    [[nodiscard]] virtual auto events() -> std::shared_ptr<Channel<SessionEvent>> = 0;

    /// @brief Opens a protocol transport speaking to the running server.
    [[nodiscard]] virtual auto openProtocolTransport() -> Result<std::unique_ptr<Transport>> = 0;
};

/// @brief Creates the session for a descriptor.
using SessionFactory = std::function<std::unique_ptr<TransportSession>(const ServerDescriptor&)>;

/// @brief Returns a factory creating the session kind matching each descriptor's transport mode.
[[nodiscard]] auto makeSessionFactory(SessionOptions options,
                                      sse::EventStreamFactory streamFactory = sse::curlEventStreamFactory())
    -> SessionFactory;

} // namespace mcpbridge

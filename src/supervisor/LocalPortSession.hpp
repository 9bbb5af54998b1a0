// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <supervisor/OutputPump.hpp>
#include <supervisor/TransportSession.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace mcpbridge
{

/// @brief Returns true if nothing is bound to 127.0.0.1:@p port.
[[nodiscard]] auto isLocalPortFree(std::uint16_t port) -> bool;

/// @brief Runs a server as a child process that serves HTTP on a local port.
///
/// The port is handed to the child in the PORT environment variable. The server
/// is ready once GET /health answers 200; the protocol is spoken via POST /mcp.
class LocalPortSession: public TransportSession
{
  public:
    LocalPortSession(ServerDescriptor descriptor, SessionOptions options);
    ~LocalPortSession() override;

    [[nodiscard]] auto start() -> VoidResult override;
    [[nodiscard]] auto stop() -> VoidResult override;
    [[nodiscard]] auto isAlive() const -> bool override;
    [[nodiscard]] auto events() -> std::shared_ptr<Channel<SessionEvent>> override;
    [[nodiscard]] auto openProtocolTransport() -> Result<std::unique_ptr<Transport>> override;

  private:
    [[nodiscard]] auto waitUntilHealthy(Process& process) -> VoidResult;
    [[nodiscard]] auto capturedOutput() const -> std::string;
    void onStdoutClosed();

    ServerDescriptor _descriptor;
    SessionOptions _options;
    std::shared_ptr<Channel<SessionEvent>> _events;

    mutable std::mutex _mutex;
    std::shared_ptr<Process> _process;
    std::unique_ptr<OutputPump> _stdoutPump;
    std::unique_ptr<OutputPump> _stderrPump;
    std::atomic<bool> _ready = false;
    std::atomic<bool> _stopping = false;
};

} // namespace mcpbridge

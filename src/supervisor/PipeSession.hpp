// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <supervisor/OutputPump.hpp>
#include <supervisor/TransportSession.hpp>

#include <atomic>
#include <memory>
#include <mutex>

namespace mcpbridge
{

/// @brief Runs a server as a child process spoken to over its stdin and stdout.
///
/// The protocol owns stdout; stderr is forwarded as session events. The session
/// is reported lost when stderr closes while the session was not being stopped.
class PipeSession: public TransportSession
{
  public:
    PipeSession(ServerDescriptor descriptor, SessionOptions options);
    ~PipeSession() override;

    [[nodiscard]] auto start() -> VoidResult override;
    [[nodiscard]] auto stop() -> VoidResult override;
    [[nodiscard]] auto isAlive() const -> bool override;
    [[nodiscard]] auto events() -> std::shared_ptr<Channel<SessionEvent>> override;
    [[nodiscard]] auto openProtocolTransport() -> Result<std::unique_ptr<Transport>> override;

  private:
    void onStderrClosed();

    ServerDescriptor _descriptor;
    SessionOptions _options;
    std::shared_ptr<Channel<SessionEvent>> _events;

    mutable std::mutex _mutex;
    std::shared_ptr<Process> _process;
    std::unique_ptr<OutputPump> _stderrPump;
    std::atomic<bool> _ready = false;
    std::atomic<bool> _stopping = false;
};

} // namespace mcpbridge

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/SseTransport.hpp>
#include <net/EventStream.hpp>
#include <supervisor/TransportSession.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace mcpbridge
{

/// @brief Connects to a remote server that pushes messages over a text/event-stream.
///
/// The server announces where to POST client messages with an "endpoint" event and
/// sends JSON-RPC messages as "message" events. When the stream drops, the session
/// reconnects up to SessionOptions::reconnectAttempts times before it is lost.
class EventStreamSession: public TransportSession
{
  public:
    EventStreamSession(ServerDescriptor descriptor, SessionOptions options, sse::EventStreamFactory streamFactory);
    ~EventStreamSession() override;

    [[nodiscard]] auto start() -> VoidResult override;
    [[nodiscard]] auto stop() -> VoidResult override;
    [[nodiscard]] auto isAlive() const -> bool override;
    [[nodiscard]] auto events() -> std::shared_ptr<Channel<SessionEvent>> override;
    [[nodiscard]] auto openProtocolTransport() -> Result<std::unique_ptr<Transport>> override;

  private:
    [[nodiscard]] auto connect() -> Result<std::unique_ptr<sse::EventStream>>;
    [[nodiscard]] auto reconnect() -> bool;
    [[nodiscard]] auto waitUnlessStopping(std::chrono::milliseconds delay) -> bool;
    void readLoop();
    void handleEvent(const sse::Event& event);

    ServerDescriptor _descriptor;
    SessionOptions _options;
    sse::EventStreamFactory _streamFactory;
    std::shared_ptr<Channel<SessionEvent>> _events;
    std::shared_ptr<EventStreamLink> _link;

    mutable std::mutex _mutex;
    std::condition_variable _stopCv;
    std::unique_ptr<sse::EventStream> _stream;
    std::thread _reader;
    std::atomic<bool> _alive = false;
    std::atomic<bool> _stopping = false;
};

} // namespace mcpbridge

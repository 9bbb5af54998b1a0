// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpbridge
{

/// @brief State shared between an event-stream reader and the transports writing to it.
///
/// The reader publishes the POST endpoint announced by the server and pushes every
/// JSON-RPC message received on the stream into the inbox.
class EventStreamLink
{
  public:
    explicit EventStreamLink(std::map<std::string, std::string> headers = {});

    /// @brief Publishes the endpoint that accepts client-to-server messages.
    void setPostUrl(std::string url);

    /// @brief Waits until an endpoint has been published; std::nullopt on timeout or close.
    [[nodiscard]] auto waitForPostUrl(std::chrono::milliseconds timeout) -> std::optional<std::string>;

    /// @brief Forgets the endpoint, e.g. while reconnecting.
    void resetPostUrl();

    /// @brief Queues a message received on the stream.
    void deliver(nlohmann::json message);

    /// @brief Closes the link; pending and future receives fail.
    void close();

    [[nodiscard]] auto isClosed() const -> bool;
    [[nodiscard]] auto headers() const -> const std::map<std::string, std::string>& { return _headers; }
    [[nodiscard]] auto inbox() -> Channel<nlohmann::json>& { return _inbox; }

  private:
    std::map<std::string, std::string> _headers;
    Channel<nlohmann::json> _inbox;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::optional<std::string> _postUrl;
    bool _closed = false;
};

/// @brief Transport for servers that push messages over an event stream.
///
/// Messages are sent with HTTP POST to the endpoint announced on the stream;
/// responses arrive on the stream and are read from the shared link.
class SseTransport: public Transport
{
  public:
    /// @param link The link fed by the session's stream reader.
    /// @param requestTimeout Upper bound for a POST and for waiting on the endpoint announcement.
    explicit SseTransport(std::shared_ptr<EventStreamLink> link,
                          std::chrono::milliseconds requestTimeout = std::chrono::seconds(10));

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    [[nodiscard]] auto close() -> VoidResult override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    std::shared_ptr<EventStreamLink> _link;
    std::chrono::milliseconds _requestTimeout;
    bool _closed = false;
};

} // namespace mcpbridge

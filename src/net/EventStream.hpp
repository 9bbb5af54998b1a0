// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <core/Error.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcpbridge::sse
{

/// @brief One server-sent event.
struct Event
{
    std::string type = "message";
    std::string data;
    std::string id;
};

/// @brief Incremental parser for text/event-stream bodies.
///
/// Accepts arbitrary chunk boundaries and both LF and CRLF line endings.
class Parser
{
  public:
    /// @brief Feeds a chunk and returns the events it completed.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<Event>;

  private:
    void processLine(std::string_view line, std::vector<Event>& events);

    std::string _buffer;
    Event _current;
    bool _hasData = false;
};

/// @brief Where and how to open a stream.
struct StreamRequest
{
    std::string url;
    std::map<std::string, std::string> headers;
};

/// @brief A push-style connection delivering server-sent events.
class EventStream
{
  public:
    virtual ~EventStream() = default;

    /// @brief Opens the connection; blocks until the server accepted it or @p timeout expired.
    [[nodiscard]] virtual auto open(const StreamRequest& request, std::chrono::milliseconds timeout) -> VoidResult = 0;

    /// @brief Blocks for the next event; std::nullopt once the connection dropped or was closed.
    [[nodiscard]] virtual auto next() -> std::optional<Event> = 0;

    /// @brief Closes the connection and wakes a blocked next().
    virtual void close() = 0;
};

/// @brief Creates a fresh, unopened stream for every (re)connection attempt.
using EventStreamFactory = std::function<std::unique_ptr<EventStream>()>;

/// @brief EventStream backed by a libcurl transfer running on its own thread.
class CurlEventStream: public EventStream
{
  public:
    CurlEventStream();
    ~CurlEventStream() override;

    CurlEventStream(const CurlEventStream&) = delete;
    CurlEventStream& operator=(const CurlEventStream&) = delete;

    [[nodiscard]] auto open(const StreamRequest& request, std::chrono::milliseconds timeout) -> VoidResult override;
    [[nodiscard]] auto next() -> std::optional<Event> override;
    void close() override;

  private:
    struct Impl;
    std::shared_ptr<Impl> _impl;
    std::thread _worker;
};

/// @brief Returns a factory producing CurlEventStream instances.
[[nodiscard]] auto curlEventStreamFactory() -> EventStreamFactory;

} // namespace mcpbridge::sse

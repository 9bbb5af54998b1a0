// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <process/Process.hpp>
#include <supervisor/TransportSession.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpbridge
{

/// @brief Forwards the lines a child writes to one of its output pipes as session events.
///
/// Keeps the last few lines so that startup failures can report what the server printed.
class OutputPump
{
  public:
    /// @param onEndOfStream Called on the pump thread when the pipe closes without stop() having been called.
    OutputPump(std::shared_ptr<Process> process,
               ProcessStream stream,
               std::shared_ptr<Channel<SessionEvent>> events,
               std::function<void()> onEndOfStream = {});
    ~OutputPump();

    OutputPump(const OutputPump&) = delete;
    OutputPump& operator=(const OutputPump&) = delete;

    /// @brief Stops reading and joins the pump thread.
    void stop();

    /// @brief Waits up to @p timeout for the pipe to reach end of stream on its own.
    void drain(std::chrono::milliseconds timeout);

    /// @brief Returns the most recent lines, oldest first.
    [[nodiscard]] auto tail() const -> std::deque<std::string>;

  private:
    void run();
    void emitLine(std::string line);

    std::shared_ptr<Process> _process;
    ProcessStream _stream;
    std::shared_ptr<Channel<SessionEvent>> _events;
    std::function<void()> _onEndOfStream;

    std::atomic<bool> _stopping = false;
    mutable std::mutex _tailMutex;
    std::condition_variable _finishedCv;
    bool _finished = false;
    std::deque<std::string> _tail;
    std::thread _thread;
};

/// @brief Formats captured output lines for inclusion in an error message.
[[nodiscard]] auto formatOutputTail(const std::deque<std::string>& lines) -> std::string;

} // namespace mcpbridge

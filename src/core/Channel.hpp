// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mcpbridge
{

/// @brief A closable, thread-safe FIFO used to pass events between producer and consumer threads.
///
/// Values pushed before close() are still delivered; receive() returns std::nullopt
/// only once the channel is closed and drained.
template <typename T>
class Channel
{
  public:
    /// @brief Appends a value. Returns false if the channel is already closed.
    auto push(T value) -> bool
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (_closed)
                return false;
            _queue.push_back(std::move(value));
        }
        _cv.notify_one();
        return true;
    }

    /// @brief Blocks until a value is available or the channel is closed and empty.
    [[nodiscard]] auto receive() -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, [this] { return !_queue.empty() || _closed; });
        return popLocked();
    }

    /// @brief Like receive(), but gives up after @p timeout.
    [[nodiscard]] auto receiveFor(std::chrono::milliseconds timeout) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, timeout, [this] { return !_queue.empty() || _closed; });
        return popLocked();
    }

    /// @brief Returns the next value if one is queued, without blocking.
    [[nodiscard]] auto tryReceive() -> std::optional<T>
    {
        auto lock = std::lock_guard(_mutex);
        return popLocked();
    }

    /// @brief Closes the channel and wakes all waiting consumers.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto isClosed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

  private:
    auto popLocked() -> std::optional<T>
    {
        if (_queue.empty())
            return std::nullopt;
        auto value = std::move(_queue.front());
        _queue.pop_front();
        return value;
    }

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<T> _queue;
    bool _closed = false;
};

} // namespace mcpbridge

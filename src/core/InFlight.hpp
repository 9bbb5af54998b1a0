// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <exception>
#include <future>
#include <map>
#include <mutex>

namespace mcpbridge
{

/// @brief Memoizes concurrently running operations by key.
///
/// The first caller for a key runs the operation; callers arriving while it runs
/// block on the same shared future and receive the same value. Once the operation
/// completes, the key is forgotten and the next call runs the operation again.
template <typename Key, typename T>
class InFlight
{
  public:
    template <typename Operation>
    auto run(const Key& key, Operation&& operation) -> T
    {
        auto promise = std::promise<T> {};
        auto future = std::shared_future<T> {};
        {
            auto lock = std::lock_guard(_mutex);
            if (auto const it = _pending.find(key); it != _pending.end())
                future = it->second;
            else
                _pending.emplace(key, promise.get_future().share());
        }

        if (future.valid())
            return future.get();

        try
        {
            auto value = operation();
            promise.set_value(value);
            forget(key);
            return value;
        }
        catch (...)
        {
            promise.set_exception(std::current_exception());
            forget(key);
            throw;
        }
    }

    /// @brief Returns true while an operation for @p key is running.
    [[nodiscard]] auto isPending(const Key& key) const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _pending.contains(key);
    }

  private:
    void forget(const Key& key)
    {
        auto lock = std::lock_guard(_mutex);
        _pending.erase(key);
    }

    mutable std::mutex _mutex;
    std::map<Key, std::shared_future<T>> _pending;
};

} // namespace mcpbridge

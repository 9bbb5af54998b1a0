// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <thread>
#include <type_traits>

namespace mcpbridge
{

/// @brief Bounded retry with a fixed delay between attempts.
struct RetryPolicy
{
    int maxAttempts = 3;
    std::chrono::milliseconds delay = std::chrono::seconds(2);
};

/// @brief Predicate deciding whether a failed attempt may be retried.
using RetryPredicate = std::function<bool(const Error&)>;

/// @brief Observer called before each retry with the next attempt number (2-based) and the last error.
using RetryObserver = std::function<void(int nextAttempt, const Error& lastError)>;

/// @brief Runs @p operation until it succeeds, the error is not retryable, or the attempts are exhausted.
///
/// @p operation must return a Result<T> or VoidResult. The last error is returned on failure.
/// @param policy Attempt count and delay.
/// @param operation The operation to run; receives the 1-based attempt number.
/// @param isRetryable Optional predicate; all errors are retried when empty.
/// @param onRetry Optional observer called before sleeping for the next attempt.
template <typename Operation>
[[nodiscard]] auto retry(const RetryPolicy& policy,
                         Operation&& operation,
                         const RetryPredicate& isRetryable = {},
                         const RetryObserver& onRetry = {}) -> std::invoke_result_t<Operation&, int>
{
    auto const attempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;

    for (auto attempt = 1;; ++attempt)
    {
        auto result = operation(attempt);
        if (result)
            return result;

        if (attempt >= attempts || (isRetryable && !isRetryable(result.error())))
            return result;

        if (onRetry)
            onRetry(attempt + 1, result.error());

        if (policy.delay.count() > 0)
            std::this_thread::sleep_for(policy.delay);
    }
}

} // namespace mcpbridge

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace mcpbridge::http
{

/// @brief A single HTTP request.
struct Request
{
    std::string method = "GET";
    std::string url;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout = std::chrono::seconds(10);
};

/// @brief A completed HTTP response.
struct Response
{
    long status = 0;
    std::string body;

    /// @brief Response headers with lower-cased names.
    std::map<std::string, std::string> headers;

    [[nodiscard]] auto isSuccess() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Initializes libcurl once per process. Safe to call repeatedly.
void ensureInitialized();

/// @brief Performs a blocking HTTP request.
/// @return The response (any status), TimeoutError, or TransportError on connection failure.
[[nodiscard]] auto perform(const Request& request) -> Result<Response>;

/// @brief Convenience GET.
[[nodiscard]] auto get(std::string url, std::chrono::milliseconds timeout) -> Result<Response>;

/// @brief Resolves @p reference against @p base (absolute URL, absolute path, or relative path).
[[nodiscard]] auto resolveUrl(std::string_view base, std::string_view reference) -> std::string;

} // namespace mcpbridge::http

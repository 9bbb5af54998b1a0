// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace mcpbridge
{

/// @brief Transport that POSTs JSON-RPC messages to a local HTTP endpoint.
///
/// Every POST is answered synchronously, either with a JSON body or with an
/// event-stream framed body; the messages it carries are queued for receive().
/// The session id returned by the server is echoed on subsequent requests.
class HttpTransport: public Transport
{
  public:
    /// @param url The MCP endpoint, e.g. http://127.0.0.1:3000/mcp.
    /// @param headers Extra headers sent with every request.
    /// @param requestTimeout Upper bound for a single POST.
    explicit HttpTransport(std::string url,
                           std::map<std::string, std::string> headers = {},
                           std::chrono::milliseconds requestTimeout = std::chrono::seconds(10));
    ~HttpTransport() override;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    [[nodiscard]] auto close() -> VoidResult override;
    [[nodiscard]] auto isConnected() const -> bool override;

    [[nodiscard]] auto url() const -> const std::string& { return _url; }

  private:
    void enqueueBody(std::string_view contentType, std::string_view body);

    std::string _url;
    std::map<std::string, std::string> _headers;
    std::chrono::milliseconds _requestTimeout;
    Channel<nlohmann::json> _inbox;

    mutable std::mutex _mutex;
    std::string _sessionId;
};

} // namespace mcpbridge

// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <net/EventStream.hpp>
#include <net/HttpClient.hpp>

#include <format>

namespace mcpbridge
{

namespace
{
    constexpr auto SessionHeader = std::string_view { "mcp-session-id" };
}

HttpTransport::HttpTransport(std::string url,
                             std::map<std::string, std::string> headers,
                             std::chrono::milliseconds requestTimeout):
    _url(std::move(url)), _headers(std::move(headers)), _requestTimeout(requestTimeout)
{
}

HttpTransport::~HttpTransport()
{
    _inbox.close();
}

auto HttpTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (_inbox.isClosed())
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto request = http::Request {
        .method = "POST",
        .url = _url,
        .body = message.dump(),
        .headers = _headers,
        .timeout = _requestTimeout,
    };
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json, text/event-stream";
    {
        auto lock = std::lock_guard(_mutex);
        if (!_sessionId.empty())
            request.headers["Mcp-Session-Id"] = _sessionId;
    }

    auto response = http::perform(request);
    if (!response)
        return std::unexpected(response.error());

    if (!response->isSuccess())
        return makeError(ErrorCode::TransportError,
                         std::format("POST {} returned HTTP {}: {}", _url, response->status, response->body));

    if (auto const it = response->headers.find(std::string(SessionHeader)); it != response->headers.end())
    {
        auto lock = std::lock_guard(_mutex);
        _sessionId = it->second;
    }

    auto const contentType = response->headers.contains("content-type") ? response->headers["content-type"] : "";
    enqueueBody(contentType, response->body);
    return {};
}

void HttpTransport::enqueueBody(std::string_view contentType, std::string_view body)
{
    if (body.empty())
        return;

    auto enqueue = [this](std::string_view text) {
        auto parsed = json::parse(text);
        if (!parsed)
        {
            log::debug("Ignoring non-JSON payload from {}: {}", _url, text);
            return;
        }
        if (parsed->is_array())
        {
            for (auto& item: *parsed)
                _inbox.push(std::move(item));
        }
        else
            _inbox.push(std::move(*parsed));
    };

    if (contentType.starts_with("text/event-stream"))
    {
        auto parser = sse::Parser {};
        auto events = parser.feed(body);
        auto tail = parser.feed("\n\n");
        events.insert(events.end(), tail.begin(), tail.end());
        for (const auto& event: events)
        {
            if (event.type == "message")
                enqueue(event.data);
        }
        return;
    }

    enqueue(body);
}

auto HttpTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (auto message = _inbox.receiveFor(timeout))
        return std::move(*message);

    if (_inbox.isClosed())
        return makeError(ErrorCode::TransportError, "Transport not connected");
    return makeError(ErrorCode::TimeoutError, std::format("No response from {} within {}ms", _url, timeout.count()));
}

auto HttpTransport::close() -> VoidResult
{
    _inbox.close();
    return {};
}

auto HttpTransport::isConnected() const -> bool
{
    return !_inbox.isClosed();
}

} // namespace mcpbridge

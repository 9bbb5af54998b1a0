// SPDX-License-Identifier: Apache-2.0
#include "SseTransport.hpp"

#include <core/Log.hpp>
#include <net/HttpClient.hpp>

#include <format>

namespace mcpbridge
{

EventStreamLink::EventStreamLink(std::map<std::string, std::string> headers): _headers(std::move(headers))
{
}

void EventStreamLink::setPostUrl(std::string url)
{
    {
        auto lock = std::lock_guard(_mutex);
        _postUrl = std::move(url);
    }
    _cv.notify_all();
}

auto EventStreamLink::waitForPostUrl(std::chrono::milliseconds timeout) -> std::optional<std::string>
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return _postUrl.has_value() || _closed; });
    if (_closed)
        return std::nullopt;
    return _postUrl;
}

void EventStreamLink::resetPostUrl()
{
    auto lock = std::lock_guard(_mutex);
    _postUrl.reset();
}

void EventStreamLink::deliver(nlohmann::json message)
{
    _inbox.push(std::move(message));
}

void EventStreamLink::close()
{
    {
        auto lock = std::lock_guard(_mutex);
        _closed = true;
    }
    _cv.notify_all();
    _inbox.close();
}

auto EventStreamLink::isClosed() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closed;
}

SseTransport::SseTransport(std::shared_ptr<EventStreamLink> link, std::chrono::milliseconds requestTimeout):
    _link(std::move(link)), _requestTimeout(requestTimeout)
{
}

auto SseTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!isConnected())
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const postUrl = _link->waitForPostUrl(_requestTimeout);
    if (!postUrl)
    {
        if (_link->isClosed())
            return makeError(ErrorCode::TransportError, "Event stream closed");
        return makeError(ErrorCode::TimeoutError,
                         std::format("Server announced no message endpoint within {}ms", _requestTimeout.count()));
    }

    auto request = http::Request {
        .method = "POST",
        .url = *postUrl,
        .body = message.dump(),
        .headers = _link->headers(),
        .timeout = _requestTimeout,
    };
    request.headers["Content-Type"] = "application/json";

    auto response = http::perform(request);
    if (!response)
        return std::unexpected(response.error());
    if (!response->isSuccess())
        return makeError(ErrorCode::TransportError,
                         std::format("POST {} returned HTTP {}: {}", *postUrl, response->status, response->body));
    return {};
}

auto SseTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (_closed)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    if (auto message = _link->inbox().receiveFor(timeout))
        return std::move(*message);

    if (_link->inbox().isClosed())
        return makeError(ErrorCode::TransportError, "Event stream closed");
    return makeError(ErrorCode::TimeoutError, std::format("No message on event stream within {}ms", timeout.count()));
}

auto SseTransport::close() -> VoidResult
{
    // The stream belongs to the session; closing the transport only detaches from it.
    _closed = true;
    return {};
}

auto SseTransport::isConnected() const -> bool
{
    return !_closed && !_link->isClosed();
}

} // namespace mcpbridge

// SPDX-License-Identifier: Apache-2.0
#include "EventStreamSession.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <net/HttpClient.hpp>

#include <format>

namespace mcpbridge
{

EventStreamSession::EventStreamSession(ServerDescriptor descriptor,
                                       SessionOptions options,
                                       sse::EventStreamFactory streamFactory):
    _descriptor(std::move(descriptor)),
    _options(options),
    _streamFactory(std::move(streamFactory)),
    _events(std::make_shared<Channel<SessionEvent>>())
{
    if (_descriptor.eventStream)
    {
        _link = std::make_shared<EventStreamLink>(_descriptor.eventStream->headers);
        if (_descriptor.eventStream->reconnectInterval)
            _options.reconnectInterval = *_descriptor.eventStream->reconnectInterval;
    }
}

EventStreamSession::~EventStreamSession()
{
    if (auto result = stop(); !result)
        log::error("Failed to stop '{}': {}", _descriptor.name, result.error().message);
}

auto EventStreamSession::start() -> VoidResult
{
    if (!_descriptor.eventStream || !_link)
        return makeError(ErrorCode::ConfigError,
                         std::format("Server '{}' has no event stream options", _descriptor.name));

    auto stream = connect();
    if (!stream)
        return std::unexpected(stream.error());

    {
        auto lock = std::lock_guard(_mutex);
        _stream = std::move(*stream);
    }
    _alive = true;
    _reader = std::thread([this] { readLoop(); });

    log::info("Connected to event stream of '{}' at {}", _descriptor.name, _descriptor.eventStream->endpoint);
    return {};
}

auto EventStreamSession::connect() -> Result<std::unique_ptr<sse::EventStream>>
{
    auto stream = _streamFactory();
    auto request = sse::StreamRequest {
        .url = _descriptor.eventStream->endpoint,
        .headers = _descriptor.eventStream->headers,
    };

    if (auto opened = stream->open(request, _options.connectionTimeout); !opened)
        return std::unexpected(opened.error());
    return stream;
}

void EventStreamSession::readLoop()
{
    while (!_stopping)
    {
        sse::EventStream* stream = nullptr;
        {
            auto lock = std::lock_guard(_mutex);
            stream = _stream.get();
        }

        while (auto event = stream->next())
            handleEvent(*event);

        if (_stopping)
            break;

        log::warning("Event stream of '{}' dropped", _descriptor.name);
        _link->resetPostUrl();
        _events->push(SessionEvent { .kind = SessionEvent::Kind::Dropped, .text = {} });

        if (!reconnect())
        {
            if (_stopping)
                break;

            _alive = false;
            _link->close();
            _events->push(SessionEvent {
                .kind = SessionEvent::Kind::Lost,
                .text = std::format("Event stream lost after {} reconnect attempts", _options.reconnectAttempts),
            });
            break;
        }

        _events->push(SessionEvent { .kind = SessionEvent::Kind::Reconnected, .text = {} });
    }
}

auto EventStreamSession::reconnect() -> bool
{
    for (auto attempt = 1; attempt <= _options.reconnectAttempts; ++attempt)
    {
        if (!waitUnlessStopping(_options.reconnectInterval))
            return false;

        auto stream = connect();
        if (!stream)
        {
            log::warning("Reconnecting '{}' failed ({}/{}): {}",
                         _descriptor.name,
                         attempt,
                         _options.reconnectAttempts,
                         stream.error().message);
            continue;
        }

        auto lock = std::lock_guard(_mutex);
        if (_stopping)
        {
            (*stream)->close();
            return false;
        }
        _stream->close();
        _stream = std::move(*stream);
        log::info("Reconnected to event stream of '{}'", _descriptor.name);
        return true;
    }
    return false;
}

auto EventStreamSession::waitUnlessStopping(std::chrono::milliseconds delay) -> bool
{
    auto lock = std::unique_lock(_mutex);
    return !_stopCv.wait_for(lock, delay, [this] { return _stopping.load(); });
}

void EventStreamSession::handleEvent(const sse::Event& event)
{
    if (event.type == "endpoint")
    {
        auto url = http::resolveUrl(_descriptor.eventStream->endpoint, event.data);
        log::debug("'{}' accepts messages at {}", _descriptor.name, url);
        _link->setPostUrl(std::move(url));
        return;
    }

    if (event.type == "message")
    {
        auto message = json::parse(event.data);
        if (!message)
        {
            log::debug("Ignoring malformed message from '{}': {}", _descriptor.name, event.data);
            return;
        }
        _link->deliver(std::move(*message));
        return;
    }

    log::trace("Ignoring '{}' event from '{}'", event.type, _descriptor.name);
}

auto EventStreamSession::stop() -> VoidResult
{
    {
        auto lock = std::lock_guard(_mutex);
        _stopping = true;
        if (_stream)
            _stream->close();
    }
    _stopCv.notify_all();

    if (_reader.joinable() && _reader.get_id() != std::this_thread::get_id())
        _reader.join();

    if (_alive.exchange(false))
        log::info("Disconnected from event stream of '{}'", _descriptor.name);

    {
        auto lock = std::lock_guard(_mutex);
        _stream.reset();
    }
    if (_link)
        _link->close();
    _events->close();
    return {};
}

auto EventStreamSession::isAlive() const -> bool
{
    return _alive;
}

auto EventStreamSession::events() -> std::shared_ptr<Channel<SessionEvent>>
{
    return _events;
}

auto EventStreamSession::openProtocolTransport() -> Result<std::unique_ptr<Transport>>
{
    if (!_alive || !_link)
        return makeError(ErrorCode::NotRunning, std::format("Server '{}' is not connected", _descriptor.name));
    return std::make_unique<SseTransport>(_link, _options.connectionTimeout);
}

} // namespace mcpbridge

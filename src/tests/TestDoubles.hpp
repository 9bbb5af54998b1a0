// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>
#include <net/EventStream.hpp>
#include <supervisor/ServerSupervisor.hpp>
#include <supervisor/TransportSession.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpbridge::test
{

/// @brief Transport double. Replies come from a queue of canned messages or from a responder.
class MockTransport: public Transport
{
  public:
    using Responder = std::function<std::optional<nlohmann::json>(const nlohmann::json& request)>;

    MockTransport() = default;
    explicit MockTransport(Responder responder): _responder(std::move(responder)) {}

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        if (_closed)
            return makeError(ErrorCode::TransportError, "Transport not connected");

        {
            auto lock = std::lock_guard(_mutex);
            _sent.push_back(message);
        }

        if (_responder && message.contains("id"))
        {
            if (auto reply = _responder(message))
                _inbox.push(std::move(*reply));
        }
        return {};
    }

    auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (!_queued.empty())
            {
                auto message = std::move(_queued.front());
                _queued.pop_front();
                return message;
            }
        }

        if (auto message = _inbox.receiveFor(timeout))
            return std::move(*message);
        if (_inbox.isClosed())
            return makeError(ErrorCode::TransportError, "Transport closed");
        return makeError(ErrorCode::TimeoutError, "No mock response");
    }

    auto close() -> VoidResult override
    {
        _closed = true;
        _inbox.close();
        if (failOnClose)
            return makeError(ErrorCode::TransportError, "close failed");
        return {};
    }

    auto isConnected() const -> bool override { return !_closed; }

    void queueResponse(nlohmann::json response)
    {
        auto lock = std::lock_guard(_mutex);
        _queued.push_back(std::move(response));
    }

    [[nodiscard]] auto sentMessages() const -> std::vector<nlohmann::json>
    {
        auto lock = std::lock_guard(_mutex);
        return _sent;
    }

    [[nodiscard]] auto sentMethods() const -> std::vector<std::string>
    {
        auto methods = std::vector<std::string> {};
        for (const auto& message: sentMessages())
            methods.push_back(message.value("method", ""));
        return methods;
    }

    bool failOnClose = false;

  private:
    Responder _responder;
    mutable std::mutex _mutex;
    std::deque<nlohmann::json> _queued;
    std::vector<nlohmann::json> _sent;
    Channel<nlohmann::json> _inbox;
    std::atomic<bool> _closed = false;
};

inline auto makeTool(std::string name, nlohmann::json inputSchema = nlohmann::json::object()) -> ToolDescriptor
{
    return ToolDescriptor {
        .name = std::move(name),
        .description = "test tool",
        .inputSchema = std::move(inputSchema),
        .outputSchema = std::nullopt,
    };
}

/// @brief A responder that behaves like a minimal MCP server offering @p tools.
///
/// tools/call answers with "<tool> called with <arguments>"; a tool named "fail"
/// answers with a JSON-RPC error.
inline auto fakeMcpServer(std::string serverName, std::vector<ToolDescriptor> tools) -> MockTransport::Responder
{
    return [serverName = std::move(serverName), tools = std::move(tools)](const nlohmann::json& request)
               -> std::optional<nlohmann::json> {
        auto const method = request.value("method", "");
        auto reply = nlohmann::json { { "jsonrpc", "2.0" }, { "id", request["id"] } };

        if (method == "initialize")
        {
            reply["result"] = {
                { "protocolVersion", "2024-11-05" },
                { "serverInfo", { { "name", serverName }, { "version", "1.0" } } },
                { "capabilities", { { "tools", nlohmann::json::object() } } },
            };
        }
        else if (method == "tools/list")
        {
            auto list = nlohmann::json::array();
            for (const auto& tool: tools)
                list.push_back(toJson(tool));
            reply["result"] = { { "tools", std::move(list) } };
        }
        else if (method == "tools/call")
        {
            auto const name = request["params"].value("name", "");
            if (name == "fail")
            {
                reply["error"] = { { "code", -32000 }, { "message", "tool exploded" } };
            }
            else
            {
                auto const text = name + " called with " + request["params"]["arguments"].dump();
                reply["result"] = {
                    { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
                };
            }
        }
        else
        {
            reply["error"] = { { "code", -32601 }, { "message", "Method not found" } };
        }
        return reply;
    };
}

/// @brief Session double: counts starts and lets tests report the session as lost.
class FakeSession: public TransportSession
{
  public:
    struct Control
    {
        std::atomic<int> starts = 0;
        std::atomic<int> stops = 0;
        std::chrono::milliseconds startDelay { 0 };
        std::optional<Error> startError;
    };

    explicit FakeSession(std::shared_ptr<Control> control): _control(std::move(control)) {}

    auto start() -> VoidResult override
    {
        ++_control->starts;
        if (_control->startDelay.count() > 0)
            std::this_thread::sleep_for(_control->startDelay);
        if (_control->startError)
            return std::unexpected(*_control->startError);
        _alive = true;
        return {};
    }

    auto stop() -> VoidResult override
    {
        if (_alive.exchange(false))
            ++_control->stops;
        _events->close();
        return {};
    }

    auto isAlive() const -> bool override { return _alive; }

    auto events() -> std::shared_ptr<Channel<SessionEvent>> override { return _events; }

    auto openProtocolTransport() -> Result<std::unique_ptr<Transport>> override
    {
        return makeError(ErrorCode::NotRunning, "FakeSession has no protocol transport");
    }

    void lose(std::string reason) { _events->push(SessionEvent { .kind = SessionEvent::Kind::Lost, .text = std::move(reason) }); }

  private:
    std::shared_ptr<Control> _control;
    std::shared_ptr<Channel<SessionEvent>> _events = std::make_shared<Channel<SessionEvent>>();
    std::atomic<bool> _alive = false;
};

/// @brief Controls a family of fake event streams: how many opens succeed and when the live one drops.
class FakeStreamControl
{
  public:
    std::atomic<int> opens = 0;
    std::atomic<int> allowedOpens = 1;

    void attach(std::shared_ptr<Channel<sse::Event>> events)
    {
        auto lock = std::lock_guard(_mutex);
        _current = std::move(events);
    }

    /// @brief Ends the currently open stream as if the server went away.
    void drop()
    {
        auto lock = std::lock_guard(_mutex);
        if (_current)
            _current->close();
    }

  private:
    std::mutex _mutex;
    std::shared_ptr<Channel<sse::Event>> _current;
};

class FakeEventStream: public sse::EventStream
{
  public:
    explicit FakeEventStream(std::shared_ptr<FakeStreamControl> control): _control(std::move(control)) {}

    auto open(const sse::StreamRequest& request, std::chrono::milliseconds /*timeout*/) -> VoidResult override
    {
        if (++_control->opens > _control->allowedOpens)
            return makeError(ErrorCode::TransportError, "connection refused");

        _control->attach(_events);
        _events->push(sse::Event { .type = "endpoint", .data = "/messages?session=1", .id = {} });
        _url = request.url;
        return {};
    }

    auto next() -> std::optional<sse::Event> override { return _events->receive(); }

    void close() override { _events->close(); }

  private:
    std::shared_ptr<FakeStreamControl> _control;
    std::shared_ptr<Channel<sse::Event>> _events = std::make_shared<Channel<sse::Event>>();
    std::string _url;
};

inline auto fakeStreamFactory(std::shared_ptr<FakeStreamControl> control) -> sse::EventStreamFactory
{
    return [control = std::move(control)] { return std::make_unique<FakeEventStream>(control); };
}

/// @brief Records supervisor notifications.
class Notifications
{
  public:
    struct Entry
    {
        std::string name;
        ServerChange change = ServerChange::Lost;
        std::string detail;
    };

    [[nodiscard]] auto listener() -> ServerListener
    {
        return [this](const std::string& name, ServerChange change, const std::string& detail) {
            auto lock = std::lock_guard(_mutex);
            _entries.push_back(Entry { .name = name, .change = change, .detail = detail });
        };
    }

    [[nodiscard]] auto count(ServerChange change) const -> int
    {
        auto lock = std::lock_guard(_mutex);
        return static_cast<int>(std::ranges::count(_entries, change, &Entry::change));
    }

    [[nodiscard]] auto last() const -> Entry
    {
        auto lock = std::lock_guard(_mutex);
        return _entries.empty() ? Entry {} : _entries.back();
    }

  private:
    mutable std::mutex _mutex;
    std::vector<Entry> _entries;
};

/// @brief Polls @p condition until it holds or @p timeout expires.
inline auto eventually(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace mcpbridge::test

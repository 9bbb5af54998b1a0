// SPDX-License-Identifier: Apache-2.0
#include "OutputPump.hpp"

#include <core/Log.hpp>

#include <array>

namespace mcpbridge
{

namespace
{
    constexpr auto MaxTailLines = std::size_t { 20 };
    constexpr auto PollInterval = std::chrono::milliseconds(100);
} // namespace

OutputPump::OutputPump(std::shared_ptr<Process> process,
                       ProcessStream stream,
                       std::shared_ptr<Channel<SessionEvent>> events,
                       std::function<void()> onEndOfStream):
    _process(std::move(process)),
    _stream(stream),
    _events(std::move(events)),
    _onEndOfStream(std::move(onEndOfStream)),
    _thread([this] { run(); })
{
}

OutputPump::~OutputPump()
{
    stop();
}

void OutputPump::stop()
{
    _stopping = true;
    if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
        _thread.join();
}

void OutputPump::drain(std::chrono::milliseconds timeout)
{
    auto lock = std::unique_lock(_tailMutex);
    _finishedCv.wait_for(lock, timeout, [this] { return _finished; });
}

auto OutputPump::tail() const -> std::deque<std::string>
{
    auto lock = std::lock_guard(_tailMutex);
    return _tail;
}

void OutputPump::run()
{
    auto pending = std::string {};
    auto buf = std::array<char, 4096> {};

    while (!_stopping)
    {
        auto bytesRead = _process->read(_stream, buf, PollInterval);
        if (!bytesRead)
        {
            if (bytesRead.error().code == ErrorCode::TimeoutError)
                continue;
            log::debug("Reading output of '{}' failed: {}", _process->command(), bytesRead.error().message);
            break;
        }
        if (*bytesRead == 0)
            break;

        pending.append(buf.data(), *bytesRead);
        for (auto newline = pending.find('\n'); newline != std::string::npos; newline = pending.find('\n'))
        {
            auto line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (line.ends_with('\r'))
                line.pop_back();
            if (!line.empty())
                emitLine(std::move(line));
        }
    }

    if (!pending.empty())
        emitLine(std::move(pending));

    {
        auto lock = std::lock_guard(_tailMutex);
        _finished = true;
    }
    _finishedCv.notify_all();

    if (!_stopping && _onEndOfStream)
        _onEndOfStream();
}

void OutputPump::emitLine(std::string line)
{
    {
        auto lock = std::lock_guard(_tailMutex);
        _tail.push_back(line);
        if (_tail.size() > MaxTailLines)
            _tail.pop_front();
    }

    auto const kind = _stream == ProcessStream::Stdout ? SessionEvent::Kind::Stdout : SessionEvent::Kind::Stderr;
    _events->push(SessionEvent { .kind = kind, .text = std::move(line) });
}

auto formatOutputTail(const std::deque<std::string>& lines) -> std::string
{
    if (lines.empty())
        return "(no output)";

    auto text = std::string {};
    for (const auto& line: lines)
    {
        text += "\n  ";
        text += line;
    }
    return text;
}

} // namespace mcpbridge

// SPDX-License-Identifier: Apache-2.0
#include "PipeSession.hpp"

#include <core/Log.hpp>
#include <mcp/LaunchParameters.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>
#include <thread>

namespace mcpbridge
{

namespace
{
    constexpr auto ExitPollInterval = std::chrono::milliseconds(20);
    constexpr auto ExitReapTimeout = std::chrono::seconds(1);

    auto describeExit(Process& process) -> std::string
    {
        auto const deadline = std::chrono::steady_clock::now() + ExitReapTimeout;
        while (process.isRunning() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(ExitPollInterval);

        if (auto const code = process.exitCode())
            return std::format("exited with code {}", *code);
        return "closed its output";
    }
} // namespace

PipeSession::PipeSession(ServerDescriptor descriptor, SessionOptions options):
    _descriptor(std::move(descriptor)), _options(options), _events(std::make_shared<Channel<SessionEvent>>())
{
}

PipeSession::~PipeSession()
{
    if (auto result = stop(); !result)
        log::error("Failed to stop '{}': {}", _descriptor.name, result.error().message);
}

auto PipeSession::start() -> VoidResult
{
    auto spawned = Process::spawn(buildLaunchParameters(_descriptor));
    if (!spawned)
        return std::unexpected(spawned.error());

    auto process = std::shared_ptr<Process>(std::move(*spawned));
    {
        auto lock = std::lock_guard(_mutex);
        _process = process;
        _stderrPump = std::make_unique<OutputPump>(
            process, ProcessStream::Stderr, _events, [this] { onStderrClosed(); });
    }
    log::info("Started '{}' (pid {}), waiting {}ms to settle",
              _descriptor.name,
              process->pid(),
              _options.settleInterval.count());

    auto const deadline = std::chrono::steady_clock::now() + _options.settleInterval;
    while (true)
    {
        if (!process->isRunning())
        {
            _stderrPump->drain(ExitReapTimeout);
            auto const tail = _stderrPump->tail();
            if (auto stopped = stop(); !stopped)
                log::debug("Cleanup after failed start of '{}': {}", _descriptor.name, stopped.error().message);
            return makeError(ErrorCode::LaunchError,
                             std::format("'{}' exited during startup with code {}. Output:{}",
                                         _descriptor.name,
                                         process->exitCode().value_or(-1),
                                         formatOutputTail(tail)));
        }

        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(ExitPollInterval, deadline - now));
    }

    _ready = true;
    return {};
}

void PipeSession::onStderrClosed()
{
    if (!_ready || _stopping)
        return;

    auto process = std::shared_ptr<Process> {};
    {
        auto lock = std::lock_guard(_mutex);
        process = _process;
    }
    if (!process)
        return;

    auto const reason = describeExit(*process);
    _ready = false;
    _events->push(SessionEvent { .kind = SessionEvent::Kind::Lost, .text = std::format("Process {}", reason) });
}

auto PipeSession::stop() -> VoidResult
{
    _stopping = true;
    _ready = false;

    auto process = std::shared_ptr<Process> {};
    auto pump = std::unique_ptr<OutputPump> {};
    {
        auto lock = std::lock_guard(_mutex);
        process = std::move(_process);
        pump = std::move(_stderrPump);
    }

    auto result = VoidResult {};
    if (process)
    {
        result = process->terminate(_options.stopGracePeriod);
        log::info("Stopped '{}'", _descriptor.name);
    }
    if (pump)
        pump->stop();

    _events->close();
    return result;
}

auto PipeSession::isAlive() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _ready && _process && _process->isRunning();
}

auto PipeSession::events() -> std::shared_ptr<Channel<SessionEvent>>
{
    return _events;
}

auto PipeSession::openProtocolTransport() -> Result<std::unique_ptr<Transport>>
{
    auto lock = std::lock_guard(_mutex);
    if (!_process)
        return makeError(ErrorCode::NotRunning, std::format("Server '{}' is not running", _descriptor.name));
    return std::make_unique<StdioTransport>(_process);
}

} // namespace mcpbridge

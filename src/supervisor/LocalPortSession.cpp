// SPDX-License-Identifier: Apache-2.0
#include "LocalPortSession.hpp"

#include <core/Log.hpp>
#include <core/Retry.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/LaunchParameters.hpp>
#include <net/HttpClient.hpp>

#include <algorithm>
#include <format>
#include <map>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mcpbridge
{

namespace
{
    constexpr auto MinProbeTimeout = std::chrono::milliseconds(500);
    constexpr auto OutputDrainTimeout = std::chrono::milliseconds(200);
} // namespace

auto isLocalPortFree(std::uint16_t port) -> bool
{
    auto const fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return false;

    auto const reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    auto address = sockaddr_in {};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    auto const bound = ::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) == 0;
    ::close(fd);
    return bound;
}

LocalPortSession::LocalPortSession(ServerDescriptor descriptor, SessionOptions options):
    _descriptor(std::move(descriptor)), _options(options), _events(std::make_shared<Channel<SessionEvent>>())
{
}

LocalPortSession::~LocalPortSession()
{
    if (auto result = stop(); !result)
        log::error("Failed to stop '{}': {}", _descriptor.name, result.error().message);
}

auto LocalPortSession::start() -> VoidResult
{
    if (!_descriptor.port)
        return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no port configured", _descriptor.name));

    auto const port = *_descriptor.port;
    if (!isLocalPortFree(port))
        return makeError(ErrorCode::LaunchError, std::format("Port {} is already in use", port));

    auto spawned = Process::spawn(buildLaunchParameters(_descriptor));
    if (!spawned)
        return std::unexpected(spawned.error());

    auto process = std::shared_ptr<Process>(std::move(*spawned));
    {
        auto lock = std::lock_guard(_mutex);
        _process = process;
        _stdoutPump = std::make_unique<OutputPump>(
            process, ProcessStream::Stdout, _events, [this] { onStdoutClosed(); });
        _stderrPump = std::make_unique<OutputPump>(process, ProcessStream::Stderr, _events);
    }
    log::info("Started '{}' (pid {}) on port {}", _descriptor.name, process->pid(), port);

    if (auto healthy = waitUntilHealthy(*process); !healthy)
    {
        auto const output = capturedOutput();
        if (auto stopped = stop(); !stopped)
            log::debug("Cleanup after failed start of '{}': {}", _descriptor.name, stopped.error().message);
        return makeError(healthy.error().code, std::format("{}. Output:{}", healthy.error().message, output));
    }

    _ready = true;
    log::info("'{}' is healthy on port {}", _descriptor.name, port);
    return {};
}

auto LocalPortSession::waitUntilHealthy(Process& process) -> VoidResult
{
    auto const url = std::format("http://127.0.0.1:{}/health", *_descriptor.port);
    auto const probeTimeout = std::max(_options.healthInterval, MinProbeTimeout);

    auto probe = [&](int) -> VoidResult {
        if (!process.isRunning())
            return makeError(ErrorCode::LaunchError,
                             std::format("'{}' exited with code {} before becoming healthy",
                                         _descriptor.name,
                                         process.exitCode().value_or(-1)));

        auto response = http::get(url, probeTimeout);
        if (!response)
            return makeError(ErrorCode::HealthCheckTimeout, response.error().message);
        if (response->status != 200)
            return makeError(ErrorCode::HealthCheckTimeout, std::format("{} returned HTTP {}", url, response->status));
        return {};
    };

    auto const policy = RetryPolicy { .maxAttempts = _options.healthAttempts, .delay = _options.healthInterval };
    auto result = retry(
        policy,
        probe,
        [](const Error& error) { return error.code != ErrorCode::LaunchError; },
        [&](int nextAttempt, const Error& error) {
            log::trace("Health check of '{}' failed ({}), attempt {}/{}",
                       _descriptor.name,
                       error.message,
                       nextAttempt,
                       _options.healthAttempts);
        });

    if (!result && result.error().code == ErrorCode::HealthCheckTimeout)
        return makeError(ErrorCode::HealthCheckTimeout,
                         std::format("'{}' did not become healthy on port {} after {} attempts (last error: {})",
                                     _descriptor.name,
                                     *_descriptor.port,
                                     _options.healthAttempts,
                                     result.error().message));
    return result;
}

auto LocalPortSession::capturedOutput() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    auto lines = std::deque<std::string> {};
    for (auto const* pump: { _stdoutPump.get(), _stderrPump.get() })
    {
        if (!pump)
            continue;
        auto const tail = pump->tail();
        lines.insert(lines.end(), tail.begin(), tail.end());
    }
    return formatOutputTail(lines);
}

void LocalPortSession::onStdoutClosed()
{
    if (!_ready || _stopping)
        return;

    _ready = false;
    _events->push(SessionEvent { .kind = SessionEvent::Kind::Lost, .text = "Process closed its output" });
}

auto LocalPortSession::stop() -> VoidResult
{
    _stopping = true;
    _ready = false;

    auto process = std::shared_ptr<Process> {};
    auto stdoutPump = std::unique_ptr<OutputPump> {};
    auto stderrPump = std::unique_ptr<OutputPump> {};
    {
        auto lock = std::lock_guard(_mutex);
        process = std::move(_process);
        stdoutPump = std::move(_stdoutPump);
        stderrPump = std::move(_stderrPump);
    }

    auto result = VoidResult {};
    if (process)
    {
        result = process->terminate(_options.stopGracePeriod);
        log::info("Stopped '{}'", _descriptor.name);
    }
    for (auto* pump: { stdoutPump.get(), stderrPump.get() })
    {
        if (pump)
        {
            pump->drain(OutputDrainTimeout);
            pump->stop();
        }
    }

    _events->close();
    return result;
}

auto LocalPortSession::isAlive() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _ready && _process && _process->isRunning();
}

auto LocalPortSession::events() -> std::shared_ptr<Channel<SessionEvent>>
{
    return _events;
}

auto LocalPortSession::openProtocolTransport() -> Result<std::unique_ptr<Transport>>
{
    auto lock = std::lock_guard(_mutex);
    if (!_process || !_descriptor.port)
        return makeError(ErrorCode::NotRunning, std::format("Server '{}' is not running", _descriptor.name));

    return std::make_unique<HttpTransport>(
        std::format("http://127.0.0.1:{}/mcp", *_descriptor.port), std::map<std::string, std::string> {}, _options.connectionTimeout);
}

} // namespace mcpbridge

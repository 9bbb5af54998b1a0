// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <format>

namespace mcpbridge
{

namespace
{
    constexpr auto StopGracePeriod = std::chrono::seconds(5);
}

StdioTransport::StdioTransport() = default;

StdioTransport::StdioTransport(std::shared_ptr<Process> process):
    _process(std::move(process)), _ownsProcess(false), _connected(_process != nullptr)
{
}

StdioTransport::~StdioTransport()
{
    if (auto result = close(); !result)
        log::error("Failed to close stdio transport: {}", result.error().message);
}

auto StdioTransport::start(const ProcessConfig& config) -> VoidResult
{
    if (_connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    auto process = Process::spawn(config);
    if (!process)
        return std::unexpected(process.error());

    _process = std::move(*process);
    _ownsProcess = true;
    _connected = true;
    log::info("MCP server started: {}", config.command);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    return _process->write(message.dump() + "\n");
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (!_connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    // Read until we get a complete line
    while (true)
    {
        auto const newlinePos = _readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _readBuffer.substr(0, newlinePos);
            _readBuffer.erase(0, newlinePos + 1);

            if (line.empty() || line == "\r")
                continue;

            auto message = json::parse(line);
            if (!message)
            {
                // Servers occasionally print diagnostics to stdout.
                log::debug("Skipping non-JSON output from '{}': {}", _process->command(), line);
                continue;
            }
            return message;
        }

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("No response from '{}' within {}ms", _process->command(), timeout.count()));

        auto buf = std::array<char, 4096> {};
        auto bytesRead = _process->read(ProcessStream::Stdout, buf, remaining);
        if (!bytesRead)
            return std::unexpected(bytesRead.error());

        if (*bytesRead == 0)
        {
            _connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _readBuffer.append(buf.data(), *bytesRead);
    }
}

auto StdioTransport::close() -> VoidResult
{
    if (!_process)
        return {};

    _connected = false;
    auto process = std::move(_process);
    _readBuffer.clear();

    if (!_ownsProcess)
        return {};

    auto result = process->terminate(StopGracePeriod);
    log::debug("MCP transport closed");
    return result;
}

auto StdioTransport::isConnected() const -> bool
{
    return _connected;
}

} // namespace mcpbridge

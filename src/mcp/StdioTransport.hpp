// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>
#include <process/Process.hpp>

#include <memory>
#include <string>

namespace mcpbridge
{

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Either spawns its own child process (start()) or attaches to a process owned
/// by someone else. An attached transport never terminates the process on close.
class StdioTransport: public Transport
{
  public:
    StdioTransport();

    /// @brief Attaches to an already running process.
    /// @param process The process whose stdin/stdout carry the protocol.
    explicit StdioTransport(std::shared_ptr<Process> process);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the MCP server process.
    /// @param config The process configuration.
    /// @return Success or an error.
    [[nodiscard]] auto start(const ProcessConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    [[nodiscard]] auto close() -> VoidResult override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    std::shared_ptr<Process> _process;
    bool _ownsProcess = false;
    bool _connected = false;
    std::string _readBuffer;
};

} // namespace mcpbridge

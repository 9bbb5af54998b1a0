// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace mcpbridge
{

/// @brief Parameters for spawning a child process.
struct ProcessConfig
{
    std::string command;
    std::vector<std::string> args;

    /// @brief The complete environment of the child (not merged with ours).
    std::map<std::string, std::string> env;
};

/// @brief Selects one of the child's output pipes.
enum class ProcessStream : std::uint8_t
{
    Stdout,
    Stderr,
};

/// @brief A spawned child process with its stdin, stdout and stderr attached to pipes.
///
/// The child is placed in its own process group so that terminate() also reaches
/// grandchildren started by launcher commands. The destructor terminates a child that
/// is still running.
class Process
{
    struct Impl;
    struct Passkey
    {
        explicit Passkey() = default;
    };

  public:
    Process(Passkey, std::unique_ptr<Impl> impl);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// @brief Spawns a child process.
    /// @param config Command, arguments and environment.
    /// @return The running process, LauncherNotFound if the command cannot be resolved,
    ///         or LaunchError for other spawn failures.
    [[nodiscard]] static auto spawn(const ProcessConfig& config) -> Result<std::unique_ptr<Process>>;

    /// @brief Returns the child's process id.
    [[nodiscard]] auto pid() const -> pid_t;

    /// @brief Returns the command the process was started with.
    [[nodiscard]] auto command() const -> const std::string&;

    /// @brief Writes all of @p data to the child's stdin.
    [[nodiscard]] auto write(std::string_view data) -> VoidResult;

    /// @brief Reads available bytes from one of the child's output pipes.
    /// @param stream Which pipe to read.
    /// @param buffer Destination buffer.
    /// @param timeout Maximum time to wait for data.
    /// @return The number of bytes read (0 on end of stream), or TimeoutError.
    [[nodiscard]] auto read(ProcessStream stream, std::span<char> buffer, std::chrono::milliseconds timeout)
        -> Result<std::size_t>;

    /// @brief Returns true while the child has not exited.
    [[nodiscard]] auto isRunning() -> bool;

    /// @brief Returns the exit status once the child has been reaped.
    [[nodiscard]] auto exitCode() const -> std::optional<int>;

    /// @brief Sends SIGTERM to the process group, waits up to @p gracePeriod, then SIGKILLs and reaps.
    [[nodiscard]] auto terminate(std::chrono::milliseconds gracePeriod) -> VoidResult;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpbridge

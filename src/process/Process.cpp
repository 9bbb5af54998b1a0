// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <ranges>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

namespace mcpbridge
{

namespace
{

    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// Resolves a bare command name against the PATH the child will see.
    auto resolveExecutable(const ProcessConfig& config) -> std::optional<std::string>
    {
        if (config.command.empty())
            return std::nullopt;

        if (config.command.find('/') != std::string::npos)
            return ::access(config.command.c_str(), X_OK) == 0 ? std::optional(config.command) : std::nullopt;

        auto const it = config.env.find("PATH");
        auto const path = it != config.env.end() ? std::string_view(it->second) : std::string_view("/usr/bin:/bin");

        for (auto const part: path | std::views::split(':'))
        {
            auto dir = std::string(part.begin(), part.end());
            if (dir.empty())
                dir = ".";
            auto candidate = std::format("{}/{}", dir, config.command);
            if (::access(candidate.c_str(), X_OK) == 0)
                return candidate;
        }
        return std::nullopt;
    }

    struct Pipe
    {
        int fds[2] = { -1, -1 };

        Pipe() = default;
        Pipe(const Pipe&) = delete;
        Pipe& operator=(const Pipe&) = delete;
        ~Pipe()
        {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }

        [[nodiscard]] auto open() -> bool { return ::pipe2(fds, O_CLOEXEC) == 0; }

        [[nodiscard]] auto release(int end) -> int
        {
            auto const fd = fds[end];
            fds[end] = -1;
            return fd;
        }
    };

} // namespace

struct Process::Impl
{
    std::string command;
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;

    std::mutex stdinMutex; // guards stdinWrite
    std::mutex waitMutex;
    std::optional<int> exitStatus;

    ~Impl()
    {
        closeFd(stdinWrite);
        closeFd(stdoutRead);
        closeFd(stderrRead);
    }

    /// Reaps the child if it has exited. Must be called with waitMutex held.
    auto reapLocked(bool block) -> bool
    {
        if (exitStatus)
            return true;

        auto status = 0;
        auto const result = ::waitpid(childPid, &status, block ? 0 : WNOHANG);
        if (result == childPid)
        {
            exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
            return true;
        }
        if (result < 0 && errno == ECHILD)
        {
            exitStatus = -1;
            return true;
        }
        return false;
    }

    void closeStdin()
    {
        auto lock = std::lock_guard(stdinMutex);
        closeFd(stdinWrite);
    }

    /// Signals the process group and reaps the child. Stdin is closed first unless a
    /// writer is blocked on it; that writer fails once the child is gone.
    auto signalAndReap(std::chrono::milliseconds gracePeriod) -> VoidResult
    {
        auto lock = std::lock_guard(waitMutex);
        if (reapLocked(false))
            return {};

        if (auto stdinLock = std::unique_lock(stdinMutex, std::try_to_lock); stdinLock.owns_lock())
            closeFd(stdinWrite);

        if (::kill(-childPid, SIGTERM) != 0 && errno != ESRCH)
            return makeError(ErrorCode::IoError, std::format("Failed to signal pid {}: {}", childPid, std::strerror(errno)));

        auto const deadline = std::chrono::steady_clock::now() + gracePeriod;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (reapLocked(false))
                return {};
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        log::debug("'{}' (pid {}) ignored SIGTERM, sending SIGKILL", command, childPid);
        if (::kill(-childPid, SIGKILL) != 0 && errno != ESRCH)
            return makeError(ErrorCode::IoError, std::format("Failed to kill pid {}: {}", childPid, std::strerror(errno)));

        reapLocked(true);
        return {};
    }
};

Process::Process(Passkey, std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

Process::~Process()
{
    if (!isRunning())
        return;

    if (auto result = terminate(std::chrono::seconds(1)); !result)
        log::error("Failed to terminate '{}' (pid {}): {}", _impl->command, _impl->childPid, result.error().message);
}

auto Process::spawn(const ProcessConfig& config) -> Result<std::unique_ptr<Process>>
{
    ignoreSigpipe();

    auto stdinPipe = Pipe {};
    auto stdoutPipe = Pipe {};
    auto stderrPipe = Pipe {};
    if (!stdinPipe.open() || !stdoutPipe.open() || !stderrPipe.open())
        return makeError(ErrorCode::LaunchError, std::format("Failed to create pipes: {}", std::strerror(errno)));

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe.fds[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe.fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe.fds[1], STDERR_FILENO);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment
    auto envStrings = std::vector<std::string> {};
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    auto const executable = resolveExecutable(config);
    if (!executable)
    {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attributes);
        return makeError(ErrorCode::LauncherNotFound,
                         std::format("Failed to spawn process '{}': command not found", config.command));
    }

    pid_t pid = -1;
    auto const status = posix_spawn(&pid, executable->c_str(), &actions, &attributes, argv.data(), envp.data());

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    if (status == ENOENT)
        return makeError(ErrorCode::LauncherNotFound,
                         std::format("Failed to spawn process '{}': command not found", config.command));
    if (status != 0)
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));

    auto impl = std::make_unique<Impl>();
    impl->command = config.command;
    impl->childPid = pid;
    impl->stdinWrite = stdinPipe.release(1);
    impl->stdoutRead = stdoutPipe.release(0);
    impl->stderrRead = stderrPipe.release(0);

    log::debug("Spawned '{}' (pid {})", config.command, pid);
    return std::make_unique<Process>(Passkey {}, std::move(impl));
}

auto Process::pid() const -> pid_t
{
    return _impl->childPid;
}

auto Process::command() const -> const std::string&
{
    return _impl->command;
}

auto Process::write(std::string_view data) -> VoidResult
{
    auto lock = std::lock_guard(_impl->stdinMutex);
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Process stdin is closed");

    while (!data.empty())
    {
        auto const written = ::write(_impl->stdinWrite, data.data(), data.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }

    return {};
}

auto Process::read(ProcessStream stream, std::span<char> buffer, std::chrono::milliseconds timeout)
    -> Result<std::size_t>
{
    auto const fd = stream == ProcessStream::Stdout ? _impl->stdoutRead : _impl->stderrRead;
    if (fd < 0)
        return 0;

    auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
    auto ready = 0;
    do
        ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    while (ready < 0 && errno == EINTR);

    if (ready < 0)
        return makeError(ErrorCode::TransportError, std::format("poll failed: {}", std::strerror(errno)));
    if (ready == 0)
        return makeError(ErrorCode::TimeoutError,
                         std::format("No output from '{}' within {}ms", _impl->command, timeout.count()));

    auto bytesRead = ::ssize_t { 0 };
    do
        bytesRead = ::read(fd, buffer.data(), buffer.size());
    while (bytesRead < 0 && errno == EINTR);

    if (bytesRead < 0)
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to read process output: {}", std::strerror(errno)));

    return static_cast<std::size_t>(bytesRead);
}

auto Process::isRunning() -> bool
{
    auto lock = std::lock_guard(_impl->waitMutex);
    return !_impl->reapLocked(false);
}

auto Process::exitCode() const -> std::optional<int>
{
    auto lock = std::lock_guard(_impl->waitMutex);
    return _impl->exitStatus;
}

auto Process::terminate(std::chrono::milliseconds gracePeriod) -> VoidResult
{
    auto result = _impl->signalAndReap(gracePeriod);
    _impl->closeStdin();
    return result;
}

} // namespace mcpbridge

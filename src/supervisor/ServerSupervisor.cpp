// SPDX-License-Identifier: Apache-2.0
#include "ServerSupervisor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <future>

namespace mcpbridge
{

auto StartReport::allFailed() const -> bool
{
    return std::ranges::none_of(outcomes, [](const auto& entry) { return entry.second.status == StartStatus::Started; });
}

auto StartReport::startedNames() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (const auto& [name, outcome]: outcomes)
    {
        if (outcome.status == StartStatus::Started)
            names.push_back(name);
    }
    return names;
}

ServerSupervisor::ServerSupervisor(SessionFactory sessionFactory): _sessionFactory(std::move(sessionFactory))
{
}

ServerSupervisor::~ServerSupervisor()
{
    stopAll();
}

void ServerSupervisor::setConfiguration(ServersConfig config)
{
    auto lock = std::lock_guard(_mutex);
    _config = std::move(config);
}

auto ServerSupervisor::startAll(const ServersConfig& config) -> StartReport
{
    setConfiguration(config);

    auto report = StartReport {};
    auto pending = std::map<std::string, std::future<VoidResult>> {};

    for (const auto& [name, descriptor]: config.servers)
    {
        if (descriptor.disabled)
        {
            log::info("Skipping disabled server '{}'", name);
            report.outcomes[name] = StartOutcome {
                .status = StartStatus::NotStarted,
                .error = Error { ErrorCode::Disabled, std::format("Server '{}' is disabled", name) },
            };
            continue;
        }
        pending.emplace(name, std::async(std::launch::async, [this, name] { return start(name); }));
    }

    for (auto& [name, future]: pending)
    {
        auto result = future.get();
        if (result)
            report.outcomes[name] = StartOutcome { .status = StartStatus::Started, .error = std::nullopt };
        else
            report.outcomes[name] = StartOutcome { .status = StartStatus::Failed, .error = result.error() };
    }

    if (!pending.empty() && report.allFailed())
        log::error("All {} enabled servers failed to start", pending.size());
    return report;
}

auto ServerSupervisor::start(const std::string& name) -> VoidResult
{
    return _starting.run(name, [&] { return launch(name); });
}

auto ServerSupervisor::launch(const std::string& name) -> VoidResult
{
    auto descriptor = ServerDescriptor {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const* configured = _config.find(name);
        if (!configured)
            return makeError(ErrorCode::NotFound, std::format("Server '{}' not found in configuration", name));
        if (configured->disabled)
            return makeError(ErrorCode::Disabled, std::format("Server '{}' is disabled", name));
        if (_running.contains(name))
        {
            log::debug("Server '{}' is already running", name);
            return {};
        }
        descriptor = *configured;
    }

    reapWatchers(false);

    auto session = std::shared_ptr<TransportSession>(_sessionFactory(descriptor));
    {
        auto lock = std::lock_guard(_mutex);
        _running[name] = RunningServerHandle {
            .descriptor = descriptor,
            .session = session,
            .startTime = std::chrono::system_clock::now(),
            .status = HealthStatus::Starting,
        };
    }
    log::info("Starting server '{}' ({})", name, transportModeName(descriptor.mode));

    if (auto started = session->start(); !started)
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (auto const it = _running.find(name); it != _running.end() && it->second.session == session)
                _running.erase(it);
        }
        log::error("Failed to start server '{}': {}", name, started.error());
        return started;
    }

    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _running.find(name);
        if (it == _running.end() || it->second.session != session)
        {
            if (auto stopped = session->stop(); !stopped)
                log::error("Failed to stop server '{}': {}", name, stopped.error().message);
            return makeError(ErrorCode::StateError, std::format("Server '{}' was stopped while starting", name));
        }
        it->second.status = HealthStatus::Ready;
    }

    watch(name, session);
    log::info("Server '{}' is ready", name);
    return {};
}

void ServerSupervisor::watch(const std::string& name, std::shared_ptr<TransportSession> session)
{
    auto done = std::make_shared<std::atomic<bool>>(false);
    auto thread = std::thread([this, name, session = std::move(session), done] {
        auto events = session->events();
        while (auto event = events->receive())
        {
            switch (event->kind)
            {
                case SessionEvent::Kind::Stdout: log::info("[{}] {}", name, event->text); break;
                case SessionEvent::Kind::Stderr: log::error("[{}] {}", name, event->text); break;
                case SessionEvent::Kind::Dropped: setStatus(name, session, HealthStatus::Degraded); break;
                case SessionEvent::Kind::Reconnected:
                    setStatus(name, session, HealthStatus::Ready);
                    notify(name, ServerChange::Reconnected, event->text);
                    break;
                case SessionEvent::Kind::Lost: handleLost(name, session, event->text); break;
            }
        }
        *done = true;
    });

    auto lock = std::lock_guard(_watchersMutex);
    _watchers.push_back(Watcher { .thread = std::move(thread), .done = std::move(done) });
}

void ServerSupervisor::setStatus(const std::string& name,
                                 const std::shared_ptr<TransportSession>& session,
                                 HealthStatus status)
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _running.find(name); it != _running.end() && it->second.session == session)
        it->second.status = status;
}

void ServerSupervisor::handleLost(const std::string& name,
                                  const std::shared_ptr<TransportSession>& session,
                                  const std::string& reason)
{
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _running.find(name);
        if (it == _running.end() || it->second.session != session)
            return;
        _running.erase(it);
    }

    log::error("Server '{}' was lost: {}", name, reason);
    if (auto stopped = session->stop(); !stopped)
        log::error("Failed to release server '{}': {}", name, stopped.error().message);

    notify(name, ServerChange::Lost, reason);
}

void ServerSupervisor::notify(const std::string& name, ServerChange change, const std::string& detail)
{
    auto listeners = std::vector<ServerListener> {};
    {
        auto lock = std::lock_guard(_mutex);
        listeners = _listeners;
    }
    for (const auto& listener: listeners)
        listener(name, change, detail);
}

void ServerSupervisor::stop(const std::string& name)
{
    auto session = std::shared_ptr<TransportSession> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _running.find(name);
        if (it == _running.end())
        {
            log::debug("Server '{}' is not running", name);
            return;
        }
        it->second.status = HealthStatus::Stopped;
        session = std::move(it->second.session);
        _running.erase(it);
    }

    log::info("Stopping server '{}'", name);
    if (auto stopped = session->stop(); !stopped)
        log::error("Failed to stop server '{}': {}", name, stopped.error().message);
}

void ServerSupervisor::stopAll()
{
    auto names = runningNames();
    auto pending = std::vector<std::future<void>> {};
    pending.reserve(names.size());
    for (const auto& name: names)
        pending.push_back(std::async(std::launch::async, [this, name] { stop(name); }));

    for (auto& future: pending)
        future.wait();

    reapWatchers(true);
}

void ServerSupervisor::reapWatchers(bool all)
{
    auto finished = std::vector<Watcher> {};
    {
        auto lock = std::lock_guard(_watchersMutex);
        auto remaining = std::vector<Watcher> {};
        for (auto& watcher: _watchers)
        {
            if (all || *watcher.done)
                finished.push_back(std::move(watcher));
            else
                remaining.push_back(std::move(watcher));
        }
        _watchers = std::move(remaining);
    }

    for (auto& watcher: finished)
    {
        if (watcher.thread.get_id() == std::this_thread::get_id())
            watcher.thread.detach();
        else if (watcher.thread.joinable())
            watcher.thread.join();
    }
}

auto ServerSupervisor::isRunning(const std::string& name) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _running.contains(name);
}

auto ServerSupervisor::runningNames() const -> std::set<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto names = std::set<std::string> {};
    for (const auto& [name, handle]: _running)
        names.insert(name);
    return names;
}

auto ServerSupervisor::status(const std::string& name) const -> std::optional<HealthStatus>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _running.find(name);
    if (it == _running.end())
        return std::nullopt;
    return it->second.status;
}

auto ServerSupervisor::statuses() const -> std::vector<ServerStatus>
{
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<ServerStatus> {};
    for (const auto& [name, handle]: _running)
    {
        result.push_back(ServerStatus {
            .name = name,
            .mode = handle.descriptor.mode,
            .status = handle.status,
            .startTime = handle.startTime,
        });
    }
    return result;
}

auto ServerSupervisor::session(const std::string& name) const -> std::shared_ptr<TransportSession>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _running.find(name);
    return it != _running.end() ? it->second.session : nullptr;
}

void ServerSupervisor::subscribe(ServerListener listener)
{
    auto lock = std::lock_guard(_mutex);
    _listeners.push_back(std::move(listener));
}

} // namespace mcpbridge

// SPDX-License-Identifier: Apache-2.0
#include "McpService.hpp"

#include <core/Log.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <format>

namespace mcpbridge
{

McpService::McpService(ServersConfig config, ServiceOptions options, ServiceDependencies dependencies):
    _config(std::move(config)), _options(options)
{
    auto streamFactory =
        dependencies.eventStreamFactory ? std::move(dependencies.eventStreamFactory) : sse::curlEventStreamFactory();
    auto sessionFactory = dependencies.sessionFactory
                              ? std::move(dependencies.sessionFactory)
                              : makeSessionFactory(_options.session, std::move(streamFactory));
    auto transportFactory =
        dependencies.transportFactory
            ? std::move(dependencies.transportFactory)
            : TransportFactory([this](const ServerDescriptor& descriptor, const ProcessConfig& launch) {
                  return openTransport(descriptor, launch);
              });

    _supervisor = std::make_unique<ServerSupervisor>(std::move(sessionFactory));
    _supervisor->setConfiguration(_config);
    _registry = std::make_unique<ClientRegistry>(std::move(transportFactory), _options.registry);

    _supervisor->subscribe([this](const std::string& name, ServerChange change, const std::string& detail) {
        if (change == ServerChange::Lost)
            log::warning("Removing tools of lost server '{}': {}", name, detail);
        else
            log::info("Server '{}' reconnected, its tools will be fetched again", name);
        dropServer(name);
    });
}

McpService::~McpService()
{
    if (auto result = cleanup(); !result)
        log::error("Cleanup failed: {}", result.error().message);
}

auto McpService::state() const -> ServiceState
{
    auto lock = std::lock_guard(_stateMutex);
    return _state;
}

void McpService::setState(ServiceState state)
{
    auto lock = std::lock_guard(_stateMutex);
    if (_state != state)
        log::debug("Service state: {} -> {}", serviceStateName(_state), serviceStateName(state));
    _state = state;
}

auto McpService::initialize() -> VoidResult
{
    if (state() == ServiceState::Ready)
        return {};

    return _initializing.run(0, [this] { return runInitialize(); });
}

auto McpService::runInitialize() -> VoidResult
{
    auto lifecycle = std::lock_guard(_lifecycleMutex);
    if (state() == ServiceState::Ready)
        return {};

    setState(ServiceState::Initializing);
    log::info("Initializing MCP service with {} configured servers", _config.servers.size());

    auto const report = _supervisor->startAll(_config);
    auto failures = std::vector<std::string> {};
    auto readyCount = 0;

    for (const auto& [name, outcome]: report.outcomes)
    {
        if (outcome.status == StartStatus::Failed)
            failures.push_back(std::format("{}: {}", name, outcome.error ? outcome.error->message : "unknown error"));
    }

    for (const auto& name: report.startedNames())
    {
        if (auto registered = registerServer(name); !registered)
        {
            log::error("Failed to register tools of '{}': {}", name, registered.error());
            failures.push_back(std::format("{}: {}", name, registered.error().message));
            continue;
        }
        ++readyCount;
    }

    if (readyCount == 0)
    {
        setState(ServiceState::Error);
        auto message = std::string { "No MCP server could be initialized" };
        for (const auto& failure: failures)
            message += std::format("\n  {}", failure);
        log::error("{}", message);
        return makeError(ErrorCode::LaunchError, std::move(message));
    }

    for (const auto& failure: failures)
        log::warning("Server unavailable: {}", failure);

    setState(ServiceState::Ready);
    log::info("MCP service ready with {} of {} servers", readyCount, _config.servers.size());
    return {};
}

auto McpService::registerServer(const std::string& name) -> Result<ToolList>
{
    auto const* descriptor = _config.find(name);
    if (!descriptor)
        return makeError(ErrorCode::NotFound, std::format("Server '{}' not found in configuration", name));

    auto client = _registry->ensureClient(*descriptor);
    if (!client)
        return std::unexpected(client.error());

    auto tools = _registry->listTools(name);
    if (!tools)
        return std::unexpected(tools.error());

    auto proxies = ToolList {};
    proxies.reserve(tools->size());
    for (auto& tool: *tools)
    {
        auto const autoApprove = std::ranges::find(descriptor->autoApprove, tool.name) != descriptor->autoApprove.end();
        proxies.push_back(std::make_shared<const ToolProxy>(name, std::move(tool), *client, autoApprove));
    }

    {
        auto lock = std::lock_guard(_toolsMutex);
        _toolsByServer[name] = proxies;
        std::erase(_registrationOrder, name);
        _registrationOrder.push_back(name);
    }
    log::info("Registered {} tools from '{}'", proxies.size(), name);
    return proxies;
}

auto McpService::getTools(const ToolQuery& query) -> Result<ToolList>
{
    if (query.serverName)
    {
        auto const& name = *query.serverName;
        auto const* descriptor = _config.find(name);
        if (!descriptor)
            return makeError(ErrorCode::NotFound, std::format("Server '{}' not found in configuration", name));
        if (descriptor->disabled)
            return makeError(ErrorCode::Disabled, std::format("Server '{}' is disabled", name));

        if (auto initialized = initialize(); !initialized)
            log::debug("Initialization failed while listing tools of '{}': {}", name, initialized.error().message);

        if (!_supervisor->isRunning(name))
            return makeError(ErrorCode::NotRunning, std::format("Server '{}' is not running", name));

        {
            auto lock = std::lock_guard(_toolsMutex);
            if (auto const it = _toolsByServer.find(name); it != _toolsByServer.end())
                return it->second;
        }
        return registerServer(name);
    }

    if (auto initialized = initialize(); !initialized)
        return std::unexpected(initialized.error());

    // Running servers without tools (reconnected, or whose catalogue failed earlier) are fetched now.
    auto const running = _supervisor->runningNames();
    for (const auto& name: running)
    {
        auto known = false;
        {
            auto lock = std::lock_guard(_toolsMutex);
            known = _toolsByServer.contains(name);
        }
        if (known)
            continue;
        if (auto registered = registerServer(name); !registered)
            log::warning("Skipping tools of '{}': {}", name, registered.error());
    }

    return mergedTools(running);
}

auto McpService::mergedTools(const std::set<std::string>& running) const -> Result<ToolList>
{
    auto lock = std::lock_guard(_toolsMutex);
    auto merged = ToolList {};
    auto index = std::map<std::string, std::size_t> {};

    for (const auto& serverName: _registrationOrder)
    {
        if (!running.contains(serverName))
            continue;

        auto const it = _toolsByServer.find(serverName);
        if (it == _toolsByServer.end())
            continue;

        for (const auto& proxy: it->second)
        {
            auto const existing = index.find(proxy->name());
            if (existing == index.end())
            {
                index.emplace(proxy->name(), merged.size());
                merged.push_back(proxy);
                continue;
            }

            auto const& previous = merged[existing->second];
            if (_options.duplicatePolicy == DuplicateToolPolicy::Error)
                return makeError(ErrorCode::DuplicateTool,
                                 std::format("Tool '{}' is provided by both '{}' and '{}'",
                                             proxy->name(),
                                             previous->serverName(),
                                             proxy->serverName()));

            log::debug("Tool '{}' of '{}' shadows the one of '{}'",
                       proxy->name(),
                       proxy->serverName(),
                       previous->serverName());
            merged[existing->second] = proxy;
        }
    }
    return merged;
}

auto McpService::executeFunction(const std::string& serverName,
                                 const std::string& toolName,
                                 const nlohmann::json& arguments) -> Result<ToolCallResult>
{
    auto client = _registry->client(serverName);
    if (!client)
        return makeError(ErrorCode::NotFound, std::format("No client found for server '{}'", serverName));

    log::debug("Executing '{}' on '{}'", toolName, serverName);
    auto result = client->callTool(toolName, arguments.is_null() ? nlohmann::json::object() : arguments);
    if (!result)
    {
        log::error("Error executing '{}' on '{}': {}", toolName, serverName, result.error());
        return ToolCallResult::failure(
            std::format("Error executing tool '{}' on '{}': {}", toolName, serverName, result.error().message));
    }
    return result;
}

void McpService::dropServer(const std::string& name)
{
    {
        auto lock = std::lock_guard(_toolsMutex);
        _toolsByServer.erase(name);
        std::erase(_registrationOrder, name);
    }
    if (auto closed = _registry->close(name); !closed)
        log::debug("Closing client of '{}': {}", name, closed.error().message);
}

auto McpService::cleanup() -> VoidResult
{
    auto lifecycle = std::lock_guard(_lifecycleMutex);
    setState(ServiceState::ShuttingDown);

    _supervisor->stopAll();
    auto closed = _registry->closeAll();

    {
        auto lock = std::lock_guard(_toolsMutex);
        _toolsByServer.clear();
        _registrationOrder.clear();
    }

    setState(ServiceState::Uninitialized);
    if (!closed)
        log::error("{}", closed.error().message);
    return closed;
}

auto McpService::openTransport(const ServerDescriptor& descriptor, const ProcessConfig& launch)
    -> Result<std::unique_ptr<Transport>>
{
    if (auto session = _supervisor->session(descriptor.name))
        return session->openProtocolTransport();

    if (descriptor.mode != TransportMode::Pipe)
        return makeError(ErrorCode::NotRunning, std::format("Server '{}' is not running", descriptor.name));

    // Not supervised: launch a private process owned by the transport.
    auto transport = std::make_unique<StdioTransport>();
    if (auto started = transport->start(launch); !started)
        return std::unexpected(started.error());
    return transport;
}

} // namespace mcpbridge

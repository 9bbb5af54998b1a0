// SPDX-License-Identifier: Apache-2.0
#include "ClientRegistry.hpp"

#include <core/Log.hpp>
#include <mcp/LaunchParameters.hpp>

#include <format>

namespace mcpbridge
{

ClientRegistry::ClientRegistry(TransportFactory transportFactory, RegistryOptions options):
    _transportFactory(std::move(transportFactory)), _options(options)
{
}

ClientRegistry::~ClientRegistry()
{
    if (auto result = closeAll(); !result)
        log::error("{}", result.error().message);
}

auto ClientRegistry::ensureClient(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<McpClient>>
{
    if (auto existing = client(descriptor.name); existing && existing->isConnected())
        return existing;

    return _connecting.run(descriptor.name, [&] { return connect(descriptor); });
}

auto ClientRegistry::connect(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<McpClient>>
{
    // Another caller may have finished connecting between our lookup and joining the in-flight map.
    if (auto existing = client(descriptor.name); existing && existing->isConnected())
        return existing;

    auto const launch = buildLaunchParameters(descriptor);

    auto attemptConnect = [&](int attempt) -> Result<std::shared_ptr<McpClient>> {
        log::debug("Connecting to MCP server '{}' (attempt {}/{})",
                   descriptor.name,
                   attempt,
                   _options.connectRetry.maxAttempts);

        auto transport = _transportFactory(descriptor, launch);
        if (!transport)
            return std::unexpected(transport.error());

        auto client = std::make_shared<McpClient>(std::move(*transport), _options.requestTimeout);
        if (auto initialized = client->initialize(); !initialized)
        {
            if (auto closed = client->close(); !closed)
                log::debug("Closing failed client for '{}': {}", descriptor.name, closed.error().message);
            return std::unexpected(initialized.error());
        }
        return client;
    };

    auto onRetry = [&](int nextAttempt, const Error& error) {
        if (error.code == ErrorCode::LauncherNotFound)
            log::debug("Launcher for '{}' not found yet, retrying ({}/{}): {}",
                       descriptor.name,
                       nextAttempt,
                       _options.connectRetry.maxAttempts,
                       error.message);
        else
            log::warning("Connecting to '{}' failed, retrying ({}/{}): {}",
                         descriptor.name,
                         nextAttempt,
                         _options.connectRetry.maxAttempts,
                         error.message);
    };

    auto result = retry(_options.connectRetry, attemptConnect, {}, onRetry);
    if (!result)
    {
        log::error("Failed to connect to MCP server '{}': {}", descriptor.name, result.error());
        return result;
    }

    {
        auto lock = std::lock_guard(_mutex);
        _clients[descriptor.name] = *result;
    }
    log::info("Connected to MCP server '{}'", descriptor.name);
    return result;
}

auto ClientRegistry::listTools(const std::string& name) -> Result<std::vector<ToolDescriptor>>
{
    auto const mcpClient = client(name);
    if (!mcpClient)
        return makeError(ErrorCode::NotRunning, std::format("No client connected for server '{}'", name));

    auto onRetry = [&](int nextAttempt, const Error& error) {
        log::warning("Listing tools of '{}' failed, retrying ({}/{}): {}",
                     name,
                     nextAttempt,
                     _options.catalogueRetry.maxAttempts,
                     error.message);
    };

    auto tools = retry(_options.catalogueRetry, [&](int) { return mcpClient->listTools(); }, {}, onRetry);
    if (!tools)
        return makeError(ErrorCode::CatalogueError,
                         std::format("Failed to list tools of '{}': {}", name, tools.error().message));

    log::info("Received {} tools from '{}'", tools->size(), name);
    return tools;
}

auto ClientRegistry::client(const std::string& name) const -> std::shared_ptr<McpClient>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _clients.find(name);
    return it != _clients.end() ? it->second : nullptr;
}

auto ClientRegistry::close(const std::string& name) -> VoidResult
{
    auto mcpClient = std::shared_ptr<McpClient> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _clients.find(name);
        if (it == _clients.end())
            return {};
        mcpClient = std::move(it->second);
        _clients.erase(it);
    }

    log::debug("Closing MCP client '{}'", name);
    return mcpClient->close();
}

auto ClientRegistry::closeAll() -> VoidResult
{
    auto clients = std::map<std::string, std::shared_ptr<McpClient>> {};
    {
        auto lock = std::lock_guard(_mutex);
        clients.swap(_clients);
    }

    auto failures = std::string {};
    for (const auto& [name, mcpClient]: clients)
    {
        if (auto result = mcpClient->close(); !result)
            failures += std::format("\n  {}: {}", name, result.error().message);
    }

    if (!failures.empty())
        return makeError(ErrorCode::TransportError, std::format("Failed to close MCP clients:{}", failures));
    return {};
}

} // namespace mcpbridge

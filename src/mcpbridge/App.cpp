// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <service/McpService.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <format>
#include <print>
#include <thread>

namespace mcpbridge
{

namespace
{
    volatile std::sig_atomic_t gStopRequested = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void stopHandler(int /*sig*/)
    {
        gStopRequested = 1;
    }

    constexpr auto ServePollInterval = std::chrono::milliseconds(200);

    /// Installs SIGINT/SIGTERM handlers for its lifetime and restores the previous ones.
    class StopSignalGuard
    {
      public:
        StopSignalGuard()
        {
            gStopRequested = 0;
            struct sigaction sa {};
            sa.sa_handler = stopHandler;
            sigemptyset(&sa.sa_mask);
            sigaction(SIGINT, &sa, &_prevInt);
            sigaction(SIGTERM, &sa, &_prevTerm);
        }

        ~StopSignalGuard()
        {
            sigaction(SIGINT, &_prevInt, nullptr);
            sigaction(SIGTERM, &_prevTerm, nullptr);
        }

        StopSignalGuard(const StopSignalGuard&) = delete;
        StopSignalGuard& operator=(const StopSignalGuard&) = delete;

      private:
        struct sigaction _prevInt {};
        struct sigaction _prevTerm {};
    };

    auto firstLine(std::string_view text) -> std::string_view
    {
        return text.substr(0, text.find('\n'));
    }
} // namespace

struct App::Impl
{
    McpService service;

    explicit Impl(ServersConfig config): service(std::move(config))
    {
    }

    void printCatalogue(const ToolList& tools, bool asJson)
    {
        if (asJson)
        {
            auto entries = nlohmann::json::array();
            for (const auto& tool: tools)
            {
                auto entry = tool->catalogueEntry();
                entry["server"] = tool->serverName();
                entries.push_back(std::move(entry));
            }
            std::println("{}", entries.dump(2));
            return;
        }

        if (tools.empty())
        {
            std::println("No tools available.");
            return;
        }

        auto width = std::size_t { 0 };
        for (const auto& tool: tools)
            width = std::max(width, tool->name().size());

        for (const auto& tool: tools)
        {
            std::println("{:<{}}  [{}]{}  {}",
                         tool->name(),
                         width,
                         tool->serverName(),
                         tool->isAutoApproved() ? " (auto-approve)" : "",
                         firstLine(tool->descriptor().description));
        }
    }
};

App::App(ServersConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::listTools(const std::optional<std::string>& serverName, bool asJson) -> int
{
    auto tools = _impl->service.getTools(ToolQuery { .serverName = serverName });
    if (!tools)
    {
        log::error("Failed to list tools: {}", tools.error());
        return 1;
    }

    _impl->printCatalogue(*tools, asJson);
    return 0;
}

auto App::callTool(const std::string& serverName, const std::string& toolName, const std::string& argumentsJson)
    -> int
{
    auto arguments = json::parse(argumentsJson.empty() ? std::string_view { "{}" } : std::string_view { argumentsJson });
    if (!arguments)
    {
        log::error("Invalid arguments: {}", arguments.error().message);
        return 1;
    }

    auto tools = _impl->service.getTools(ToolQuery { .serverName = serverName });
    if (!tools)
    {
        log::error("Failed to list tools of '{}': {}", serverName, tools.error());
        return 1;
    }

    auto const it = std::ranges::find_if(*tools, [&](const auto& tool) { return tool->name() == toolName; });
    if (it == tools->end())
    {
        log::error("Server '{}' has no tool named '{}'", serverName, toolName);
        return 1;
    }

    auto const result = (*it)->invoke(*arguments);
    std::println("{}", toJson(result).dump(2));
    return result.isError ? 1 : 0;
}

auto App::status() -> int
{
    if (auto initialized = _impl->service.initialize(); !initialized)
        log::error("{}", initialized.error().message);

    auto const& config = _impl->service.configuration();
    auto const& supervisor = _impl->service.supervisor();
    std::println("Service: {}", serviceStateName(_impl->service.state()));

    for (const auto& [name, descriptor]: config.servers)
    {
        auto state = std::string { "not running" };
        if (descriptor.disabled)
            state = "disabled";
        else if (auto const health = supervisor.status(name))
            state = std::string(healthStatusName(*health));

        auto toolCount = std::string { "-" };
        if (auto tools = _impl->service.getTools(ToolQuery { .serverName = name }))
            toolCount = std::to_string(tools->size());

        std::println("  {:<20} {:<6} {:<12} tools: {}", name, transportModeName(descriptor.mode), state, toolCount);
    }

    return _impl->service.state() == ServiceState::Ready ? 0 : 1;
}

auto App::serve() -> int
{
    auto const signals = StopSignalGuard {};

    if (auto initialized = _impl->service.initialize(); !initialized)
    {
        log::error("Initialization failed: {}", initialized.error().message);
        return 1;
    }

    auto tools = _impl->service.getTools();
    std::println("Serving {} tools from {} servers. Press Ctrl+C to stop.",
                 tools ? tools->size() : 0,
                 _impl->service.supervisor().runningNames().size());

    while (!gStopRequested)
        std::this_thread::sleep_for(ServePollInterval);

    std::println("Shutting down...");
    if (auto cleaned = _impl->service.cleanup(); !cleaned)
    {
        log::error("Cleanup failed: {}", cleaned.error().message);
        return 1;
    }
    return 0;
}

} // namespace mcpbridge

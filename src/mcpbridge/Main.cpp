// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpbridge/App.hpp>
#include <mcpbridge/Config.hpp>

#include <CLI/CLI.hpp>

#include <optional>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpbridge - supervise MCP tool servers and expose their tools as one catalogue" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to the server configuration (default: ./mcp.config.json)");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    auto* toolsCommand = app.add_subcommand("tools", "List the available tools");
    auto toolsServer = std::string {};
    auto toolsJson = false;
    toolsCommand->add_option("-s,--server", toolsServer, "Only list the tools of this server");
    toolsCommand->add_flag("--json", toolsJson, "Print the catalogue as JSON");

    auto* callCommand = app.add_subcommand("call", "Call a tool");
    auto callServer = std::string {};
    auto callTool = std::string {};
    auto callArgs = std::string {};
    callCommand->add_option("server", callServer, "Server providing the tool")->required();
    callCommand->add_option("tool", callTool, "Tool name")->required();
    callCommand->add_option("arguments", callArgs, "Tool arguments as a JSON object");

    auto* statusCommand = app.add_subcommand("status", "Start the servers and show their state");
    auto* serveCommand = app.add_subcommand("serve", "Keep the servers running until interrupted");

    CLI11_PARSE(app, argc, argv);

    mcpbridge::log::configure(verbose);

    auto config = mcpbridge::loadServersConfig(configPath.empty() ? mcpbridge::defaultConfigPath() : configPath);
    if (!config)
    {
        mcpbridge::log::error("Failed to load config: {}", config.error().message);
        return 1;
    }

    auto application = mcpbridge::App(std::move(*config));

    if (toolsCommand->parsed())
        return application.listTools(toolsServer.empty() ? std::nullopt : std::optional(toolsServer), toolsJson);
    if (callCommand->parsed())
        return application.callTool(callServer, callTool, callArgs);
    if (statusCommand->parsed())
        return application.status();
    if (serveCommand->parsed())
        return application.serve();
    return 1;
}

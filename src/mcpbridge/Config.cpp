// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpbridge
{

namespace
{

    constexpr auto DefaultConfigFilename = std::string_view { "mcp.config.json" };

    void checkStringArray(const nlohmann::json& server,
                          std::string_view key,
                          bool required,
                          std::vector<std::string>& errors)
    {
        auto const keyStr = std::string(key);
        if (!server.contains(keyStr))
        {
            if (required)
                errors.push_back(std::format("{}: Required", key));
            return;
        }

        auto const& value = server[keyStr];
        if (!value.is_array())
        {
            errors.push_back(std::format("{}: Expected array, received {}", key, value.type_name()));
            return;
        }

        for (auto i = std::size_t { 0 }; i < value.size(); ++i)
        {
            if (!value[i].is_string())
                errors.push_back(std::format("{}.{}: Expected string, received {}", key, i, value[i].type_name()));
        }
    }

    void checkStringMap(const nlohmann::json& object, std::string_view path, std::vector<std::string>& errors)
    {
        if (!object.is_object())
        {
            errors.push_back(std::format("{}: Expected object, received {}", path, object.type_name()));
            return;
        }

        for (const auto& [key, value]: object.items())
        {
            if (!value.is_string())
                errors.push_back(std::format("{}.{}: Expected string, received {}", path, key, value.type_name()));
        }
    }

    auto toDescriptor(const std::string& name, const nlohmann::json& server) -> ServerDescriptor
    {
        auto descriptor = ServerDescriptor {
            .name = name,
            .command = json::getStringOr(server, "command", ""),
            .args = json::getStringArray(server, "args"),
            .env = json::getStringMap(server, "env"),
            .mode = transportModeFromString(json::getStringOr(server, "mode", "stdio")).value_or(TransportMode::Pipe),
            .port = std::nullopt,
            .eventStream = std::nullopt,
            .disabled = json::getBoolOr(server, "disabled", false),
            .autoApprove = json::getStringArray(server, "autoApprove"),
        };

        if (server.contains("port") && server["port"].is_number_integer())
            descriptor.port = server["port"].get<std::uint16_t>();

        if (server.contains("sseOptions") && server["sseOptions"].is_object())
        {
            auto const& sse = server["sseOptions"];
            auto options = EventStreamOptions {
                .endpoint = json::getStringOr(sse, "endpoint", ""),
                .headers = json::getStringMap(sse, "headers"),
                .reconnectInterval = std::nullopt,
            };
            if (sse.contains("reconnectTimeout") && sse["reconnectTimeout"].is_number())
                options.reconnectInterval = std::chrono::milliseconds(sse["reconnectTimeout"].get<std::int64_t>());
            descriptor.eventStream = std::move(options);
        }

        return descriptor;
    }

} // namespace

auto validateServerConfig(const nlohmann::json& server) -> std::vector<std::string>
{
    auto errors = std::vector<std::string> {};

    if (!server.is_object())
    {
        errors.push_back(std::format("Expected object, received {}", server.type_name()));
        return errors;
    }

    if (!server.contains("command"))
        errors.emplace_back("command: Required");
    else if (!server["command"].is_string())
        errors.push_back(std::format("command: Expected string, received {}", server["command"].type_name()));

    checkStringArray(server, "args", true, errors);
    checkStringArray(server, "autoApprove", false, errors);

    if (server.contains("env"))
        checkStringMap(server["env"], "env", errors);

    if (server.contains("disabled") && !server["disabled"].is_boolean())
        errors.push_back(std::format("disabled: Expected boolean, received {}", server["disabled"].type_name()));

    auto mode = std::optional<TransportMode> { TransportMode::Pipe };
    if (server.contains("mode"))
    {
        auto const& modeJson = server["mode"];
        mode = modeJson.is_string() ? transportModeFromString(modeJson.get<std::string>()) : std::nullopt;
        if (!mode)
            errors.push_back(
                std::format("mode: Invalid enum value. Expected 'stdio' | 'http' | 'sse', received {}",
                            modeJson.dump()));
    }

    if (server.contains("port"))
    {
        auto const& port = server["port"];
        if (!port.is_number_integer())
            errors.push_back(std::format("port: Expected integer, received {}", port.type_name()));
        else if (port.get<std::int64_t>() < 1 || port.get<std::int64_t>() > 65535)
            errors.push_back(std::format("port: Must be between 1 and 65535, received {}", port.dump()));
    }
    else if (mode == TransportMode::LocalPort)
    {
        errors.emplace_back("port: Required for mode 'http'");
    }

    if (server.contains("sseOptions"))
    {
        auto const& sse = server["sseOptions"];
        if (!sse.is_object())
        {
            errors.push_back(std::format("sseOptions: Expected object, received {}", sse.type_name()));
        }
        else
        {
            if (!sse.contains("endpoint"))
                errors.emplace_back("sseOptions.endpoint: Required");
            else if (!sse["endpoint"].is_string())
                errors.push_back(
                    std::format("sseOptions.endpoint: Expected string, received {}", sse["endpoint"].type_name()));

            if (sse.contains("headers"))
                checkStringMap(sse["headers"], "sseOptions.headers", errors);

            if (sse.contains("reconnectTimeout")
                && (!sse["reconnectTimeout"].is_number() || sse["reconnectTimeout"].get<double>() < 0))
                errors.emplace_back("sseOptions.reconnectTimeout: Expected non-negative number");
        }
    }
    else if (mode == TransportMode::EventStream)
    {
        errors.emplace_back("sseOptions: Required for mode 'sse'");
    }

    return errors;
}

auto parseServersConfig(const nlohmann::json& root) -> Result<ServersConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError,
                         std::format("Configuration must be an object, received {}", root.type_name()));

    auto errors = std::vector<std::string> {};
    for (const auto& [key, value]: root.items())
    {
        if (key != "mcpServers")
            errors.push_back(std::format("{}: Unrecognized key", key));
    }

    if (!root.contains("mcpServers"))
        errors.emplace_back("mcpServers: Required");
    else if (!root["mcpServers"].is_object())
        errors.push_back(std::format("mcpServers: Expected object, received {}", root["mcpServers"].type_name()));

    if (errors.empty())
    {
        for (const auto& [name, server]: root["mcpServers"].items())
        {
            for (auto& error: validateServerConfig(server))
                errors.push_back(std::format("mcpServers.{}.{}", name, error));
        }
    }

    if (!errors.empty())
    {
        auto message = std::string { "Invalid server configuration:" };
        for (const auto& error: errors)
            message += "\n  " + error;
        return makeError(ErrorCode::ConfigError, std::move(message));
    }

    auto config = ServersConfig {};
    for (const auto& [name, server]: root["mcpServers"].items())
        config.servers.emplace(name, toDescriptor(name, server));

    return config;
}

auto loadServersConfig(std::string_view path) -> Result<ServersConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Failed to parse config file {}: {}", path, parseResult.error().message));

    auto config = parseServersConfig(*parseResult);
    if (config)
        log::debug("Loaded {} server definitions from {}", config->servers.size(), path);
    return config;
}

auto toJson(const ServersConfig& config) -> nlohmann::json
{
    auto servers = nlohmann::json::object();
    for (const auto& [name, descriptor]: config.servers)
    {
        auto server = nlohmann::json::object();
        server["command"] = descriptor.command;
        server["args"] = descriptor.args;
        server["mode"] = transportModeName(descriptor.mode);
        if (!descriptor.env.empty())
            server["env"] = descriptor.env;
        if (descriptor.port)
            server["port"] = *descriptor.port;
        if (descriptor.disabled)
            server["disabled"] = true;
        if (!descriptor.autoApprove.empty())
            server["autoApprove"] = descriptor.autoApprove;

        if (descriptor.eventStream)
        {
            auto sse = nlohmann::json { { "endpoint", descriptor.eventStream->endpoint } };
            if (!descriptor.eventStream->headers.empty())
                sse["headers"] = descriptor.eventStream->headers;
            if (descriptor.eventStream->reconnectInterval)
                sse["reconnectTimeout"] = descriptor.eventStream->reconnectInterval->count();
            server["sseOptions"] = std::move(sse);
        }

        servers[name] = std::move(server);
    }

    return nlohmann::json { { "mcpServers", std::move(servers) } };
}

auto saveServersConfig(std::string_view path, const ServersConfig& config) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << toJson(config).dump(2) << '\n';
    log::debug("Saved MCP config to {}", path);
    return {};
}

auto defaultConfigPath() -> std::string
{
    return (std::filesystem::current_path() / DefaultConfigFilename).string();
}

} // namespace mcpbridge

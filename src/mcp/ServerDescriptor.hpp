// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge
{

/// @brief How an upstream server is reached.
enum class TransportMode : std::uint8_t
{
    Pipe,        ///< Child process spoken to over stdin/stdout.
    LocalPort,   ///< Child process serving HTTP on a local port.
    EventStream, ///< Remote endpoint pushing server-sent events.
};

/// @brief Converts a transport mode to its configuration name.
[[nodiscard]] constexpr auto transportModeName(TransportMode mode) -> std::string_view
{
    switch (mode)
    {
        case TransportMode::Pipe: return "stdio";
        case TransportMode::LocalPort: return "http";
        case TransportMode::EventStream: return "sse";
    }
    return "stdio";
}

/// @brief Parses a configuration mode name; accepts both the short and the descriptive spelling.
[[nodiscard]] constexpr auto transportModeFromString(std::string_view str) -> std::optional<TransportMode>
{
    if (str == "stdio" || str == "pipe")
        return TransportMode::Pipe;
    if (str == "http" || str == "local-port")
        return TransportMode::LocalPort;
    if (str == "sse" || str == "event-stream")
        return TransportMode::EventStream;
    return std::nullopt;
}

/// @brief Options for event-stream servers.
struct EventStreamOptions
{
    std::string endpoint;
    std::map<std::string, std::string> headers;
    std::optional<std::chrono::milliseconds> reconnectInterval;
};

/// @brief Immutable definition of one upstream server.
struct ServerDescriptor
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    TransportMode mode = TransportMode::Pipe;
    std::optional<std::uint16_t> port;
    std::optional<EventStreamOptions> eventStream;
    bool disabled = false;
    std::vector<std::string> autoApprove;
};

} // namespace mcpbridge

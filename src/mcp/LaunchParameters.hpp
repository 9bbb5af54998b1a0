// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/ServerDescriptor.hpp>
#include <process/Process.hpp>

#include <map>
#include <string>
#include <string_view>

namespace mcpbridge
{

/// @brief Directories appended to the inherited PATH so that launcher commands resolve.
inline constexpr auto ExtraSearchPath = std::string_view { "/usr/local/bin:/usr/bin:/bin:/opt/homebrew/bin:./node_modules/.bin" };

/// @brief Returns a copy of the calling process's environment.
[[nodiscard]] auto currentEnvironment() -> std::map<std::string, std::string>;

/// @brief Layers the environment seen by a spawned server.
///
/// Order (later layers win): @p inherited, PATH extended with ExtraSearchPath, then @p overrides.
/// @param inherited The base environment, usually currentEnvironment().
/// @param overrides Descriptor-specific variables.
[[nodiscard]] auto mergeEnvironment(std::map<std::string, std::string> inherited,
                                    const std::map<std::string, std::string>& overrides)
    -> std::map<std::string, std::string>;

/// @brief Builds the process parameters for launching @p descriptor.
///
/// For local-port servers, PORT is injected before the descriptor overrides are applied.
[[nodiscard]] auto buildLaunchParameters(const ServerDescriptor& descriptor) -> ProcessConfig;

} // namespace mcpbridge

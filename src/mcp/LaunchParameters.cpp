// SPDX-License-Identifier: Apache-2.0
#include "LaunchParameters.hpp"

#include <format>

extern char** environ;

namespace mcpbridge
{

auto currentEnvironment() -> std::map<std::string, std::string>
{
    auto env = std::map<std::string, std::string> {};
    if (!environ)
        return env;

    for (auto** e = environ; *e; ++e)
    {
        auto const entry = std::string_view(*e);
        auto const eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0)
            continue;
        env.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return env;
}

auto mergeEnvironment(std::map<std::string, std::string> inherited,
                      const std::map<std::string, std::string>& overrides) -> std::map<std::string, std::string>
{
    auto& path = inherited["PATH"];
    path = path.empty() ? std::string(ExtraSearchPath) : std::format("{}:{}", path, ExtraSearchPath);

    for (const auto& [key, value]: overrides)
        inherited[key] = value;

    return inherited;
}

auto buildLaunchParameters(const ServerDescriptor& descriptor) -> ProcessConfig
{
    auto base = currentEnvironment();
    if (descriptor.mode == TransportMode::LocalPort && descriptor.port)
        base["PORT"] = std::to_string(*descriptor.port);

    return ProcessConfig {
        .command = descriptor.command,
        .args = descriptor.args,
        .env = mergeEnvironment(std::move(base), descriptor.env),
    };
}

} // namespace mcpbridge

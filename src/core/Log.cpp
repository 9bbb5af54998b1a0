// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <print>
#include <ranges>
#include <string>

namespace mcpbridge::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Error };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto isDebugNamespaceEnabled(std::string_view namespaces) -> bool
{
    for (auto const part: namespaces | std::views::split(','))
    {
        auto const name = std::string_view(part.begin(), part.end());
        if (name == "*" || name == "mcp" || name == "mcp:*")
            return true;
    }
    return false;
}

void configure(bool debug)
{
    auto const* const namespaces = std::getenv("DEBUG");
    auto const enabled = debug || (namespaces && isDebugNamespaceEnabled(namespaces));
    setLevel(enabled ? Level::Debug : Level::Error);
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel && level != Level::Error)
        return;

    auto lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::println(stderr, "[{:%FT%TZ}] [{}] {}", now, levelPrefix(level), message);
}

} // namespace mcpbridge::log

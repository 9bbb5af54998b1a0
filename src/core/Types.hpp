// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcpbridge
{

/// @brief Describes one tool advertised by an upstream server.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
    std::optional<nlohmann::json> outputSchema;
};

/// @brief One item of a tool result's content list.
struct ContentItem
{
    std::string type = "text";
    std::string text;
};

/// @brief The result of invoking a tool.
///
/// Failures are carried in-band: isError is set and the content holds a readable message.
struct ToolCallResult
{
    std::vector<ContentItem> content;
    bool isError = false;

    /// @brief Joins the text of all content items with newlines.
    [[nodiscard]] auto text() const -> std::string
    {
        auto joined = std::string {};
        for (const auto& item: content)
        {
            if (!joined.empty())
                joined += "\n";
            joined += item.text;
        }
        return joined;
    }

    /// @brief Builds an error result carrying a single text message.
    [[nodiscard]] static auto failure(std::string message) -> ToolCallResult
    {
        return ToolCallResult {
            .content = { ContentItem { .type = "text", .text = std::move(message) } },
            .isError = true,
        };
    }
};

/// @brief Converts a tool descriptor to its catalogue JSON form.
[[nodiscard]] inline auto toJson(const ToolDescriptor& tool) -> nlohmann::json
{
    auto entry = nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
    };
    if (tool.outputSchema)
        entry["outputSchema"] = *tool.outputSchema;
    return entry;
}

/// @brief Converts a tool result to its wire JSON form.
[[nodiscard]] inline auto toJson(const ToolCallResult& result) -> nlohmann::json
{
    auto content = nlohmann::json::array();
    for (const auto& item: result.content)
        content.push_back(nlohmann::json { { "type", item.type }, { "text", item.text } });

    auto json = nlohmann::json { { "content", std::move(content) } };
    if (result.isError)
        json["isError"] = true;
    return json;
}

} // namespace mcpbridge

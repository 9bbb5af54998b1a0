// SPDX-License-Identifier: Apache-2.0
#include "Schema.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcpbridge::schema
{

namespace
{
    auto make(SchemaNode node) -> SchemaPtr
    {
        return std::make_shared<const Schema>(Schema { std::move(node) });
    }

    auto any() -> SchemaPtr
    {
        return make(AnySchema {});
    }

    auto makeUnion(std::vector<SchemaPtr> branches) -> SchemaPtr
    {
        if (branches.empty())
            return any();
        if (branches.size() == 1)
            return std::move(branches.front());
        return make(UnionSchema { std::move(branches) });
    }

    auto parseObject(const nlohmann::json& document) -> SchemaPtr
    {
        auto object = ObjectSchema {};
        if (!document.contains("properties") || !document["properties"].is_object())
            return make(std::move(object));

        object.hasProperties = true;
        for (const auto& [key, value]: document["properties"].items())
            object.properties.emplace(key, parse(value));

        if (document.contains("required") && document["required"].is_array())
        {
            for (const auto& name: document["required"])
            {
                if (name.is_string())
                    object.required.insert(name.get<std::string>());
            }
        }
        return make(std::move(object));
    }

    auto parseArray(const nlohmann::json& document) -> SchemaPtr
    {
        if (!document.contains("items"))
            return make(ArraySchema { nullptr });

        auto const& items = document["items"];
        if (!items.is_array())
            return make(ArraySchema { parse(items) });

        // Tuple form: every element must match one of the listed schemas.
        auto branches = std::vector<SchemaPtr> {};
        for (const auto& item: items)
            branches.push_back(parse(item));
        return make(ArraySchema { makeUnion(std::move(branches)) });
    }

    auto parseString(const nlohmann::json& document) -> SchemaPtr
    {
        auto string = StringSchema {};
        if (document.contains("enum") && document["enum"].is_array() && !document["enum"].empty())
        {
            auto values = std::vector<std::string> {};
            for (const auto& value: document["enum"])
            {
                if (value.is_string())
                    values.push_back(value.get<std::string>());
            }
            if (!values.empty())
                string.enumValues = std::move(values);
        }
        return make(std::move(string));
    }

    auto parseForType(const nlohmann::json& document, std::string_view type) -> SchemaPtr
    {
        if (type == "string")
            return parseString(document);
        if (type == "number")
            return make(NumberSchema { .integer = false });
        if (type == "integer")
            return make(NumberSchema { .integer = true });
        if (type == "boolean")
            return make(BooleanSchema {});
        if (type == "null")
            return make(NullSchema {});
        if (type == "object")
            return parseObject(document);
        if (type == "array")
            return parseArray(document);

        log::trace("Using accept-anything schema for type '{}'", type);
        return any();
    }

    auto parseTyped(const nlohmann::json& document) -> SchemaPtr
    {
        if (!document.contains("type"))
            return any();

        auto const& type = document["type"];
        if (type.is_string())
            return parseForType(document, type.get<std::string>());

        if (type.is_array())
        {
            auto branches = std::vector<SchemaPtr> {};
            for (const auto& name: type)
            {
                if (name.is_string())
                    branches.push_back(parseForType(document, name.get<std::string>()));
            }
            return makeUnion(std::move(branches));
        }

        return any();
    }

    auto parseAlternatives(const nlohmann::json& document, const nlohmann::json& alternatives) -> SchemaPtr
    {
        auto branches = std::vector<SchemaPtr> {};
        if (alternatives.is_array())
        {
            for (const auto& alternative: alternatives)
            {
                if (alternative.is_object())
                    branches.push_back(parse(alternative));
            }
        }

        if (branches.empty())
            return parseTyped(document);
        return makeUnion(std::move(branches));
    }
} // namespace

auto parse(const nlohmann::json& document) -> SchemaPtr
{
    if (!document.is_object())
        return any();

    if (document.contains("oneOf"))
        return parseAlternatives(document, document["oneOf"]);
    if (document.contains("anyOf"))
        return parseAlternatives(document, document["anyOf"]);

    return parseTyped(document);
}

auto kindName(const Schema& schema) -> std::string
{
    struct Visitor
    {
        auto operator()(const AnySchema&) const -> std::string { return "any"; }
        auto operator()(const StringSchema& s) const -> std::string { return s.enumValues ? "enum" : "string"; }
        auto operator()(const NumberSchema& s) const -> std::string { return s.integer ? "integer" : "number"; }
        auto operator()(const BooleanSchema&) const -> std::string { return "boolean"; }
        auto operator()(const NullSchema&) const -> std::string { return "null"; }
        auto operator()(const ObjectSchema&) const -> std::string { return "object"; }
        auto operator()(const ArraySchema&) const -> std::string { return "array"; }
        auto operator()(const UnionSchema& s) const -> std::string
        {
            auto names = std::string {};
            for (const auto& branch: s.branches)
                names += names.empty() ? kindName(*branch) : std::format(" | {}", kindName(*branch));
            return names;
        }
    };
    return std::visit(Visitor {}, schema.node);
}

} // namespace mcpbridge::schema

// SPDX-License-Identifier: Apache-2.0
#include "Validator.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace mcpbridge::schema
{

namespace
{
    auto typeName(const nlohmann::json& value) -> std::string_view
    {
        if (value.is_number_integer())
            return "integer";
        return value.type_name();
    }

    auto failure(const std::string& path, std::string message) -> VoidResult
    {
        return makeError(ErrorCode::ValidationError, std::format("{}: {}", path, message));
    }

    auto mismatch(const std::string& path, std::string_view expected, const nlohmann::json& value) -> VoidResult
    {
        return failure(path, std::format("expected {}, got {}", expected, typeName(value)));
    }

    auto check(const Schema& schema, const nlohmann::json& value, const std::string& path) -> VoidResult;

    struct NodeChecker
    {
        const nlohmann::json& value;
        const std::string& path;

        auto operator()(const AnySchema&) const -> VoidResult { return {}; }

        auto operator()(const StringSchema& s) const -> VoidResult
        {
            if (!value.is_string())
                return mismatch(path, "string", value);
            if (s.enumValues && std::ranges::find(*s.enumValues, value.get<std::string>()) == s.enumValues->end())
            {
                auto allowed = std::string {};
                for (const auto& candidate: *s.enumValues)
                    allowed += allowed.empty() ? candidate : std::format(", {}", candidate);
                return failure(path, std::format("'{}' is not one of [{}]", value.get<std::string>(), allowed));
            }
            return {};
        }

        auto operator()(const NumberSchema& s) const -> VoidResult
        {
            // Integral-ness is left to the upstream server.
            if (!value.is_number())
                return mismatch(path, s.integer ? "integer" : "number", value);
            return {};
        }

        auto operator()(const BooleanSchema&) const -> VoidResult
        {
            return value.is_boolean() ? VoidResult {} : mismatch(path, "boolean", value);
        }

        auto operator()(const NullSchema&) const -> VoidResult
        {
            return value.is_null() ? VoidResult {} : mismatch(path, "null", value);
        }

        auto operator()(const ObjectSchema& s) const -> VoidResult
        {
            if (!value.is_object())
                return mismatch(path, "object", value);

            for (const auto& [key, propertySchema]: s.properties)
            {
                auto const propertyPath = std::format("{}.{}", path, key);
                auto const it = value.find(key);
                if (it == value.end())
                {
                    if (s.required.contains(key))
                        return failure(propertyPath, "required property missing");
                    continue;
                }
                if (auto result = check(*propertySchema, *it, propertyPath); !result)
                    return result;
            }
            return {};
        }

        auto operator()(const ArraySchema& s) const -> VoidResult
        {
            if (!value.is_array())
                return mismatch(path, "array", value);
            if (!s.items)
                return {};

            for (std::size_t i = 0; i < value.size(); ++i)
            {
                if (auto result = check(*s.items, value[i], std::format("{}[{}]", path, i)); !result)
                    return result;
            }
            return {};
        }

        auto operator()(const UnionSchema& s) const -> VoidResult
        {
            for (const auto& branch: s.branches)
            {
                if (check(*branch, value, path))
                    return {};
            }
            return failure(path,
                           std::format("value of type {} does not match any of {}",
                                       typeName(value),
                                       kindName(Schema { s })));
        }
    };

    auto check(const Schema& schema, const nlohmann::json& value, const std::string& path) -> VoidResult
    {
        return std::visit(NodeChecker { value, path }, schema.node);
    }
} // namespace

Validator::Validator(SchemaPtr schema): _schema(std::move(schema))
{
}

auto Validator::compile(const nlohmann::json& inputSchema) -> Validator
{
    return Validator(parse(inputSchema));
}

auto Validator::validate(const nlohmann::json& value) const -> VoidResult
{
    if (!_schema)
        return {};
    return check(*_schema, value, "$");
}

} // namespace mcpbridge::schema

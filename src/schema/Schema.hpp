// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace mcpbridge::schema
{

struct Schema;

/// @brief Schemas are immutable once parsed and freely shared between validators.
using SchemaPtr = std::shared_ptr<const Schema>;

/// @brief Accepts any JSON value.
struct AnySchema
{
};

/// @brief A string, optionally restricted to a closed set of values.
struct StringSchema
{
    std::optional<std::vector<std::string>> enumValues;
};

/// @brief A number. @c integer records the declared type name; values are checked as numbers.
struct NumberSchema
{
    bool integer = false;
};

struct BooleanSchema
{
};

struct NullSchema
{
};

/// @brief An object with declared properties. Undeclared properties are accepted.
struct ObjectSchema
{
    std::map<std::string, SchemaPtr> properties;
    std::set<std::string> required;

    /// @brief False when the schema declared no "properties" at all; any object is then accepted.
    bool hasProperties = false;
};

/// @brief An array whose elements all match @c items (any element when null).
struct ArraySchema
{
    SchemaPtr items;
};

/// @brief Matches if any branch matches.
struct UnionSchema
{
    std::vector<SchemaPtr> branches;
};

using SchemaNode =
    std::variant<AnySchema, StringSchema, NumberSchema, BooleanSchema, NullSchema, ObjectSchema, ArraySchema, UnionSchema>;

struct Schema
{
    SchemaNode node;
};

/// @brief Classifies a JSON Schema document into the closed grammar above.
///
/// Never throws. Anything that cannot be classified (boolean schemas, non-objects,
/// unknown types) becomes AnySchema.
[[nodiscard]] auto parse(const nlohmann::json& document) -> SchemaPtr;

/// @brief Returns a short human readable name of the schema's kind, e.g. "string" or "object".
[[nodiscard]] auto kindName(const Schema& schema) -> std::string;

} // namespace mcpbridge::schema

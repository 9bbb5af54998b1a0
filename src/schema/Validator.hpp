// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <schema/Schema.hpp>

#include <nlohmann/json.hpp>

namespace mcpbridge::schema
{

/// @brief Checks JSON values against a parsed schema.
///
/// Failures are reported as ValidationError whose message starts with the JSON
/// path of the first offending value, e.g. "$.items[2]: expected string, got number".
class Validator
{
  public:
    explicit Validator(SchemaPtr schema);

    /// @brief Parses @p inputSchema and builds a validator for it. Never throws.
    [[nodiscard]] static auto compile(const nlohmann::json& inputSchema) -> Validator;

    [[nodiscard]] auto validate(const nlohmann::json& value) const -> VoidResult;

    [[nodiscard]] auto schema() const -> const SchemaPtr& { return _schema; }

  private:
    SchemaPtr _schema;
};

} // namespace mcpbridge::schema

#pragma once

#include "agency/executor/task.hpp"
#include "agency/recipe/recipe.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace agency {

[[nodiscard]] auto matches_type(const nlohmann::json& value,
                                VariableType type) noexcept -> bool;

// Provided values, then defaults for anything not provided. Numbers and
// booleans given for a string variable become their text. Variables the
// recipe does not declare pass through untouched.
[[nodiscard]] auto resolve_variables(const Recipe& recipe,
                                     const VariableMap& provided)
    -> VariableMap;

// One message per missing required variable or type mismatch, checked
// against the resolved values. Empty means the recipe may run.
[[nodiscard]] auto validate_variables(const Recipe& recipe,
                                      const VariableMap& resolved)
    -> std::vector<std::string>;

// Command-line values: JSON when it parses ("3", "true", "[1,2]"), else the
// raw string.
[[nodiscard]] auto parse_variable_value(std::string_view raw)
    -> nlohmann::json;

}  // namespace agency

#include "agency/recipe/variables.hpp"

#include "agency/util/json.hpp"

#include <format>

namespace agency {

auto matches_type(const nlohmann::json& value, VariableType type) noexcept
    -> bool {
  switch (type) {
    case VariableType::String: return value.is_string();
    case VariableType::Number: return value.is_number();
    case VariableType::Boolean: return value.is_boolean();
    case VariableType::Array: return value.is_array();
  }
  return false;
}

auto resolve_variables(const Recipe& recipe, const VariableMap& provided)
    -> VariableMap {
  VariableMap resolved = provided;
  for (const auto& [name, def] : recipe.variables) {
    auto it = resolved.find(name);
    if (it == resolved.end()) {
      if (def.default_value) {
        resolved.emplace(name, *def.default_value);
      }
      continue;
    }
    // "--var version=2" parses as a number; keep the text it was given.
    auto& value = it->second;
    if (def.type == VariableType::String &&
        (value.is_number() || value.is_boolean())) {
      value = dump_json(value);
    }
  }
  return resolved;
}

auto validate_variables(const Recipe& recipe, const VariableMap& resolved)
    -> std::vector<std::string> {
  std::vector<std::string> errors;
  for (const auto& [name, def] : recipe.variables) {
    auto it = resolved.find(name);
    if (it == resolved.end()) {
      if (def.required) {
        errors.push_back(
            std::format("Required variable '{}' not provided", name));
      }
      continue;
    }
    if (!matches_type(it->second, def.type)) {
      errors.push_back(std::format("Variable '{}' must be of type '{}'", name,
                                   to_string_view(def.type)));
    }
  }
  return errors;
}

auto parse_variable_value(std::string_view raw) -> nlohmann::json {
  auto parsed = nlohmann::json::parse(raw, nullptr, false);
  if (parsed.is_discarded() || parsed.is_object() || parsed.is_null()) {
    return std::string(raw);
  }
  return parsed;
}

}  // namespace agency

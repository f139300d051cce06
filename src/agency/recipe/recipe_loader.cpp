#include "agency/recipe/recipe_loader.hpp"

#include "agency/config/yaml_utils.hpp"
#include "agency/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <fstream>
#include <sstream>

namespace {

// A scalar or a sequence of scalars.
auto string_list(const YAML::Node& node) -> std::vector<std::string> {
  if (!node) {
    return {};
  }
  if (node.IsSequence()) {
    return node.as<std::vector<std::string>>();
  }
  std::vector<std::string> out;
  std::istringstream in(node.as<std::string>());
  std::string item;
  while (std::getline(in, item, ',')) {
    auto first = item.find_first_not_of(" \t");
    auto last = item.find_last_not_of(" \t");
    if (first != std::string::npos) {
      out.push_back(item.substr(first, last - first + 1));
    }
  }
  return out;
}

}  // namespace

namespace YAML {

template <>
struct convert<agency::TriggerRule> {
  static bool decode(const Node& node, agency::TriggerRule& rule) {
    if (!node.IsScalar()) return false;
    auto parsed = agency::parse_trigger_rule(node.Scalar());
    if (!parsed) return false;
    rule = *parsed;
    return true;
  }
};

template <>
struct convert<agency::VariableType> {
  static bool decode(const Node& node, agency::VariableType& type) {
    if (!node.IsScalar()) return false;
    auto parsed = agency::parse_variable_type(node.Scalar());
    if (!parsed) return false;
    type = *parsed;
    return true;
  }
};

template <>
struct convert<agency::VariableDef> {
  static bool decode(const Node& node, agency::VariableDef& v) {
    if (!node.IsMap()) return false;
    v.type = agency::yaml_get_or(node, "type", agency::VariableType::String);
    v.description = agency::yaml_get_or<std::string>(node, "description", "");
    if (auto d = node["default"]) {
      v.default_value = agency::yaml_to_json(d);
    }
    v.required = agency::yaml_get_or(node, "required", !v.default_value);
    return true;
  }
};

template <>
struct convert<agency::Step> {
  static bool decode(const Node& node, agency::Step& s) {
    if (!node.IsMap()) return false;
    s.id = agency::StepId{agency::yaml_get_or<std::string>(node, "id", "")};
    s.agent_name = agency::yaml_get_or<std::string>(node, "agent", "");
    s.task_template = agency::yaml_get_or<std::string>(node, "task", "");
    s.context_refs = string_list(node["context"]);
    if (auto vars = node["variables"]; vars && vars.IsMap()) {
      for (const auto& kv : vars) {
        s.variable_overrides[kv.first.as<std::string>()] =
            agency::yaml_to_json(kv.second);
      }
    }
    for (auto& dep : string_list(node["depends_on"])) {
      s.depends_on.emplace_back(std::move(dep));
    }
    if (auto p = node["parallel"]) {
      s.parallel = p.as<bool>();
    }
    if (auto t = node["timeout_ms"]) {
      s.timeout = std::chrono::milliseconds(t.as<std::int64_t>());
    }
    if (auto r = node["trigger_rule"]) {
      s.trigger_rule = r.as<agency::TriggerRule>();
    }
    return true;
  }
};

template <>
struct convert<agency::Recipe> {
  static bool decode(const Node& node, agency::Recipe& r) {
    if (!node.IsMap()) return false;
    r.name = agency::yaml_get_or<std::string>(node, "name", "");
    r.version = agency::yaml_get_or<std::string>(node, "version", "1.0.0");
    r.description = agency::yaml_get_or<std::string>(node, "description", "");
    r.author = agency::yaml_get_or<std::string>(node, "author", "");
    r.tags = string_list(node["tags"]);
    if (auto vars = node["variables"]; vars && vars.IsMap()) {
      for (const auto& kv : vars) {
        r.variables.emplace(kv.first.as<std::string>(),
                            kv.second.as<agency::VariableDef>());
      }
    }
    if (auto steps = node["steps"]) {
      r.steps = steps.as<std::vector<agency::Step>>();
    }
    if (auto cleanup = node["cleanup"]) {
      r.cleanup = cleanup.as<std::vector<agency::Step>>();
    }
    r.success_criteria = string_list(node["success_criteria"]);
    return true;
  }
};

}  // namespace YAML

namespace agency {

namespace {

// Enum-valued keys are checked on the raw document so a bad value reads as
// a validation problem rather than a conversion failure.
auto validate_document(const YAML::Node& root) -> std::vector<std::string> {
  std::vector<std::string> errors;
  if (!root.IsMap()) {
    errors.emplace_back("recipe document must be a mapping");
    return errors;
  }
  if (auto vars = root["variables"]; vars && vars.IsMap()) {
    for (const auto& kv : vars) {
      auto type = kv.second.IsMap() ? kv.second["type"] : YAML::Node{};
      if (!kv.second.IsMap()) {
        errors.push_back(std::format("variable '{}' must be a mapping",
                                     kv.first.as<std::string>()));
      } else if (type && (!type.IsScalar() ||
                          !parse_variable_type(type.Scalar()))) {
        errors.push_back(std::format(
            "variable '{}': type must be one of string|number|boolean|array",
            kv.first.as<std::string>()));
      }
    }
  }
  for (const char* section : {"steps", "cleanup"}) {
    auto steps = root[section];
    if (!steps) {
      continue;
    }
    if (!steps.IsSequence()) {
      errors.push_back(std::format("'{}' must be a list", section));
      continue;
    }
    for (std::size_t i = 0; i < steps.size(); ++i) {
      auto step = steps[i];
      if (!step.IsMap()) {
        errors.push_back(std::format("{}[{}] must be a mapping", section, i));
        continue;
      }
      if (auto rule = step["trigger_rule"];
          rule && (!rule.IsScalar() || !parse_trigger_rule(rule.Scalar()))) {
        errors.push_back(std::format(
            "{}[{}]: trigger_rule must be all_done or all_success", section,
            i));
      }
    }
  }
  return errors;
}

}  // namespace

auto RecipeLoader::validate(const Recipe& recipe) -> std::vector<std::string> {
  std::vector<std::string> errors;
  if (recipe.name.empty()) {
    errors.emplace_back("recipe name cannot be empty");
  }
  if (recipe.steps.empty()) {
    errors.emplace_back("recipe must have at least one step");
  }
  auto check_steps = [&](const std::vector<Step>& steps,
                         std::string_view section) {
    for (std::size_t i = 0; i < steps.size(); ++i) {
      const auto& s = steps[i];
      if (s.agent_name.empty()) {
        errors.push_back(std::format("{}[{}]: agent is required", section, i));
      }
      if (s.task_template.empty()) {
        errors.push_back(std::format("{}[{}]: task is required", section, i));
      }
      if (s.timeout && s.timeout->count() <= 0) {
        errors.push_back(
            std::format("{}[{}]: timeout_ms must be positive", section, i));
      }
    }
  };
  check_steps(recipe.steps, "steps");
  check_steps(recipe.cleanup, "cleanup");
  return errors;
}

auto RecipeLoader::load_from_file(std::string_view path) -> Result<Recipe> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open recipe file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto result = load_from_string(buffer.str());
  if (result) {
    result->source_file = path_str;
  }
  return result;
}

auto RecipeLoader::load_from_string(std::string_view yaml_str)
    -> Result<Recipe> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));

    auto errors = validate_document(root);
    if (!errors.empty()) {
      for (const auto& err : errors) {
        log::error("Recipe validation error: {}", err);
      }
      return fail(Error::ValidationError);
    }

    auto recipe = root.as<Recipe>();
    errors = validate(recipe);
    if (!errors.empty()) {
      for (const auto& err : errors) {
        log::error("Recipe validation error: {}", err);
      }
      return fail(Error::ValidationError);
    }
    return ok(std::move(recipe));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace agency

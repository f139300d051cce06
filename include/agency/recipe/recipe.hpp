#pragma once

#include "agency/executor/task.hpp"
#include "agency/recipe/trigger_rule.hpp"
#include "agency/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agency {

enum class VariableType : std::uint8_t { String, Number, Boolean, Array };

[[nodiscard]] auto to_string_view(VariableType type) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_variable_type(std::string_view s) noexcept
    -> std::optional<VariableType>;

struct VariableDef {
  VariableType type{VariableType::String};
  std::string description;
  std::optional<nlohmann::json> default_value;
  bool required{false};
};

// A template for a Task. `id` may be left empty; see resolve_step_ids().
struct Step {
  StepId id;
  std::string agent_name;
  std::string task_template;
  std::vector<std::string> context_refs;
  VariableMap variable_overrides;
  std::vector<StepId> depends_on;
  std::optional<bool> parallel;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<TriggerRule> trigger_rule;
};

struct Recipe {
  std::string name;
  std::string version{"1.0.0"};
  std::string description;
  std::string author;
  std::vector<std::string> tags;
  std::map<std::string, VariableDef, std::less<>> variables;
  std::vector<Step> steps;
  std::vector<Step> cleanup;
  std::vector<std::string> success_criteria;
  std::string source_file;
};

// Effective identity of every step, by index. An explicit id wins; otherwise
// the agent name, and "<agent>#<n>" for its n-th reuse.
[[nodiscard]] auto resolve_step_ids(std::span<const Step> steps)
    -> std::vector<StepId>;

}  // namespace agency

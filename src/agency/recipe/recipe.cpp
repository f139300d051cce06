#include "agency/recipe/recipe.hpp"

#include <array>
#include <format>
#include <unordered_map>
#include <utility>

namespace agency {

namespace {

constexpr std::array kVariableTypeNames = {"string", "number", "boolean",
                                           "array"};

}  // namespace

auto to_string_view(VariableType type) noexcept -> std::string_view {
  auto idx = std::to_underlying(type);
  return idx < kVariableTypeNames.size() ? kVariableTypeNames[idx] : "string";
}

auto parse_variable_type(std::string_view s) noexcept
    -> std::optional<VariableType> {
  for (std::size_t i = 0; i < kVariableTypeNames.size(); ++i) {
    if (s == kVariableTypeNames[i]) {
      return static_cast<VariableType>(i);
    }
  }
  return std::nullopt;
}

auto resolve_step_ids(std::span<const Step> steps) -> std::vector<StepId> {
  std::vector<StepId> ids;
  ids.reserve(steps.size());
  std::unordered_map<std::string_view, std::size_t> uses;
  for (const auto& step : steps) {
    if (!step.id.empty()) {
      ids.push_back(step.id);
      continue;
    }
    auto n = ++uses[step.agent_name];
    ids.emplace_back(n == 1 ? step.agent_name
                            : std::format("{}#{}", step.agent_name, n));
  }
  return ids;
}

}  // namespace agency

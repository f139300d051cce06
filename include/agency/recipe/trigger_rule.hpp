#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace agency {

// When a step may start relative to the outcome of its dependencies.
enum class TriggerRule : std::uint8_t {
  AllDone,     // every dependency finished, success or not
  AllSuccess,  // every dependency succeeded; otherwise the step is skipped
};

[[nodiscard]] constexpr auto to_string_view(TriggerRule rule) noexcept
    -> std::string_view {
  switch (rule) {
    case TriggerRule::AllDone: return "all_done";
    case TriggerRule::AllSuccess: return "all_success";
  }
  return "all_done";
}

[[nodiscard]] constexpr auto parse_trigger_rule(std::string_view s) noexcept
    -> std::optional<TriggerRule> {
  if (s == "all_done") return TriggerRule::AllDone;
  if (s == "all_success") return TriggerRule::AllSuccess;
  return std::nullopt;
}

}  // namespace agency

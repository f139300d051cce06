#pragma once

#include "agency/core/error.hpp"
#include "agency/recipe/recipe.hpp"
#include "agency/util/id.hpp"

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace agency {

// Ordered batches of step indices. Every step is in exactly one batch and
// no batch holds two steps where one depends on the other.
struct ExecutionPlan {
  std::vector<std::vector<std::size_t>> batches;
  // Effective id per step index.
  std::vector<StepId> step_ids;

  [[nodiscard]] auto step_count() const noexcept -> std::size_t {
    return step_ids.size();
  }
};

struct PlanError {
  std::error_code code;
  std::string message;
  // Closed path of step ids when code is CircularDependency.
  std::vector<StepId> cycle;
};

// Computed in full before anything runs. Fails with ValidationError for
// duplicate ids or dependencies naming no step, and CircularDependency when
// no further batch can be formed.
[[nodiscard]] auto build_execution_plan(std::span<const Step> steps)
    -> std::expected<ExecutionPlan, PlanError>;

// Human-readable rendering: one line per batch.
[[nodiscard]] auto format_plan(const ExecutionPlan& plan,
                               std::span<const Step> steps) -> std::string;

}  // namespace agency

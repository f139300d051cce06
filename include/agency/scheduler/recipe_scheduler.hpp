#pragma once

#include "agency/executor/coordinator.hpp"
#include "agency/executor/task.hpp"
#include "agency/recipe/execution_plan.hpp"
#include "agency/recipe/recipe.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace agency {

struct RecipeRunOptions {
  VariableMap variables;
  std::optional<std::string> context_path;
  // Each step writes to its own file derived from this path.
  std::optional<std::string> output_path;
  OutputFormat format{OutputFormat::Markdown};
  // Defaults to the coordinator's max_concurrency.
  std::optional<std::size_t> concurrency;
  std::optional<std::chrono::milliseconds> batch_timeout;
};

struct RecipeValidation {
  bool valid{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  std::optional<ExecutionPlan> plan;
  VariableMap variables;
};

struct RecipeResult {
  bool success{false};
  std::string recipe;
  std::size_t steps_completed{0};
  std::size_t steps_total{0};
  // In execution order; step_ids[i] produced results[i].
  std::vector<ExecutionResult> results;
  std::vector<StepId> step_ids;
  std::chrono::milliseconds duration{0};
  std::string summary;
  std::vector<std::string> errors;
  // Set when the recipe was rejected before any step ran.
  std::error_code error;
  std::vector<StepId> cycle;
};

// Drives a recipe batch by batch through the coordinator. Batch N+1 never
// starts before batch N has drained.
class RecipeScheduler {
public:
  explicit RecipeScheduler(TaskCoordinator& coordinator);

  [[nodiscard]] auto validate(const Recipe& recipe,
                              const VariableMap& provided = {}) const
      -> RecipeValidation;
  [[nodiscard]] auto plan(const Recipe& recipe) const
      -> std::expected<ExecutionPlan, PlanError>;
  [[nodiscard]] auto run(const Recipe& recipe,
                         const RecipeRunOptions& options = {})
      -> RecipeResult;

private:
  using StepOutcome = std::pair<std::size_t, ExecutionResult>;

  [[nodiscard]] auto run_steps(const std::vector<Step>& steps,
                               const ExecutionPlan& plan,
                               const VariableMap& variables,
                               const RecipeRunOptions& options,
                               bool with_paths) -> std::vector<StepOutcome>;
  [[nodiscard]] auto materialize(const Step& step, const StepId& id,
                                 const VariableMap& variables,
                                 const RecipeRunOptions& options,
                                 bool with_paths) const -> Task;
  auto run_cleanup(const Recipe& recipe, const VariableMap& variables,
                   const RecipeRunOptions& options) -> void;

  TaskCoordinator& coordinator_;
};

[[nodiscard]] auto format_recipe_summary(const Recipe& recipe,
                                         const RecipeResult& result)
    -> std::string;

}  // namespace agency

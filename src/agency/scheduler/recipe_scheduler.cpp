#include "agency/scheduler/recipe_scheduler.hpp"

#include "agency/executor/template_renderer.hpp"
#include "agency/recipe/recipe_loader.hpp"
#include "agency/recipe/variables.hpp"
#include "agency/util/id.hpp"
#include "agency/util/log.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <span>

namespace agency {

namespace {

using Clock = std::chrono::steady_clock;

auto skipped_result(const Step& step, const StepId& failed_dep)
    -> ExecutionResult {
  ExecutionResult r;
  r.execution_id = generate_execution_id();
  r.agent_name = step.agent_name;
  r.failure = FailureKind::UpstreamFailed;
  r.error = std::format("upstream_failed: {}", failed_dep);
  r.timestamp = std::chrono::system_clock::now();
  return r;
}

auto rejected(const Recipe& recipe, std::error_code code,
              std::vector<std::string> errors, Clock::time_point started)
    -> RecipeResult {
  RecipeResult result;
  result.recipe = recipe.name;
  result.steps_total = recipe.steps.size();
  result.error = code;
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - started);
  std::string joined;
  for (const auto& e : errors) {
    joined += joined.empty() ? e : std::format(", {}", e);
  }
  result.summary = std::format("Recipe execution failed: {}", joined);
  result.errors = std::move(errors);
  return result;
}

}  // namespace

RecipeScheduler::RecipeScheduler(TaskCoordinator& coordinator)
    : coordinator_(coordinator) {}

auto RecipeScheduler::plan(const Recipe& recipe) const
    -> std::expected<ExecutionPlan, PlanError> {
  return build_execution_plan(recipe.steps);
}

auto RecipeScheduler::validate(const Recipe& recipe,
                               const VariableMap& provided) const
    -> RecipeValidation {
  RecipeValidation v;
  v.errors = RecipeLoader::validate(recipe);
  v.variables = resolve_variables(recipe, provided);
  std::ranges::move(validate_variables(recipe, v.variables),
                    std::back_inserter(v.errors));

  const auto& agents = coordinator_.config().agents;
  if (!agents.empty()) {
    for (const auto& step : recipe.steps) {
      if (std::ranges::find(agents, step.agent_name) == agents.end()) {
        v.errors.push_back(std::format("Agent '{}' not found", step.agent_name));
      }
    }
  }

  for (const auto& step : recipe.steps) {
    for (const auto& name : template_placeholders(step.task_template)) {
      if (!v.variables.contains(name) &&
          !step.variable_overrides.contains(name)) {
        v.warnings.push_back(std::format(
            "step '{}': placeholder '{}' has no value", step.agent_name, name));
      }
    }
  }

  if (auto p = plan(recipe)) {
    v.plan = std::move(*p);
  } else {
    v.errors.push_back(p.error().message);
  }
  if (!recipe.cleanup.empty()) {
    if (auto p = build_execution_plan(recipe.cleanup); !p) {
      v.warnings.push_back(std::format("cleanup: {}", p.error().message));
    }
  }

  v.valid = v.errors.empty();
  return v;
}

auto RecipeScheduler::materialize(const Step& step, const StepId& id,
                                  const VariableMap& variables,
                                  const RecipeRunOptions& options,
                                  bool with_paths) const -> Task {
  Task task;
  task.agent_name = step.agent_name;
  task.description = step.task_template;
  task.timeout = step.timeout;
  task.format = options.format;

  task.variables = variables;
  for (const auto& [name, value] : step.variable_overrides) {
    task.variables.insert_or_assign(
        name, value.is_string()
                  ? nlohmann::json(render_template(value.get<std::string>(),
                                                   variables))
                  : value);
  }

  for (const auto& ref : step.context_refs) {
    task.extra_context_paths.push_back(render_template(ref, task.variables));
  }
  if (with_paths) {
    task.context_path = options.context_path;
    if (options.output_path) {
      task.output_path = isolated_output_path(*options.output_path, id.value());
    }
  }
  return task;
}

auto RecipeScheduler::run_steps(const std::vector<Step>& steps,
                                const ExecutionPlan& plan,
                                const VariableMap& variables,
                                const RecipeRunOptions& options,
                                bool with_paths) -> std::vector<StepOutcome> {
  const auto& config = coordinator_.config();
  auto concurrency = options.concurrency.value_or(config.max_concurrency);

  // nullopt until the step finished; then whether it succeeded.
  std::vector<std::optional<bool>> done(steps.size());
  std::vector<StepOutcome> outcomes;
  outcomes.reserve(steps.size());

  for (std::size_t b = 0; b < plan.batches.size(); ++b) {
    const auto& batch = plan.batches[b];
    std::map<std::size_t, ExecutionResult> finished;
    std::vector<std::size_t> parallel_idx;
    std::vector<std::size_t> serial_idx;

    for (auto idx : batch) {
      const auto& step = steps[idx];
      auto rule = step.trigger_rule.value_or(config.dependency_policy);
      if (rule == TriggerRule::AllSuccess) {
        auto failed = std::ranges::find_if(step.depends_on, [&](const StepId& dep) {
          auto it = std::ranges::find(plan.step_ids, dep);
          auto dep_idx = static_cast<std::size_t>(it - plan.step_ids.begin());
          return !done[dep_idx].value_or(false);
        });
        if (failed != step.depends_on.end()) {
          log::warn("Skipping step {}: dependency {} did not succeed",
                    plan.step_ids[idx], *failed);
          finished.emplace(idx, skipped_result(step, *failed));
          continue;
        }
      }
      (step.parallel == false ? serial_idx : parallel_idx).push_back(idx);
    }

    log::info("Running batch {}/{}: {} parallel, {} serial, {} skipped", b + 1,
              plan.batches.size(), parallel_idx.size(), serial_idx.size(),
              finished.size());

    if (!parallel_idx.empty()) {
      std::vector<Task> tasks;
      tasks.reserve(parallel_idx.size());
      for (auto idx : parallel_idx) {
        tasks.push_back(materialize(steps[idx], plan.step_ids[idx], variables,
                                    options, with_paths));
      }
      auto result =
          coordinator_.execute_batch(tasks, concurrency, options.batch_timeout);
      for (std::size_t i = 0; i < parallel_idx.size(); ++i) {
        finished.emplace(parallel_idx[i], std::move(result.results[i]));
      }
    }

    for (auto idx : serial_idx) {
      auto task = materialize(steps[idx], plan.step_ids[idx], variables,
                              options, with_paths);
      auto result = coordinator_.execute_batch(std::span(&task, 1), 1,
                                               options.batch_timeout);
      finished.emplace(idx, std::move(result.results.front()));
    }

    for (auto& [idx, r] : finished) {
      done[idx] = r.success;
      if (!r.success) {
        log::warn("Step {} failed: {}", plan.step_ids[idx],
                  r.error.value_or("unknown error"));
      }
      outcomes.emplace_back(idx, std::move(r));
    }
  }
  return outcomes;
}

auto RecipeScheduler::run_cleanup(const Recipe& recipe,
                                  const VariableMap& variables,
                                  const RecipeRunOptions& options) -> void {
  auto plan = build_execution_plan(recipe.cleanup);
  if (!plan) {
    log::warn("Cleanup steps not run: {}", plan.error().message);
    return;
  }
  log::info("Executing {} cleanup steps", recipe.cleanup.size());
  auto outcomes = run_steps(recipe.cleanup, *plan, variables, options, false);
  for (const auto& [idx, r] : outcomes) {
    if (!r.success) {
      log::warn("Cleanup step {} failed: {}", plan->step_ids[idx],
                r.error.value_or("unknown error"));
    }
  }
}

auto RecipeScheduler::run(const Recipe& recipe, const RecipeRunOptions& options)
    -> RecipeResult {
  auto started = Clock::now();
  log::info("Starting recipe execution: {}", recipe.name);

  auto structural = RecipeLoader::validate(recipe);
  if (!structural.empty()) {
    return rejected(recipe, make_error_code(Error::ValidationError),
                    std::move(structural), started);
  }

  auto variables = resolve_variables(recipe, options.variables);
  if (auto errors = validate_variables(recipe, variables); !errors.empty()) {
    for (const auto& e : errors) {
      log::error("Recipe {}: {}", recipe.name, e);
    }
    return rejected(recipe, make_error_code(Error::ValidationError),
                    std::move(errors), started);
  }

  auto execution_plan = plan(recipe);
  if (!execution_plan) {
    auto& err = execution_plan.error();
    auto result = rejected(recipe, err.code, {err.message}, started);
    result.cycle = std::move(err.cycle);
    return result;
  }

  RecipeResult result;
  result.recipe = recipe.name;
  result.steps_total = recipe.steps.size();

  auto outcomes =
      run_steps(recipe.steps, *execution_plan, variables, options, true);
  for (auto& [idx, r] : outcomes) {
    if (r.success) {
      ++result.steps_completed;
    } else if (r.error) {
      result.errors.push_back(
          std::format("{}: {}", execution_plan->step_ids[idx], *r.error));
    }
    result.step_ids.push_back(execution_plan->step_ids[idx]);
    result.results.push_back(std::move(r));
  }

  if (!recipe.cleanup.empty()) {
    run_cleanup(recipe, variables, options);
  }

  result.success = !result.results.empty() &&
                   result.steps_completed == result.results.size();
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - started);
  result.summary = format_recipe_summary(recipe, result);
  log::info("Recipe completed: {}/{} steps successful in {}ms",
            result.steps_completed, result.steps_total,
            result.duration.count());
  return result;
}

auto format_recipe_summary(const Recipe& recipe, const RecipeResult& result)
    -> std::string {
  auto seconds = [](std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
  };
  auto failed = result.results.size() - result.steps_completed;

  auto out = std::format(
      "# Recipe Execution Summary\n\n"
      "**Recipe**: {}\n**Description**: {}\n**Version**: {}\n\n"
      "## Results\n"
      "- **Total Steps**: {}\n- **Successful**: {}\n- **Failed**: {}\n"
      "- **Duration**: {:.2f}s\n",
      recipe.name, recipe.description, recipe.version, result.results.size(),
      result.steps_completed, failed, seconds(result.duration));
  if (!result.results.empty()) {
    out += std::format("- **Average per Step**: {:.2f}s\n",
                       seconds(result.duration) /
                           static_cast<double>(result.results.size()));
  }
  out += '\n';

  if (result.steps_completed > 0) {
    out += "### Successful Steps\n";
    for (std::size_t i = 0; i < result.results.size(); ++i) {
      const auto& r = result.results[i];
      if (r.success) {
        out += std::format("- **{}**: {:.2f}s\n", result.step_ids[i],
                           seconds(r.metrics.duration));
      }
    }
    out += '\n';
  }
  if (failed > 0) {
    out += "### Failed Steps\n";
    for (std::size_t i = 0; i < result.results.size(); ++i) {
      const auto& r = result.results[i];
      if (!r.success) {
        out += std::format("- **{}**: {}\n", result.step_ids[i],
                           r.error.value_or("unknown error"));
      }
    }
    out += '\n';
  }
  return out;
}

}  // namespace agency

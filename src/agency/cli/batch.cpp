#include "agency/cli/commands.hpp"
#include "agency/executor/coordinator.hpp"
#include "common.hpp"

#include <print>

namespace agency::cli {

auto cmd_batch(const BatchOptions& opts) -> int {
  if (opts.agents.empty()) {
    std::println(stderr, "Error: batch requires at least one agent");
    return 1;
  }

  auto app = open_application(opts.global);
  if (!app) {
    return 1;
  }

  auto variables = to_variable_map(opts.variables);
  std::vector<Task> tasks;
  tasks.reserve(opts.agents.size());
  for (const auto& agent : opts.agents) {
    Task task;
    task.agent_name = agent;
    task.description = opts.task;
    task.variables = variables;
    task.format = OutputFormat::Markdown;
    if (!opts.context_path.empty()) {
      task.context_path = opts.context_path;
    }
    if (!opts.output_path.empty()) {
      task.output_path = isolated_output_path(opts.output_path, agent);
    }
    if (opts.timeout_ms) {
      task.timeout = std::chrono::milliseconds(*opts.timeout_ms);
    }
    tasks.push_back(std::move(task));
  }

  auto parallel =
      opts.parallel.value_or(app->config().execution.max_concurrency);
  auto batch = app->coordinator().execute_batch(tasks, parallel);
  close_application(std::move(app));

  std::println("{}", batch.summary);
  return batch.failed == 0 ? 0 : 1;
}

}  // namespace agency::cli

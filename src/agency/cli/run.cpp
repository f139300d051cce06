#include "agency/cli/commands.hpp"
#include "agency/executor/coordinator.hpp"
#include "common.hpp"

#include <print>

namespace agency::cli {

auto cmd_run(const RunOptions& opts) -> int {
  auto format = parse_output_format(opts.format);
  if (!format) {
    std::println(stderr, "Error: unknown format '{}'", opts.format);
    return 1;
  }

  auto app = open_application(opts.global);
  if (!app) {
    return 1;
  }

  Task task;
  task.agent_name = opts.agent;
  task.description = opts.task;
  task.format = *format;
  task.variables = to_variable_map(opts.variables);
  if (!opts.context_path.empty()) {
    task.context_path = opts.context_path;
  }
  if (!opts.output_path.empty()) {
    task.output_path = opts.output_path;
  }
  if (opts.timeout_ms) {
    task.timeout = std::chrono::milliseconds(*opts.timeout_ms);
  }

  auto result = app->coordinator().execute_single(task);
  close_application(std::move(app));

  if (!result.success) {
    std::println(stderr, "✗ {} failed: {}", result.agent_name,
                 result.error.value_or("unknown error"));
    return 1;
  }
  if (task.output_path) {
    std::println("✓ {} completed in {}ms, output written to {}",
                 result.agent_name, result.metrics.duration.count(),
                 *task.output_path);
  } else {
    std::println("{}", result.output.value_or(""));
  }
  return 0;
}

}  // namespace agency::cli

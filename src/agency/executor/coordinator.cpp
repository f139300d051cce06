#include "agency/executor/coordinator.hpp"

#include "agency/cache/execution_history.hpp"
#include "agency/cache/resource_cache.hpp"
#include "agency/executor/agent_runtime.hpp"
#include "agency/executor/template_renderer.hpp"
#include "agency/security/security_gate.hpp"
#include "agency/util/json.hpp"
#include "agency/util/log.hpp"
#include "agency/util/util.hpp"

#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <format>
#include <functional>
#include <iterator>
#include <ranges>
#include <thread>

namespace agency {

namespace {

using Clock = std::chrono::steady_clock;

struct InvocationState {
  std::mutex mu;
  std::condition_variable cv;
  std::optional<AgentResponse> response;
};

auto elapsed_ms(Clock::time_point since) -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               since);
}

auto sanitize_strings(nlohmann::json& node,
                      const std::function<std::string(std::string_view)>& fn)
    -> void {
  if (node.is_string()) {
    node = fn(node.get_ref<const std::string&>());
  } else if (node.is_array() || node.is_object()) {
    for (auto& child : node) {
      sanitize_strings(child, fn);
    }
  }
}

}  // namespace

TaskCoordinator::TaskCoordinator(IAgentRuntime& runtime, SecurityGate& gate,
                                 ResourceCache* cache, BoundedHistory& history,
                                 ExecutionConfig config)
    : runtime_(runtime),
      gate_(gate),
      cache_(cache),
      history_(history),
      config_(std::move(config)),
      loader_(gate, cache, config_.max_context_files),
      admission_(config_.max_concurrency) {}

auto TaskCoordinator::execute_single(const Task& task) -> ExecutionResult {
  return execute(task, std::nullopt);
}

auto TaskCoordinator::validate(const Task& task) const
    -> std::optional<std::string> {
  if (task.agent_name.empty()) {
    return "agent name is empty";
  }
  if (!config_.agents.empty() &&
      std::ranges::find(config_.agents, task.agent_name) ==
          config_.agents.end()) {
    return std::format("unknown agent '{}'", task.agent_name);
  }
  if (task.description.empty()) {
    return "task description is empty";
  }
  if (task.timeout) {
    if (task.timeout->count() <= 0) {
      return "timeout must be positive";
    }
    if (*task.timeout > config_.max_timeout) {
      return std::format("timeout {}ms exceeds maximum {}ms",
                         task.timeout->count(), config_.max_timeout.count());
    }
  }
  return std::nullopt;
}

auto TaskCoordinator::execute(const Task& task, Deadline batch_deadline)
    -> ExecutionResult {
  auto started = Clock::now();
  ExecutionResult result;
  result.execution_id = generate_execution_id();
  result.agent_name = task.agent_name;
  result.timestamp = std::chrono::system_clock::now();

  if (auto problem = validate(task)) {
    log::warn("Rejected task for agent '{}': {}", task.agent_name, *problem);
    result.failure = FailureKind::Validation;
    result.error = std::format("validation_error: {}", *problem);
    finish(result, started);
    return result;
  }

  if (task.output_path &&
      !gate_.validate_path(*task.output_path, FileOperation::Write)) {
    result.failure = FailureKind::SecurityViolation;
    result.error =
        std::format("security_violation: output path rejected: {}",
                    *task.output_path);
    finish(result, started);
    return result;
  }

  auto context = prepare_context(task, result);
  if (!context) {
    finish(result, started);
    return result;
  }

  auto timeout = task.timeout.value_or(config_.default_timeout);

  std::optional<AdmissionGate::Slot> slot;
  if (batch_deadline) {
    slot = admission_.acquire_until(*batch_deadline);
    if (!slot) {
      log::warn("Batch deadline elapsed before {} could start",
                task.agent_name);
      result.failure = FailureKind::Timeout;
      result.error = "timeout";
      finish(result, started);
      return result;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *batch_deadline - Clock::now());
    timeout = std::min(timeout, std::max(remaining, std::chrono::milliseconds{1}));
  } else {
    slot = admission_.acquire();
  }

  ++active_;
  invoke(task, std::move(*context), timeout, result);
  --active_;
  slot->release();

  if (result.success && task.output_path) {
    write_output(task, result);
  }
  finish(result, started);
  return result;
}

auto TaskCoordinator::prepare_context(const Task& task,
                                      ExecutionResult& result)
    -> std::optional<std::string> {
  std::vector<std::string> paths;
  if (task.context_path) {
    paths.push_back(*task.context_path);
  }
  std::ranges::copy(task.extra_context_paths, std::back_inserter(paths));

  std::string context;
  bool all_cached = !paths.empty();
  for (const auto& path : paths) {
    auto loaded = loader_.load(path);
    if (!loaded) {
      if (loaded.error() == Error::SecurityViolation) {
        result.failure = FailureKind::SecurityViolation;
        result.error =
            std::format("security_violation: context path rejected: {}", path);
      } else {
        result.failure = FailureKind::Io;
        result.error = std::format("io_error: failed to load context {}: {}",
                                   path, loaded.error().message());
      }
      return std::nullopt;
    }
    all_cached = all_cached && loaded->from_cache;
    context += "## Context\n";
    context += loaded->content;
  }

  if (!task.variables.empty()) {
    nlohmann::json vars(nlohmann::json::value_t::object);
    for (const auto& [name, value] : task.variables) {
      vars[name] = value;
    }
    context += std::format("## Variables\n{}\n\n", dump_json(vars, 2));
  }

  result.context_from_cache = all_cached;
  result.metrics.context_size_bytes = context.size();
  return context;
}

auto TaskCoordinator::invoke(const Task& task, std::string context,
                             std::chrono::milliseconds timeout,
                             ExecutionResult& result) -> void {
  auto state = std::make_shared<InvocationState>();
  auto invocation_id = generate_invocation_id(result.execution_id);

  AgentRequest request{
      .invocation_id = invocation_id,
      .agent_name = task.agent_name,
      .task = render_template(task.description, task.variables),
      .context = std::move(context),
      .timeout = timeout,
  };

  log::debug("Starting {} for agent {} (timeout {}ms)", invocation_id,
             task.agent_name, timeout.count());
  result.attempted = true;
  runtime_.start(std::move(request),
                 [state](const InvocationId&, AgentResponse response) {
                   {
                     std::lock_guard lock(state->mu);
                     if (!state->response) {
                       state->response = std::move(response);
                     }
                   }
                   state->cv.notify_all();
                 });

  std::unique_lock lock(state->mu);
  bool done = state->cv.wait_for(lock, timeout,
                                 [&] { return state->response.has_value(); });
  if (!done) {
    lock.unlock();
    log::warn("Agent {} timed out after {}ms", task.agent_name,
              timeout.count());
    runtime_.cancel(invocation_id);
    result.failure = FailureKind::Timeout;
    result.error = "timeout";
    return;
  }

  auto response = std::move(*state->response);
  lock.unlock();

  result.metrics.tokens_used = response.tokens_used;
  result.output = std::move(response.output);
  if (response.success) {
    result.success = true;
    return;
  }
  result.failure = FailureKind::Runtime;
  result.error = response.error.value_or("agent runtime reported failure");
  log::error("Agent {} failed: {}", task.agent_name, *result.error);
}

auto TaskCoordinator::format_output(OutputFormat format,
                                    const std::string& output) -> std::string {
  if (format != OutputFormat::Json) {
    return output;
  }
  auto sanitize = [this](std::string_view s) {
    return gate_.sanitize_content(s);
  };
  auto parsed = nlohmann::json::parse(output, nullptr, false);
  if (parsed.is_discarded()) {
    parsed = nlohmann::json{{"output", output}};
  }
  sanitize_strings(parsed, sanitize);
  return dump_json(parsed, 2);
}

auto TaskCoordinator::write_output(const Task& task, ExecutionResult& result)
    -> void {
  auto content = format_output(task.format, result.output.value_or(""));
  auto written = gate_.write_file(*task.output_path, content);
  if (written) {
    log::debug("Wrote {} output to {}", task.agent_name, *task.output_path);
    return;
  }
  result.success = false;
  result.failure = written.error() == Error::SecurityViolation
                       ? FailureKind::SecurityViolation
                       : FailureKind::Io;
  result.error = std::format(
      "{}: failed to write output to {}: {}",
      result.failure == FailureKind::Io ? "io_error" : "security_violation",
      *task.output_path, written.error().message());
  log::error("{}", *result.error);
}

auto TaskCoordinator::finish(ExecutionResult& result, Clock::time_point started)
    -> void {
  result.metrics.duration = elapsed_ms(started);
  {
    std::lock_guard lock(metrics_mu_);
    ++total_;
    if (result.success) {
      ++successful_;
    } else {
      ++failed_;
    }
    total_duration_ += result.metrics.duration;
    auto tokens = result.metrics.tokens_used.value_or(0);
    total_tokens_ += tokens;
    auto& agent = agents_[result.agent_name];
    ++agent.runs;
    agent.successes += result.success ? 1 : 0;
    agent.duration += result.metrics.duration;
    agent.tokens += tokens;
  }
  history_.record(result);

  if (result.success) {
    log::info("Agent {} completed in {}ms", result.agent_name,
              result.metrics.duration.count());
  } else {
    log::info("Agent {} failed ({}) in {}ms", result.agent_name,
              to_string_view(result.failure), result.metrics.duration.count());
  }
}

auto TaskCoordinator::execute_batch(
    std::span<const Task> tasks, std::size_t concurrency_limit,
    std::optional<std::chrono::milliseconds> batch_timeout) -> BatchResult {
  auto started = Clock::now();
  Deadline deadline;
  if (batch_timeout) {
    deadline = started + *batch_timeout;
  }

  std::vector<std::optional<ExecutionResult>> slots(tasks.size());
  std::atomic<std::size_t> next{0};
  auto workers_count =
      std::min(std::max<std::size_t>(concurrency_limit, 1), tasks.size());

  log::info("Executing batch of {} tasks with concurrency {}", tasks.size(),
            workers_count);
  {
    std::vector<std::jthread> workers;
    workers.reserve(workers_count);
    for (std::size_t w = 0; w < workers_count; ++w) {
      workers.emplace_back([&] {
        for (auto i = next.fetch_add(1); i < tasks.size();
             i = next.fetch_add(1)) {
          slots[i] = execute(tasks[i], deadline);
        }
      });
    }
  }

  BatchResult batch;
  batch.total = tasks.size();
  batch.results.reserve(tasks.size());
  for (auto& slot : slots) {
    auto& r = batch.results.emplace_back(std::move(*slot));
    if (r.success) {
      ++batch.successful;
    } else {
      ++batch.failed;
    }
  }
  batch.duration = elapsed_ms(started);
  batch.summary = format_batch_summary(batch);
  return batch;
}

auto TaskCoordinator::metrics() const -> CoordinatorMetrics {
  CoordinatorMetrics m;
  m.peak_in_flight = admission_.peak();
  std::lock_guard lock(metrics_mu_);
  m.total_executions = total_;
  m.successful = successful_;
  m.failed = failed_;
  m.total_tokens = total_tokens_;
  if (total_ > 0) {
    m.average_duration_ms = static_cast<double>(total_duration_.count()) /
                            static_cast<double>(total_);
  }
  for (const auto& [name, totals] : agents_) {
    auto& perf = m.agents[name];
    perf.runs = totals.runs;
    perf.successes = totals.successes;
    perf.tokens_used = totals.tokens;
    if (totals.runs > 0) {
      perf.success_rate = static_cast<double>(totals.successes) /
                          static_cast<double>(totals.runs);
      perf.average_duration_ms = static_cast<double>(totals.duration.count()) /
                                 static_cast<double>(totals.runs);
    }
  }
  return m;
}

auto TaskCoordinator::status() const -> CoordinatorStatus {
  CoordinatorStatus s;
  s.active = active_.load();
  s.queued = admission_.waiting();
  s.max_concurrency = admission_.capacity();
  std::lock_guard lock(metrics_mu_);
  s.completed = successful_;
  s.failed = failed_;
  return s;
}

auto TaskCoordinator::logs(std::string_view agent, std::size_t limit) const
    -> std::vector<ExecutionResult> {
  if (agent.empty()) {
    return history_.recent(limit);
  }
  return history_.by_agent(agent, limit);
}

auto isolated_output_path(std::string_view output_path, std::string_view name)
    -> std::string {
  std::filesystem::path out(output_path);
  auto file = std::format("{}_{}", sanitize_file_component(name),
                          out.filename().string());
  return (out.parent_path() / file).string();
}

auto format_batch_summary(const BatchResult& batch) -> std::string {
  auto out = std::format(
      "## Batch Execution Summary\n\n"
      "- Total: {}\n- Successful: {}\n- Failed: {}\n- Duration: {}ms\n\n"
      "### Results\n\n",
      batch.total, batch.successful, batch.failed, batch.duration.count());
  for (const auto& r : batch.results) {
    if (r.success) {
      out += std::format("- [ok] {} ({}ms)\n", r.agent_name,
                         r.metrics.duration.count());
    } else {
      out += std::format("- [failed] {} ({}ms): {}\n", r.agent_name,
                         r.metrics.duration.count(), r.error.value_or(""));
    }
  }
  return out;
}

}  // namespace agency

#pragma once

#include "agency/config/system_config.hpp"
#include "agency/executor/admission.hpp"
#include "agency/executor/context_loader.hpp"
#include "agency/executor/task.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agency {

class IAgentRuntime;
class SecurityGate;
class ResourceCache;
class BoundedHistory;

struct AgentPerformance {
  std::size_t runs{0};
  std::size_t successes{0};
  double success_rate{0.0};
  double average_duration_ms{0.0};
  std::uint64_t tokens_used{0};
};

struct CoordinatorMetrics {
  std::size_t total_executions{0};
  std::size_t successful{0};
  std::size_t failed{0};
  double average_duration_ms{0.0};
  std::uint64_t total_tokens{0};
  std::size_t peak_in_flight{0};
  std::map<std::string, AgentPerformance, std::less<>> agents;
};

struct CoordinatorStatus {
  std::size_t active{0};
  std::size_t queued{0};
  std::size_t completed{0};
  std::size_t failed{0};
  std::size_t max_concurrency{0};
};

struct BatchResult {
  std::size_t total{0};
  std::size_t successful{0};
  std::size_t failed{0};
  // Submission order.
  std::vector<ExecutionResult> results;
  std::string summary;
  std::chrono::milliseconds duration{0};
};

// Runs tasks against the agent runtime under a fixed number of admission
// slots and a hard per-task deadline. Never throws for a task's failure;
// every outcome is an ExecutionResult.
class TaskCoordinator {
public:
  TaskCoordinator(IAgentRuntime& runtime, SecurityGate& gate,
                  ResourceCache* cache, BoundedHistory& history,
                  ExecutionConfig config);

  TaskCoordinator(const TaskCoordinator&) = delete;
  auto operator=(const TaskCoordinator&) -> TaskCoordinator& = delete;

  [[nodiscard]] auto execute_single(const Task& task) -> ExecutionResult;

  // At most `concurrency_limit` tasks in flight; a finished task frees its
  // worker for the next queued one. With a batch timeout, tasks that have not
  // started when it elapses are reported as timeouts without an attempt.
  [[nodiscard]] auto execute_batch(
      std::span<const Task> tasks, std::size_t concurrency_limit,
      std::optional<std::chrono::milliseconds> batch_timeout = std::nullopt)
      -> BatchResult;

  [[nodiscard]] auto metrics() const -> CoordinatorMetrics;
  [[nodiscard]] auto status() const -> CoordinatorStatus;
  [[nodiscard]] auto logs(std::string_view agent, std::size_t limit = 0) const
      -> std::vector<ExecutionResult>;

  [[nodiscard]] auto config() const noexcept -> const ExecutionConfig& {
    return config_;
  }

private:
  using Deadline = std::optional<std::chrono::steady_clock::time_point>;

  [[nodiscard]] auto execute(const Task& task, Deadline batch_deadline)
      -> ExecutionResult;
  [[nodiscard]] auto validate(const Task& task) const
      -> std::optional<std::string>;
  [[nodiscard]] auto prepare_context(const Task& task, ExecutionResult& result)
      -> std::optional<std::string>;
  auto invoke(const Task& task, std::string context,
              std::chrono::milliseconds timeout, ExecutionResult& result)
      -> void;
  auto write_output(const Task& task, ExecutionResult& result) -> void;
  auto finish(ExecutionResult& result,
              std::chrono::steady_clock::time_point started) -> void;

  [[nodiscard]] auto format_output(OutputFormat format,
                                   const std::string& output) -> std::string;

  IAgentRuntime& runtime_;
  SecurityGate& gate_;
  ResourceCache* cache_;
  BoundedHistory& history_;
  ExecutionConfig config_;
  ContextLoader loader_;
  AdmissionGate admission_;

  std::atomic<std::size_t> active_{0};

  mutable std::mutex metrics_mu_;
  std::size_t total_{0};
  std::size_t successful_{0};
  std::size_t failed_{0};
  std::chrono::milliseconds total_duration_{0};
  std::uint64_t total_tokens_{0};
  struct AgentTotals {
    std::size_t runs{0};
    std::size_t successes{0};
    std::chrono::milliseconds duration{0};
    std::uint64_t tokens{0};
  };
  std::map<std::string, AgentTotals, std::less<>> agents_;
};

// "dir/report.md" + "code-reviewer" -> "dir/code-reviewer_report.md"
[[nodiscard]] auto isolated_output_path(std::string_view output_path,
                                        std::string_view name) -> std::string;

[[nodiscard]] auto format_batch_summary(const BatchResult& batch)
    -> std::string;

}  // namespace agency

#pragma once

#include "agency/cache/lru_store.hpp"
#include "agency/cache/sweeper.hpp"
#include "agency/config/system_config.hpp"
#include "agency/executor/task.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace agency {

struct AgentHistoryStats {
  std::size_t runs{0};
  std::size_t successes{0};
  double success_rate{0.0};
  double average_duration_ms{0.0};
};

struct HistoryMetrics {
  std::size_t entries{0};
  std::size_t bytes{0};
  std::size_t max_entries{0};
  std::size_t max_bytes{0};
  double pressure{0.0};
  std::size_t evictions{0};
  std::size_t expirations{0};
  std::size_t pressure_evictions{0};
};

struct HistorySweep {
  std::size_t expired{0};
  std::size_t pressure_evicted{0};
};

// Capped window of ExecutionResults keyed by execution id. Entry count and
// total size never exceed the configured ceilings; least-recently-used
// entries go first. Internally synchronized.
class BoundedHistory {
public:
  explicit BoundedHistory(HistoryConfig config);
  ~BoundedHistory();

  BoundedHistory(const BoundedHistory&) = delete;
  BoundedHistory& operator=(const BoundedHistory&) = delete;

  auto start() -> void;
  auto stop() -> void;

  auto record(const ExecutionResult& result) -> void;
  [[nodiscard]] auto get(const ExecutionId& id) -> std::optional<ExecutionResult>;

  // Newest first. limit 0 means all.
  [[nodiscard]] auto recent(std::size_t limit = 0) const
      -> std::vector<ExecutionResult>;
  [[nodiscard]] auto by_agent(std::string_view agent, std::size_t limit = 0) const
      -> std::vector<ExecutionResult>;
  [[nodiscard]] auto agent_stats(std::string_view agent) const
      -> AgentHistoryStats;

  // TTL purge, then drops the oldest `pressure_evict_fraction` of entries
  // if pressure exceeds `pressure_threshold`.
  auto sweep() -> HistorySweep;

  // bytes() / max_bytes
  [[nodiscard]] auto pressure() const -> double;
  [[nodiscard]] auto is_within_limits() const -> bool;
  [[nodiscard]] auto metrics() const -> HistoryMetrics;
  [[nodiscard]] auto size() const -> std::size_t;
  auto clear() -> void;

  [[nodiscard]] static auto entry_size(const ExecutionResult& result)
      -> std::size_t;

private:
  [[nodiscard]] auto pressure_locked() const -> double;

  HistoryConfig config_;
  mutable std::mutex mu_;
  LruStore<ExecutionId, ExecutionResult> store_;
  std::size_t pressure_evictions_{0};
  PeriodicSweeper sweeper_;
};

}  // namespace agency

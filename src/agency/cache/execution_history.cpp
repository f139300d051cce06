#include "agency/cache/execution_history.hpp"

#include "agency/util/json.hpp"
#include "agency/util/log.hpp"

#include <algorithm>
#include <cmath>

namespace agency {

namespace {

auto newest_first(std::vector<ExecutionResult>& results, std::size_t limit)
    -> void {
  std::ranges::sort(results, std::ranges::greater{},
                    &ExecutionResult::timestamp);
  if (limit != 0 && results.size() > limit) {
    results.resize(limit);
  }
}

}  // namespace

BoundedHistory::BoundedHistory(HistoryConfig config)
    : config_(std::move(config)),
      store_({.max_entries = config_.max_entries,
              .max_bytes = config_.max_bytes,
              .default_ttl = std::nullopt}) {}

BoundedHistory::~BoundedHistory() {
  stop();
}

auto BoundedHistory::start() -> void {
  sweeper_.start(config_.sweep_interval, [this] {
    auto swept = sweep();
    if (swept.expired + swept.pressure_evicted > 0) {
      log::debug("History sweep: {} expired, {} evicted under pressure",
                 swept.expired, swept.pressure_evicted);
    }
  });
}

auto BoundedHistory::stop() -> void {
  sweeper_.stop();
}

auto BoundedHistory::entry_size(const ExecutionResult& result) -> std::size_t {
  nlohmann::json j = result;
  return dump_json(j).size() + result.execution_id.str().size() * 2 + 64;
}

auto BoundedHistory::record(const ExecutionResult& result) -> void {
  auto size = entry_size(result);
  std::optional<LruStore<ExecutionId, ExecutionResult>::Clock::duration> ttl;
  if (config_.ttl > std::chrono::milliseconds::zero()) {
    ttl = config_.ttl;
  }

  std::lock_guard lock(mu_);
  if (!store_.put(result.execution_id, result, size, ttl)) {
    log::warn("Execution {} ({} bytes) exceeds the history ceiling",
              result.execution_id, size);
  }
}

auto BoundedHistory::get(const ExecutionId& id)
    -> std::optional<ExecutionResult> {
  std::lock_guard lock(mu_);
  if (auto* r = store_.get(id)) {
    return *r;
  }
  return std::nullopt;
}

auto BoundedHistory::recent(std::size_t limit) const
    -> std::vector<ExecutionResult> {
  std::vector<ExecutionResult> out;
  {
    std::lock_guard lock(mu_);
    out.reserve(store_.size());
    store_.for_each([&](const auto& entry) { out.push_back(entry.value); });
  }
  newest_first(out, limit);
  return out;
}

auto BoundedHistory::by_agent(std::string_view agent, std::size_t limit) const
    -> std::vector<ExecutionResult> {
  std::vector<ExecutionResult> out;
  {
    std::lock_guard lock(mu_);
    store_.for_each([&](const auto& entry) {
      if (entry.value.agent_name == agent) {
        out.push_back(entry.value);
      }
    });
  }
  newest_first(out, limit);
  return out;
}

auto BoundedHistory::agent_stats(std::string_view agent) const
    -> AgentHistoryStats {
  AgentHistoryStats stats;
  double total_ms = 0.0;
  std::lock_guard lock(mu_);
  store_.for_each([&](const auto& entry) {
    const auto& r = entry.value;
    if (r.agent_name != agent) {
      return;
    }
    ++stats.runs;
    if (r.success) {
      ++stats.successes;
    }
    total_ms += static_cast<double>(r.metrics.duration.count());
  });
  if (stats.runs > 0) {
    stats.success_rate =
        static_cast<double>(stats.successes) / static_cast<double>(stats.runs);
    stats.average_duration_ms = total_ms / static_cast<double>(stats.runs);
  }
  return stats;
}

auto BoundedHistory::sweep() -> HistorySweep {
  HistorySweep swept;
  std::lock_guard lock(mu_);
  swept.expired = store_.purge_expired();

  if (pressure_locked() > config_.pressure_threshold && !store_.empty()) {
    auto fraction = std::clamp(config_.pressure_evict_fraction, 0.0, 1.0);
    auto count = static_cast<std::size_t>(
        std::ceil(static_cast<double>(store_.size()) * fraction));
    swept.pressure_evicted = store_.evict_oldest(count);
    pressure_evictions_ += swept.pressure_evicted;
    log::info("History pressure above {:.0f}%, evicted {} oldest entries",
              config_.pressure_threshold * 100.0, swept.pressure_evicted);
  }
  return swept;
}

auto BoundedHistory::pressure() const -> double {
  std::lock_guard lock(mu_);
  return pressure_locked();
}

auto BoundedHistory::pressure_locked() const -> double {
  if (config_.max_bytes == 0) {
    return 0.0;
  }
  return static_cast<double>(store_.bytes()) /
         static_cast<double>(config_.max_bytes);
}

auto BoundedHistory::is_within_limits() const -> bool {
  return pressure() < 0.9;
}

auto BoundedHistory::metrics() const -> HistoryMetrics {
  std::lock_guard lock(mu_);
  return HistoryMetrics{
      .entries = store_.size(),
      .bytes = store_.bytes(),
      .max_entries = config_.max_entries,
      .max_bytes = config_.max_bytes,
      .pressure = pressure_locked(),
      .evictions = store_.evictions(),
      .expirations = store_.expirations(),
      .pressure_evictions = pressure_evictions_,
  };
}

auto BoundedHistory::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return store_.size();
}

auto BoundedHistory::clear() -> void {
  std::lock_guard lock(mu_);
  store_.clear();
}

}  // namespace agency

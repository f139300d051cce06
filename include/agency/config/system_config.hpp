#pragma once

#include "agency/recipe/trigger_rule.hpp"
#include "agency/security/security_policy.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace agency {

struct LoggingConfig {
  std::string level{"info"};
};

struct ExecutionConfig {
  std::size_t max_concurrency{3};
  std::chrono::milliseconds default_timeout{300'000};
  std::chrono::milliseconds max_timeout{600'000};
  std::size_t max_context_files{10};
  // Empty accepts any agent name.
  std::vector<std::string> agents;
  TriggerRule dependency_policy{TriggerRule::AllDone};
};

struct RuntimeConfig {
  // Run through /bin/sh -c; "{agent}" is replaced by the agent name.
  std::string command{"claude -p"};
  std::string working_dir;
  std::map<std::string, std::string> env;
  std::size_t max_output_bytes{10 * 1024 * 1024};
};

struct CacheConfig {
  bool enabled{true};
  std::size_t max_entries{1000};
  std::size_t memory_max_bytes{50 * 1024 * 1024};
  std::size_t persistent_max_bytes{200 * 1024 * 1024};
  std::chrono::milliseconds ttl{std::chrono::minutes{60}};
  // ":memory:" keeps the persisted tier in-process; empty disables it.
  std::string db_file{".agency/cache.db"};
  std::chrono::milliseconds sweep_interval{std::chrono::minutes{10}};
};

struct HistoryConfig {
  std::size_t max_entries{1000};
  std::size_t max_bytes{100 * 1024 * 1024};
  std::chrono::milliseconds ttl{std::chrono::minutes{60}};
  double pressure_threshold{0.8};
  double pressure_evict_fraction{0.25};
  std::chrono::milliseconds sweep_interval{std::chrono::minutes{10}};
};

struct SystemConfig {
  LoggingConfig logging;
  ExecutionConfig execution;
  RuntimeConfig runtime;
  CacheConfig cache;
  HistoryConfig history;
  SecurityPolicy security;
};

}  // namespace agency

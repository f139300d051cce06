#pragma once

#include "agency/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agency {

using VariableMap = std::map<std::string, nlohmann::json, std::less<>>;

enum class OutputFormat : std::uint8_t { Text, Json, Markdown };

[[nodiscard]] auto to_string_view(OutputFormat format) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_output_format(std::string_view s) noexcept
    -> std::optional<OutputFormat>;

enum class FailureKind : std::uint8_t {
  None,
  Validation,         // rejected before any attempt
  SecurityViolation,  // a path or content was refused by the gate
  Timeout,            // forcibly terminated
  Runtime,            // the agent runtime reported failure
  Io,                 // context read or output write failed
  UpstreamFailed,     // skipped because a required dependency failed
};

[[nodiscard]] auto to_string_view(FailureKind kind) noexcept
    -> std::string_view;

// One unit of work for the agent runtime. Treated as immutable once submitted.
struct Task {
  std::string agent_name;
  std::string description;
  std::optional<std::string> context_path;
  std::vector<std::string> extra_context_paths;
  std::optional<std::string> output_path;
  std::optional<std::chrono::milliseconds> timeout;
  VariableMap variables;
  OutputFormat format{OutputFormat::Text};
};

struct ResultMetrics {
  std::chrono::milliseconds duration{0};
  std::optional<std::uint64_t> tokens_used;
  std::size_t context_size_bytes{0};
};

struct ExecutionResult {
  ExecutionId execution_id;
  std::string agent_name;
  bool success{false};
  std::optional<std::string> output;
  std::optional<std::string> error;
  FailureKind failure{FailureKind::None};
  bool attempted{false};
  bool context_from_cache{false};
  ResultMetrics metrics;
  std::chrono::system_clock::time_point timestamp;
};

void to_json(nlohmann::json& j, const ExecutionResult& r);

}  // namespace agency

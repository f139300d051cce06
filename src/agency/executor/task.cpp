#include "agency/executor/task.hpp"

#include "agency/util/util.hpp"

#include <array>
#include <utility>

namespace agency {

namespace {

constexpr std::array kOutputFormatNames = {"text", "json", "markdown"};
constexpr std::array kFailureKindNames = {
    "none",    "validation_error", "security_violation", "timeout",
    "runtime_error", "io_error",   "upstream_failed"};

}  // namespace

auto to_string_view(OutputFormat format) noexcept -> std::string_view {
  auto idx = std::to_underlying(format);
  return idx < kOutputFormatNames.size() ? kOutputFormatNames[idx] : "text";
}

auto parse_output_format(std::string_view s) noexcept
    -> std::optional<OutputFormat> {
  if (s == "text" || s == "txt") return OutputFormat::Text;
  if (s == "json") return OutputFormat::Json;
  if (s == "markdown" || s == "md") return OutputFormat::Markdown;
  return std::nullopt;
}

auto to_string_view(FailureKind kind) noexcept -> std::string_view {
  auto idx = std::to_underlying(kind);
  return idx < kFailureKindNames.size() ? kFailureKindNames[idx] : "unknown";
}

void to_json(nlohmann::json& j, const ExecutionResult& r) {
  j = nlohmann::json{
      {"execution_id", r.execution_id.str()},
      {"agent", r.agent_name},
      {"success", r.success},
      {"failure", to_string_view(r.failure)},
      {"attempted", r.attempted},
      {"timestamp", format_timestamp(r.timestamp)},
      {"metrics",
       {{"duration_ms", r.metrics.duration.count()},
        {"context_size_bytes", r.metrics.context_size_bytes}}},
  };
  if (r.output) {
    j["output"] = *r.output;
  }
  if (r.error) {
    j["error"] = *r.error;
  }
  if (r.metrics.tokens_used) {
    j["metrics"]["tokens_used"] = *r.metrics.tokens_used;
  }
}

}  // namespace agency

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agency::cli {

struct GlobalOptions {
  std::string config_file;
  std::string log_level;
};

using VariableArgs = std::vector<std::pair<std::string, std::string>>;

struct RunOptions {
  GlobalOptions global;
  std::string agent;
  std::string task;
  std::string context_path;
  std::string output_path;
  std::optional<std::int64_t> timeout_ms;
  std::string format{"text"};
  VariableArgs variables;
};

struct BatchOptions {
  GlobalOptions global;
  std::vector<std::string> agents;
  std::string task;
  std::string context_path;
  std::string output_path;
  std::optional<std::size_t> parallel;
  std::optional<std::int64_t> timeout_ms;
  VariableArgs variables;
};

struct RecipeOptions {
  GlobalOptions global;
  std::string recipe_file;
  std::string context_path;
  std::string output_path;
  std::optional<std::size_t> parallel;
  VariableArgs variables;
};

struct ValidateOptions {
  GlobalOptions global;
  std::string recipe_file;
  VariableArgs variables;
};

[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_batch(const BatchOptions& opts) -> int;
[[nodiscard]] auto cmd_recipe(const RecipeOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace agency::cli

#pragma once

#include "agency/app/application.hpp"
#include "agency/cli/commands.hpp"
#include "agency/executor/task.hpp"

#include <memory>

namespace agency::cli {

// Loads the configuration, applies the log level and starts the logger.
// Null after printing the error when the configuration cannot be loaded.
[[nodiscard]] auto open_application(const GlobalOptions& global)
    -> std::unique_ptr<Application>;

auto close_application(std::unique_ptr<Application> app) -> void;

[[nodiscard]] auto to_variable_map(const VariableArgs& args) -> VariableMap;

}  // namespace agency::cli

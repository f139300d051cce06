#include "common.hpp"

#include "agency/recipe/variables.hpp"
#include "agency/util/log.hpp"

#include <print>

namespace agency::cli {

auto open_application(const GlobalOptions& global)
    -> std::unique_ptr<Application> {
  auto config = Application::load_config(global.config_file);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
    return nullptr;
  }
  log::set_level(global.log_level.empty() ? config->logging.level
                                          : global.log_level);
  log::start();

  auto app = std::make_unique<Application>(std::move(*config));
  app->start();
  return app;
}

auto close_application(std::unique_ptr<Application> app) -> void {
  if (app) {
    app->stop();
  }
  app.reset();
  log::stop();
}

auto to_variable_map(const VariableArgs& args) -> VariableMap {
  VariableMap vars;
  for (const auto& [name, raw] : args) {
    vars.insert_or_assign(name, parse_variable_value(raw));
  }
  return vars;
}

}  // namespace agency::cli

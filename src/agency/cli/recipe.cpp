#include "agency/cli/commands.hpp"
#include "agency/recipe/recipe_loader.hpp"
#include "agency/scheduler/recipe_scheduler.hpp"
#include "common.hpp"

#include <format>
#include <print>

namespace agency::cli {

auto cmd_recipe(const RecipeOptions& opts) -> int {
  auto app = open_application(opts.global);
  if (!app) {
    return 1;
  }

  auto recipe = RecipeLoader::load_from_file(opts.recipe_file);
  if (!recipe) {
    close_application(std::move(app));
    std::println(stderr, "Error: Failed to load recipe {}: {}",
                 opts.recipe_file, recipe.error().message());
    return 1;
  }

  RecipeRunOptions run;
  run.variables = to_variable_map(opts.variables);
  run.concurrency = opts.parallel;
  if (!opts.context_path.empty()) {
    run.context_path = opts.context_path;
  }
  if (!opts.output_path.empty()) {
    run.output_path = opts.output_path;
  }

  auto result = app->scheduler().run(*recipe, run);
  close_application(std::move(app));

  std::println("{}", result.summary);
  if (!result.cycle.empty()) {
    std::string path;
    for (const auto& id : result.cycle) {
      path += path.empty() ? id.str() : std::format(" -> {}", id);
    }
    std::println(stderr, "Cycle: {}", path);
  }
  return result.success ? 0 : 1;
}

}  // namespace agency::cli

#include "agency/cli/commands.hpp"
#include "agency/recipe/recipe_loader.hpp"
#include "agency/scheduler/recipe_scheduler.hpp"
#include "common.hpp"

#include <print>

namespace agency::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto app = open_application(opts.global);
  if (!app) {
    return 1;
  }

  auto recipe = RecipeLoader::load_from_file(opts.recipe_file);
  if (!recipe) {
    close_application(std::move(app));
    std::println("✗ {} - {}", opts.recipe_file, recipe.error().message());
    return 1;
  }

  auto v = app->scheduler().validate(*recipe, to_variable_map(opts.variables));
  close_application(std::move(app));

  for (const auto& warning : v.warnings) {
    std::println("! {}", warning);
  }
  if (!v.valid) {
    std::println("✗ {} - {} error(s)", recipe->name, v.errors.size());
    for (const auto& err : v.errors) {
      std::println("  - {}", err);
    }
    return 1;
  }

  std::println("✓ {} - Valid ({} steps, {} batches)", recipe->name,
               recipe->steps.size(), v.plan->batches.size());
  std::print("{}", format_plan(*v.plan, recipe->steps));
  return 0;
}

}  // namespace agency::cli

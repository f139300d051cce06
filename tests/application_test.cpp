#include "agency/app/application.hpp"

#include "agency/cache/execution_history.hpp"
#include "agency/cache/resource_cache.hpp"
#include "agency/executor/agent_runtime.hpp"
#include "agency/executor/coordinator.hpp"
#include "agency/scheduler/recipe_scheduler.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agency;

class ApplicationTest : public ::testing::Test {
protected:
  auto make_config() -> SystemConfig {
    SystemConfig config;
    config.security.allowed_base_paths = {dir_.str()};
    config.cache.db_file = ":memory:";
    config.execution.max_concurrency = 2;
    return config;
  }

  test::TempDir dir_{"agency_app"};
};

TEST_F(ApplicationTest, EmptyConfigPathUsesDefaults) {
  auto config = Application::load_config("");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->execution.max_concurrency, 3);
}

TEST_F(ApplicationTest, MissingConfigFileFails) {
  auto config = Application::load_config((dir_.path() / "absent.yaml").string());
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), make_error_code(Error::FileNotFound));
}

TEST_F(ApplicationTest, WiresComponentsEndToEnd) {
  Application app(make_config(),
                  create_function_agent_runtime(test::succeed_with("done")));
  app.start();
  EXPECT_TRUE(app.is_running());
  ASSERT_NE(app.cache(), nullptr);

  auto context = dir_.write("notes.md", "context body");
  Task task;
  task.agent_name = "architect";
  task.description = "Design it";
  task.context_path = context.string();
  task.output_path = (dir_.path() / "design.md").string();

  auto first = app.coordinator().execute_single(task);
  ASSERT_TRUE(first.success) << first.error.value_or("");
  EXPECT_FALSE(first.context_from_cache);
  EXPECT_EQ(test::read_file(dir_.path() / "design.md"), "done");

  auto second = app.coordinator().execute_single(task);
  EXPECT_TRUE(second.context_from_cache);
  EXPECT_EQ(app.history().size(), 2);

  Recipe recipe;
  recipe.name = "wired";
  recipe.steps = {test::make_step("a"), test::make_step("b", {"a"})};
  auto result = app.scheduler().run(recipe);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(app.coordinator().metrics().total_executions, 4);

  app.stop();
  EXPECT_FALSE(app.is_running());
}

TEST_F(ApplicationTest, DisabledCacheHasNoCache) {
  auto config = make_config();
  config.cache.enabled = false;
  Application app(std::move(config),
                  create_function_agent_runtime(test::succeed_with("ok")));
  app.start();
  EXPECT_EQ(app.cache(), nullptr);
  app.stop();
}

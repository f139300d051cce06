#include "agency/config/config.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agency;
using namespace std::chrono_literals;

TEST(ConfigTest, SystemConfigDefaults) {
  SystemConfig config;

  EXPECT_EQ(config.logging.level, "info");
  EXPECT_EQ(config.execution.max_concurrency, 3);
  EXPECT_EQ(config.execution.default_timeout, 300'000ms);
  EXPECT_EQ(config.execution.max_timeout, 600'000ms);
  EXPECT_EQ(config.execution.max_context_files, 10);
  EXPECT_TRUE(config.execution.agents.empty());
  EXPECT_EQ(config.execution.dependency_policy, TriggerRule::AllDone);
  EXPECT_EQ(config.runtime.command, "claude -p");
  EXPECT_TRUE(config.cache.enabled);
  EXPECT_EQ(config.cache.ttl, std::chrono::minutes(60));
  EXPECT_EQ(config.history.max_entries, 1000);
  EXPECT_DOUBLE_EQ(config.history.pressure_threshold, 0.8);
  EXPECT_FALSE(config.security.allow_symlinks);
  EXPECT_EQ(config.security.max_depth, 10);
  EXPECT_TRUE(ConfigLoader::validate(config).empty());
}

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->execution.max_concurrency, 3);
  EXPECT_EQ(result->runtime.command, "claude -p");
}

TEST(ConfigTest, LoadFromString) {
  auto yaml = R"(
logging:
  level: debug
execution:
  max_concurrency: 8
  default_timeout_ms: 5000
  max_timeout_ms: 60000
  max_context_files: 4
  agents: [code-reviewer, writer]
  dependency_policy: all_success
runtime:
  command: "my-agent --name {agent}"
  working_dir: /srv/agents
  env:
    MODEL: fast
  max_output_bytes: 4096
cache:
  enabled: false
  max_entries: 50
  ttl_ms: 1000
  db_file: ":memory:"
  sweep_interval_ms: 250
history:
  max_entries: 20
  max_bytes: 65536
  pressure_threshold: 0.5
  pressure_evict_fraction: 0.5
security:
  allowed_base_paths: [/srv/work]
  allowed_extensions: [.md]
  max_file_size: 1024
  allow_symlinks: true
)";
  auto result = ConfigLoader::load_from_string(yaml);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  const auto& c = *result;

  EXPECT_EQ(c.logging.level, "debug");
  EXPECT_EQ(c.execution.max_concurrency, 8);
  EXPECT_EQ(c.execution.default_timeout, 5000ms);
  EXPECT_EQ(c.execution.max_timeout, 60000ms);
  EXPECT_EQ(c.execution.max_context_files, 4);
  EXPECT_EQ(c.execution.agents,
            (std::vector<std::string>{"code-reviewer", "writer"}));
  EXPECT_EQ(c.execution.dependency_policy, TriggerRule::AllSuccess);

  EXPECT_EQ(c.runtime.command, "my-agent --name {agent}");
  EXPECT_EQ(c.runtime.working_dir, "/srv/agents");
  EXPECT_EQ(c.runtime.env.at("MODEL"), "fast");
  EXPECT_EQ(c.runtime.max_output_bytes, 4096);

  EXPECT_FALSE(c.cache.enabled);
  EXPECT_EQ(c.cache.max_entries, 50);
  EXPECT_EQ(c.cache.ttl, 1000ms);
  EXPECT_EQ(c.cache.db_file, ":memory:");
  EXPECT_EQ(c.cache.sweep_interval, 250ms);

  EXPECT_EQ(c.history.max_entries, 20);
  EXPECT_EQ(c.history.max_bytes, 65536);
  EXPECT_DOUBLE_EQ(c.history.pressure_threshold, 0.5);

  EXPECT_EQ(c.security.allowed_base_paths,
            std::vector<std::string>{"/srv/work"});
  EXPECT_EQ(c.security.allowed_extensions, std::vector<std::string>{".md"});
  EXPECT_EQ(c.security.max_file_size, 1024);
  EXPECT_TRUE(c.security.allow_symlinks);
  // Unset keys keep their defaults.
  EXPECT_EQ(c.security.max_depth, 10);
  EXPECT_FALSE(c.security.restricted_paths.empty());
}

TEST(ConfigTest, PartialSectionKeepsDefaults) {
  auto result = ConfigLoader::load_from_string("execution:\n  max_concurrency: 1\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->execution.max_concurrency, 1);
  EXPECT_EQ(result->execution.default_timeout, 300'000ms);
  EXPECT_TRUE(result->cache.enabled);
}

TEST(ConfigTest, ZeroConcurrencyIsRejected) {
  auto result = ConfigLoader::load_from_string("execution:\n  max_concurrency: 0\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ValidationError));
}

TEST(ConfigTest, DefaultTimeoutAboveMaxIsRejected) {
  auto result = ConfigLoader::load_from_string(R"(
execution:
  default_timeout_ms: 10000
  max_timeout_ms: 5000
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ValidationError));
}

TEST(ConfigTest, ValidateCollectsAllErrors) {
  SystemConfig config;
  config.execution.max_concurrency = 0;
  config.history.pressure_threshold = 1.5;
  config.runtime.command.clear();

  auto errors = ConfigLoader::validate(config);
  ASSERT_EQ(errors.size(), 3);
  EXPECT_EQ(errors[0], "execution.max_concurrency must be at least 1");
  EXPECT_EQ(errors[1], "history.pressure_threshold must be in (0, 1]");
  EXPECT_EQ(errors[2], "runtime.command cannot be empty");
}

TEST(ConfigTest, UnknownDependencyPolicyFailsToLoad) {
  auto result =
      ConfigLoader::load_from_string("execution:\n  dependency_policy: sometimes\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, MalformedYamlIsParseError) {
  auto result = ConfigLoader::load_from_string("execution: [1, 2");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromFile) {
  test::TempDir dir("agency_config");
  auto path = dir.write("agency.yaml", "logging:\n  level: warn\n");

  auto result = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->logging.level, "warn");

  auto missing = ConfigLoader::load_from_file((dir.path() / "nope.yaml").string());
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileNotFound));
}

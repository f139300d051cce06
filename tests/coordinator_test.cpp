#include "agency/executor/coordinator.hpp"

#include "agency/cache/execution_history.hpp"
#include "agency/cache/resource_cache.hpp"
#include "agency/executor/agent_runtime.hpp"
#include "agency/security/security_gate.hpp"

#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agency;
using namespace std::chrono_literals;

class CoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    SecurityPolicy policy;
    policy.allowed_base_paths = {dir_.str()};
    gate_ = std::make_unique<SecurityGate>(policy);

    CacheConfig cache_config;
    cache_config.db_file = ":memory:";
    cache_config.sweep_interval = 0ms;
    cache_ = std::make_unique<ResourceCache>(cache_config);
    cache_->start();

    HistoryConfig history_config;
    history_config.sweep_interval = 0ms;
    history_ = std::make_unique<BoundedHistory>(history_config);
  }

  auto make_coordinator(AgentFunction fn, ExecutionConfig config = {})
      -> TaskCoordinator& {
    recorder_ = std::make_unique<test::RecordingRuntime>(std::move(fn));
    coordinator_ = std::make_unique<TaskCoordinator>(
        recorder_->runtime(), *gate_, cache_.get(), *history_, std::move(config));
    return *coordinator_;
  }

  static auto task(std::string agent, std::string description = "do the work")
      -> Task {
    Task t;
    t.agent_name = std::move(agent);
    t.description = std::move(description);
    return t;
  }

  auto inside(std::string_view relative) const -> std::string {
    return (dir_.path() / relative).string();
  }

  // Sleeps `duration` unless cancelled; tracks concurrency in probe_.
  auto sleeping_agent(std::chrono::milliseconds duration) -> AgentFunction {
    return [this, duration](const AgentRequest& req, CancellationToken token) {
      probe_.enter();
      bool finished = token.sleep_for(duration);
      probe_.leave();
      return AgentResponse{.success = finished,
                           .output = std::format("{} finished", req.agent_name),
                           .error = finished ? std::nullopt
                                             : std::optional<std::string>{"cancelled"},
                           .tokens_used = 5};
    };
  }

  test::TempDir dir_{"agency_coord"};
  test::ConcurrencyProbe probe_;
  std::unique_ptr<SecurityGate> gate_;
  std::unique_ptr<ResourceCache> cache_;
  std::unique_ptr<BoundedHistory> history_;
  std::unique_ptr<test::RecordingRuntime> recorder_;
  std::unique_ptr<TaskCoordinator> coordinator_;
};

TEST_F(CoordinatorTest, ExecuteSingleSuccess) {
  auto& coordinator = make_coordinator(test::succeed_with("all good"));

  auto r = coordinator.execute_single(task("reviewer"));
  EXPECT_TRUE(r.success);
  EXPECT_TRUE(r.attempted);
  EXPECT_EQ(r.failure, FailureKind::None);
  EXPECT_EQ(r.agent_name, "reviewer");
  EXPECT_EQ(r.output, "all good");
  EXPECT_FALSE(r.error.has_value());
  EXPECT_TRUE(r.execution_id.value().starts_with("exec_"));

  EXPECT_TRUE(history_->get(r.execution_id).has_value());
  auto requests = recorder_->requests();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].task, "do the work");
  EXPECT_EQ(requests[0].timeout, coordinator.config().default_timeout);
}

TEST_F(CoordinatorTest, VariablesRenderIntoTaskAndContext) {
  auto& coordinator = make_coordinator(test::succeed_with("ok"));
  auto t = task("writer", "Write about {{ topic }} in {{count}} words");
  t.variables["topic"] = "caching";
  t.variables["count"] = 300;

  auto r = coordinator.execute_single(t);
  ASSERT_TRUE(r.success);
  auto req = recorder_->requests().at(0);
  EXPECT_EQ(req.task, "Write about caching in 300 words");
  EXPECT_NE(req.context.find("## Variables"), std::string::npos);
  EXPECT_NE(req.context.find("\"topic\": \"caching\""), std::string::npos);
}

TEST_F(CoordinatorTest, ValidationFailuresAreNeverAttempted) {
  ExecutionConfig config;
  config.agents = {"reviewer"};
  config.max_timeout = 1000ms;
  auto& coordinator = make_coordinator(test::succeed_with("ok"), config);

  auto empty_agent = coordinator.execute_single(task(""));
  EXPECT_EQ(empty_agent.failure, FailureKind::Validation);
  EXPECT_FALSE(empty_agent.attempted);
  EXPECT_EQ(empty_agent.error, "validation_error: agent name is empty");

  auto unknown = coordinator.execute_single(task("ghost"));
  EXPECT_EQ(unknown.failure, FailureKind::Validation);
  EXPECT_EQ(unknown.error, "validation_error: unknown agent 'ghost'");

  auto empty_task = coordinator.execute_single(task("reviewer", ""));
  EXPECT_EQ(empty_task.failure, FailureKind::Validation);

  auto too_long = task("reviewer");
  too_long.timeout = 5000ms;
  EXPECT_EQ(coordinator.execute_single(too_long).failure,
            FailureKind::Validation);

  auto zero = task("reviewer");
  zero.timeout = 0ms;
  EXPECT_EQ(coordinator.execute_single(zero).failure, FailureKind::Validation);

  EXPECT_TRUE(recorder_->requests().empty());
  auto m = coordinator.metrics();
  EXPECT_EQ(m.total_executions, 5);
  EXPECT_EQ(m.failed, 5);
}

TEST_F(CoordinatorTest, TimeoutCancelsAndReleasesSlot) {
  ExecutionConfig config;
  config.max_concurrency = 1;
  auto& coordinator = make_coordinator(sleeping_agent(10s), config);

  auto slow = task("slow");
  slow.timeout = 100ms;
  auto started = std::chrono::steady_clock::now();
  auto r = coordinator.execute_single(slow);

  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.attempted);
  EXPECT_EQ(r.failure, FailureKind::Timeout);
  EXPECT_EQ(r.error, "timeout");
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);

  // The only slot is free again.
  auto next = task("slow");
  next.timeout = 100ms;
  EXPECT_EQ(coordinator.execute_single(next).error, "timeout");
  EXPECT_EQ(coordinator.status().active, 0);
}

TEST_F(CoordinatorTest, RuntimeFailureIsReported) {
  auto& coordinator = make_coordinator(
      [](const AgentRequest&, CancellationToken) {
        return AgentResponse{.success = false,
                             .output = std::nullopt,
                             .error = "agent exited with code 2: bad prompt",
                             .tokens_used = std::nullopt};
      });

  auto r = coordinator.execute_single(task("critic"));
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.attempted);
  EXPECT_EQ(r.failure, FailureKind::Runtime);
  EXPECT_EQ(r.error, "agent exited with code 2: bad prompt");
}

TEST_F(CoordinatorTest, BatchNeverExceedsAdmissionCapacity) {
  ExecutionConfig config;
  config.max_concurrency = 2;
  auto& coordinator = make_coordinator(sleeping_agent(50ms), config);

  std::vector<Task> tasks;
  for (int i = 0; i < 8; ++i) {
    tasks.push_back(task(std::format("agent-{}", i)));
  }

  auto batch = coordinator.execute_batch(tasks, 8);
  EXPECT_EQ(batch.total, 8);
  EXPECT_EQ(batch.successful, 8);
  EXPECT_LE(probe_.peak(), 2);
  EXPECT_GE(probe_.peak(), 1);
  EXPECT_LE(coordinator.metrics().peak_in_flight, 2);
}

TEST_F(CoordinatorTest, BatchLimitBelowCapacity) {
  ExecutionConfig config;
  config.max_concurrency = 4;
  auto& coordinator = make_coordinator(sleeping_agent(20ms), config);

  std::vector<Task> tasks(5, task("serial"));
  auto batch = coordinator.execute_batch(tasks, 1);
  EXPECT_EQ(batch.successful, 5);
  EXPECT_EQ(probe_.peak(), 1);
}

TEST_F(CoordinatorTest, BatchResultsKeepSubmissionOrder) {
  ExecutionConfig config;
  config.max_concurrency = 3;
  auto& coordinator = make_coordinator(
      [](const AgentRequest& req, CancellationToken token) {
        // First submitted finishes last.
        auto delay = req.agent_name == "first" ? 150ms : 10ms;
        (void)token.sleep_for(delay);
        return AgentResponse{.success = true,
                             .output = req.agent_name,
                             .error = std::nullopt,
                             .tokens_used = std::nullopt};
      },
      config);

  std::vector<Task> tasks{task("first"), task("second"), task("third")};
  auto batch = coordinator.execute_batch(tasks, 3);
  ASSERT_EQ(batch.results.size(), 3);
  EXPECT_EQ(batch.results[0].agent_name, "first");
  EXPECT_EQ(batch.results[1].agent_name, "second");
  EXPECT_EQ(batch.results[2].agent_name, "third");
  EXPECT_EQ(batch.results[0].output, "first");
}

TEST_F(CoordinatorTest, OneFailureDoesNotStopBatch) {
  auto& coordinator = make_coordinator(
      [](const AgentRequest& req, CancellationToken) {
        bool ok = req.agent_name != "bad";
        return AgentResponse{.success = ok,
                             .output = "out",
                             .error = ok ? std::nullopt
                                         : std::optional<std::string>{"nope"},
                             .tokens_used = std::nullopt};
      });

  std::vector<Task> tasks{task("good"), task("bad"), task("also-good")};
  auto batch = coordinator.execute_batch(tasks, 3);
  EXPECT_EQ(batch.successful, 2);
  EXPECT_EQ(batch.failed, 1);
  EXPECT_NE(batch.summary.find("## Batch Execution Summary"), std::string::npos);
  EXPECT_NE(batch.summary.find("- [failed] bad"), std::string::npos);
  EXPECT_NE(batch.summary.find("- [ok] good"), std::string::npos);
}

TEST_F(CoordinatorTest, BatchTimeoutReportsUnstartedTasks) {
  ExecutionConfig config;
  config.max_concurrency = 1;
  auto& coordinator = make_coordinator(
      [](const AgentRequest& req, CancellationToken) {
        if (req.agent_name == "holder") {
          test::sleep_ms(500ms);
        }
        return AgentResponse{.success = true,
                             .output = "done",
                             .error = std::nullopt,
                             .tokens_used = std::nullopt};
      },
      config);

  std::jthread holder([&] { (void)coordinator.execute_single(task("holder")); });
  while (coordinator.status().active == 0) {
    test::sleep_ms(5ms);
  }

  std::vector<Task> tasks{task("late-1"), task("late-2")};
  auto batch = coordinator.execute_batch(tasks, 2, 100ms);
  ASSERT_EQ(batch.results.size(), 2);
  for (const auto& r : batch.results) {
    EXPECT_FALSE(r.success);
    EXPECT_FALSE(r.attempted);
    EXPECT_EQ(r.failure, FailureKind::Timeout);
    EXPECT_EQ(r.error, "timeout");
  }
  EXPECT_EQ(batch.failed, 2);
}

TEST_F(CoordinatorTest, RejectedContextPathIsSecurityViolation) {
  auto& coordinator = make_coordinator(test::succeed_with("ok"));

  auto t = task("reader");
  t.context_path = "../../etc/passwd";
  auto r = coordinator.execute_single(t);
  EXPECT_EQ(r.failure, FailureKind::SecurityViolation);
  EXPECT_FALSE(r.attempted);
  EXPECT_TRUE(r.error->starts_with("security_violation"));
  EXPECT_TRUE(recorder_->requests().empty());
}

TEST_F(CoordinatorTest, RejectedOutputPathIsSecurityViolation) {
  auto& coordinator = make_coordinator(test::succeed_with("ok"));

  auto t = task("writer");
  t.output_path = "/opt/agency-elsewhere/out.md";
  auto r = coordinator.execute_single(t);
  EXPECT_EQ(r.failure, FailureKind::SecurityViolation);
  EXPECT_FALSE(r.attempted);
  EXPECT_TRUE(recorder_->requests().empty());
}

TEST_F(CoordinatorTest, MissingContextIsIoFailure) {
  auto& coordinator = make_coordinator(test::succeed_with("ok"));

  auto t = task("reader");
  t.context_path = inside("missing-dir");
  auto r = coordinator.execute_single(t);
  EXPECT_EQ(r.failure, FailureKind::Io);
  EXPECT_FALSE(r.attempted);
}

TEST_F(CoordinatorTest, ContextIsLoadedAndCached) {
  dir_.write("docs/guide.md", "Use tabs.");
  auto& coordinator = make_coordinator(test::succeed_with("ok"));

  auto t = task("reader");
  t.context_path = inside("docs");
  auto first = coordinator.execute_single(t);
  ASSERT_TRUE(first.success);
  EXPECT_FALSE(first.context_from_cache);
  EXPECT_GT(first.metrics.context_size_bytes, 0);

  auto second = coordinator.execute_single(t);
  ASSERT_TRUE(second.success);
  EXPECT_TRUE(second.context_from_cache);

  auto req = recorder_->requests().at(0);
  EXPECT_TRUE(req.context.starts_with("## Context\n### guide.md\n"));
  EXPECT_NE(req.context.find("Use tabs."), std::string::npos);
}

TEST_F(CoordinatorTest, WritesTextOutput) {
  auto& coordinator = make_coordinator(test::succeed_with("# Report\nfine"));

  auto t = task("writer");
  t.output_path = inside("out/report.md");
  auto r = coordinator.execute_single(t);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(test::read_file(dir_.path() / "out/report.md"), "# Report\nfine");
}

TEST_F(CoordinatorTest, JsonOutputIsSanitized) {
  auto& coordinator = make_coordinator(
      test::succeed_with(R"({"summary": "<script>x()</script>ok", "score": 3})"));

  auto t = task("analyst");
  t.output_path = inside("out/analysis.json");
  t.format = OutputFormat::Json;
  ASSERT_TRUE(coordinator.execute_single(t).success);

  auto written = nlohmann::json::parse(
      test::read_file(dir_.path() / "out/analysis.json"));
  EXPECT_EQ(written["summary"].get<std::string>(),
            std::format("{}ok", SecurityGate::kSanitizedPlaceholder));
  EXPECT_EQ(written["score"].get<int>(), 3);
}

TEST_F(CoordinatorTest, NonJsonOutputIsWrappedForJsonFormat) {
  auto& coordinator = make_coordinator(test::succeed_with("plain words"));

  auto t = task("analyst");
  t.output_path = inside("out/wrapped.json");
  t.format = OutputFormat::Json;
  ASSERT_TRUE(coordinator.execute_single(t).success);

  auto written =
      nlohmann::json::parse(test::read_file(dir_.path() / "out/wrapped.json"));
  EXPECT_EQ(written["output"].get<std::string>(), "plain words");
}

TEST_F(CoordinatorTest, InvalidUtf8OutputIsWrittenAndRecorded) {
  // Truncated two-byte sequence at the end.
  const std::string output = "r\xc3\xa9sum\xc3";
  auto& coordinator = make_coordinator(test::succeed_with(output));

  auto text = task("writer");
  text.output_path = inside("out/raw.md");
  auto r = coordinator.execute_single(text);
  ASSERT_TRUE(r.success) << r.error.value_or("");
  EXPECT_EQ(r.output, output);
  EXPECT_EQ(test::read_file(dir_.path() / "out/raw.md"), output);

  auto json = task("analyst");
  json.output_path = inside("out/raw.json");
  json.format = OutputFormat::Json;
  auto j = coordinator.execute_single(json);
  ASSERT_TRUE(j.success) << j.error.value_or("");
  auto written =
      nlohmann::json::parse(test::read_file(dir_.path() / "out/raw.json"));
  EXPECT_EQ(written["output"].get<std::string>(), "r\xc3\xa9sum\xef\xbf\xbd");

  EXPECT_EQ(history_->size(), 2);
  EXPECT_TRUE(history_->get(r.execution_id).has_value());
}

TEST_F(CoordinatorTest, Latin1ContextFileIsLoadedAndCached) {
  dir_.write("notes/cafe.md", "caf\xe9 notes");
  auto& coordinator = make_coordinator(test::succeed_with("ok"));

  auto t = task("reader");
  t.context_path = inside("notes/cafe.md");
  t.variables["owner"] = "Jos\xe9";
  auto first = coordinator.execute_single(t);
  ASSERT_TRUE(first.success) << first.error.value_or("");
  auto second = coordinator.execute_single(t);
  ASSERT_TRUE(second.success) << second.error.value_or("");
  EXPECT_TRUE(second.context_from_cache);

  auto req = recorder_->requests().at(0);
  EXPECT_NE(req.context.find("caf\xe9 notes"), std::string::npos);
}

TEST_F(CoordinatorTest, BatchSurvivesInvalidUtf8OutputAndContext) {
  dir_.write("notes/cafe.md", "caf\xe9 notes");
  auto& coordinator = make_coordinator(
      [](const AgentRequest& req, CancellationToken) {
        return AgentResponse{.success = true,
                             .output = req.agent_name + " \xff\xfe",
                             .error = std::nullopt,
                             .tokens_used = std::nullopt};
      });

  std::vector<Task> tasks{task("one"), task("two"), task("three")};
  tasks[0].context_path = inside("notes/cafe.md");
  tasks[1].output_path = inside("out/two.json");
  tasks[1].format = OutputFormat::Json;
  auto batch = coordinator.execute_batch(tasks, 3);
  EXPECT_EQ(batch.successful, 3);
  EXPECT_EQ(batch.failed, 0);
  ASSERT_EQ(batch.results.size(), 3);
  EXPECT_EQ(batch.results[2].output, "three \xff\xfe");
  EXPECT_TRUE(std::filesystem::exists(dir_.path() / "out/two.json"));
}

TEST_F(CoordinatorTest, MetricsStatusAndLogs) {
  auto& coordinator = make_coordinator(sleeping_agent(5ms));

  (void)coordinator.execute_single(task("a"));
  (void)coordinator.execute_single(task("a"));
  (void)coordinator.execute_single(task("b"));

  auto m = coordinator.metrics();
  EXPECT_EQ(m.total_executions, 3);
  EXPECT_EQ(m.successful, 3);
  EXPECT_EQ(m.total_tokens, 15);
  ASSERT_TRUE(m.agents.contains("a"));
  EXPECT_EQ(m.agents["a"].runs, 2);
  EXPECT_DOUBLE_EQ(m.agents["a"].success_rate, 1.0);
  EXPECT_EQ(m.agents["a"].tokens_used, 10);

  auto s = coordinator.status();
  EXPECT_EQ(s.completed, 3);
  EXPECT_EQ(s.failed, 0);
  EXPECT_EQ(s.active, 0);
  EXPECT_EQ(s.max_concurrency, 3);

  EXPECT_EQ(coordinator.logs("a").size(), 2);
  EXPECT_EQ(coordinator.logs("").size(), 3);
  EXPECT_EQ(coordinator.logs("", 1).size(), 1);
}

TEST(CoordinatorHelpersTest, IsolatedOutputPath) {
  EXPECT_EQ(isolated_output_path("out/report.md", "code-reviewer"),
            "out/code-reviewer_report.md");
  EXPECT_EQ(isolated_output_path("report.md", "writer#2"), "writer_2_report.md");
}

#include "agency/app/application.hpp"

#include "agency/cache/execution_history.hpp"
#include "agency/cache/resource_cache.hpp"
#include "agency/config/config.hpp"
#include "agency/executor/agent_runtime.hpp"
#include "agency/executor/coordinator.hpp"
#include "agency/scheduler/recipe_scheduler.hpp"
#include "agency/security/security_gate.hpp"
#include "agency/util/log.hpp"

namespace agency {

Application::Application(SystemConfig config)
    : Application(config, create_process_agent_runtime(config.runtime)) {}

Application::Application(SystemConfig config,
                         std::unique_ptr<IAgentRuntime> runtime)
    : config_(std::move(config)),
      gate_(std::make_unique<SecurityGate>(config_.security)),
      history_(std::make_unique<BoundedHistory>(config_.history)),
      runtime_(std::move(runtime)) {
  if (config_.cache.enabled) {
    cache_ = std::make_unique<ResourceCache>(config_.cache);
  }
  coordinator_ = std::make_unique<TaskCoordinator>(
      *runtime_, *gate_, cache_.get(), *history_, config_.execution);
  scheduler_ = std::make_unique<RecipeScheduler>(*coordinator_);
}

Application::~Application() {
  stop();
}

auto Application::load_config(std::string_view path) -> Result<SystemConfig> {
  if (path.empty()) {
    return ok(SystemConfig{});
  }
  return ConfigLoader::load_from_file(path);
}

auto Application::start() -> void {
  if (running_) {
    return;
  }
  if (cache_) {
    cache_->start();
  }
  history_->start();
  running_ = true;
  log::debug("Application started (max_concurrency={}, cache={})",
             config_.execution.max_concurrency,
             cache_ ? "enabled" : "disabled");
}

auto Application::stop() -> void {
  if (!running_) {
    return;
  }
  history_->stop();
  if (cache_) {
    cache_->stop();
  }
  running_ = false;
}

auto Application::gate() -> SecurityGate& {
  return *gate_;
}

auto Application::cache() -> ResourceCache* {
  return cache_.get();
}

auto Application::history() -> BoundedHistory& {
  return *history_;
}

auto Application::coordinator() -> TaskCoordinator& {
  return *coordinator_;
}

auto Application::scheduler() -> RecipeScheduler& {
  return *scheduler_;
}

}  // namespace agency

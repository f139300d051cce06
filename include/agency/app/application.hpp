#pragma once

#include "agency/config/system_config.hpp"
#include "agency/core/error.hpp"

#include <memory>
#include <string_view>

namespace agency {

class BoundedHistory;
class IAgentRuntime;
class RecipeScheduler;
class ResourceCache;
class SecurityGate;
class TaskCoordinator;

// Owns and wires the gate, cache, history, agent runtime, coordinator and
// scheduler for one process.
class Application {
public:
  explicit Application(SystemConfig config);
  Application(SystemConfig config, std::unique_ptr<IAgentRuntime> runtime);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Empty path means built-in defaults.
  [[nodiscard]] static auto load_config(std::string_view path)
      -> Result<SystemConfig>;

  // Opens the persisted cache tier and starts the sweepers.
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }
  [[nodiscard]] auto gate() -> SecurityGate&;
  // Null when caching is disabled.
  [[nodiscard]] auto cache() -> ResourceCache*;
  [[nodiscard]] auto history() -> BoundedHistory&;
  [[nodiscard]] auto coordinator() -> TaskCoordinator&;
  [[nodiscard]] auto scheduler() -> RecipeScheduler&;

private:
  SystemConfig config_;
  std::unique_ptr<SecurityGate> gate_;
  std::unique_ptr<ResourceCache> cache_;
  std::unique_ptr<BoundedHistory> history_;
  std::unique_ptr<IAgentRuntime> runtime_;
  std::unique_ptr<TaskCoordinator> coordinator_;
  std::unique_ptr<RecipeScheduler> scheduler_;
  bool running_{false};
};

}  // namespace agency

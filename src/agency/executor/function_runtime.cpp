#include "agency/executor/agent_runtime.hpp"

#include "agency/util/log.hpp"

#include <exception>
#include <format>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agency {

namespace {

class FunctionAgentRuntime : public IAgentRuntime {
public:
  explicit FunctionAgentRuntime(AgentFunction fn) : fn_(std::move(fn)) {}

  ~FunctionAgentRuntime() override {
    std::unordered_map<InvocationId, Worker> active;
    std::vector<std::jthread> finished;
    {
      std::lock_guard lock(mu_);
      for (auto& [id, worker] : active_) {
        worker.source.cancel();
      }
      active = std::move(active_);
      finished = std::move(finished_);
    }
    for (auto& [id, worker] : active) {
      if (worker.thread.joinable()) {
        worker.thread.join();
      }
    }
    for (auto& t : finished) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  auto start(AgentRequest request, AgentCallback on_complete) -> void override {
    std::vector<std::jthread> reaped;
    std::lock_guard lock(mu_);
    reaped.swap(finished_);

    auto id = request.invocation_id;
    if (active_.contains(id)) {
      on_complete(id, AgentResponse{.success = false,
                                    .output = std::nullopt,
                                    .error = "duplicate invocation id",
                                    .tokens_used = std::nullopt});
      return;
    }
    auto& worker = active_[id];
    auto token = worker.source.token();
    worker.thread = std::jthread(
        [this, id, token, request = std::move(request),
         on_complete = std::move(on_complete)]() mutable {
          AgentResponse response;
          try {
            response = fn_(request, token);
          } catch (const std::exception& e) {
            log::error("Agent {} raised: {}", request.agent_name, e.what());
            response.success = false;
            response.error = std::format("agent raised: {}", e.what());
          }
          on_complete(id, std::move(response));
          retire(id);
        });
    // `reaped` joins here, after the lock is released (declared first).
  }

  auto cancel(const InvocationId& id) -> void override {
    std::lock_guard lock(mu_);
    if (auto it = active_.find(id); it != active_.end()) {
      it->second.source.cancel();
      log::debug("Cancelled in-process invocation {}", id);
    }
  }

private:
  struct Worker {
    CancellationSource source;
    std::jthread thread;
  };

  // Called from the worker itself, so its thread is parked for a later join.
  auto retire(const InvocationId& id) -> void {
    std::lock_guard lock(mu_);
    if (auto it = active_.find(id); it != active_.end()) {
      finished_.push_back(std::move(it->second.thread));
      active_.erase(it);
    }
  }

  AgentFunction fn_;
  std::mutex mu_;
  std::unordered_map<InvocationId, Worker> active_;
  std::vector<std::jthread> finished_;
};

}  // namespace

auto create_function_agent_runtime(AgentFunction fn)
    -> std::unique_ptr<IAgentRuntime> {
  return std::make_unique<FunctionAgentRuntime>(std::move(fn));
}

}  // namespace agency

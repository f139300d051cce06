#pragma once

#include "agency/config/system_config.hpp"
#include "agency/executor/cancellation.hpp"
#include "agency/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace agency {

struct AgentRequest {
  InvocationId invocation_id;
  std::string agent_name;
  std::string task;
  std::string context;
  std::chrono::milliseconds timeout{0};
};

struct AgentResponse {
  bool success{false};
  std::optional<std::string> output;
  std::optional<std::string> error;
  std::optional<std::uint64_t> tokens_used;
};

using AgentCallback = std::move_only_function<void(const InvocationId& id,
                                                   AgentResponse response)>;

// The unit of work execution. start() returns immediately and the callback
// fires at most once per invocation, possibly on another thread. The caller
// owns the deadline: the runtime may hang, and cancel() must terminate the
// invocation's isolated context. A cancelled invocation may still deliver a
// late callback, which callers ignore.
class IAgentRuntime {
public:
  virtual ~IAgentRuntime() = default;

  virtual auto start(AgentRequest request, AgentCallback on_complete)
      -> void = 0;
  virtual auto cancel(const InvocationId& id) -> void = 0;
};

// Runs RuntimeConfig::command through /bin/sh in its own process group,
// prompt on stdin, output on stdout. Cancellation kills the group.
[[nodiscard]] auto create_process_agent_runtime(RuntimeConfig config)
    -> std::unique_ptr<IAgentRuntime>;

using AgentFunction =
    std::function<AgentResponse(const AgentRequest&, CancellationToken)>;

// Runs `fn` on a dedicated thread per invocation. cancel() trips the token;
// `fn` is expected to observe it.
[[nodiscard]] auto create_function_agent_runtime(AgentFunction fn)
    -> std::unique_ptr<IAgentRuntime>;

}  // namespace agency

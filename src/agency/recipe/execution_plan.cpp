#include "agency/recipe/execution_plan.hpp"

#include "agency/recipe/step_graph.hpp"
#include "agency/util/log.hpp"

#include <format>

namespace agency {

namespace {

auto plan_error(Error code, std::string message,
                std::vector<StepId> cycle = {}) -> std::unexpected<PlanError> {
  return std::unexpected(
      PlanError{make_error_code(code), std::move(message), std::move(cycle)});
}

}  // namespace

auto build_execution_plan(std::span<const Step> steps)
    -> std::expected<ExecutionPlan, PlanError> {
  ExecutionPlan plan;
  plan.step_ids = resolve_step_ids(steps);

  StepGraph graph;
  for (const auto& id : plan.step_ids) {
    if (graph.has_node(id)) {
      return plan_error(Error::ValidationError,
                        std::format("duplicate step id '{}'", id));
    }
    graph.add_node(id);
  }

  for (std::size_t i = 0; i < steps.size(); ++i) {
    auto to = static_cast<NodeIndex>(i);
    for (const auto& dep : steps[i].depends_on) {
      auto from = graph.get_index(dep);
      if (from == kInvalidNode) {
        return plan_error(
            Error::ValidationError,
            std::format("step '{}' depends on unknown step '{}'",
                        plan.step_ids[i], dep));
      }
      if (auto r = graph.add_edge(from, to); !r) {
        return plan_error(Error::InvalidArgument, r.error().message());
      }
    }
  }

  if (auto cycle = graph.find_cycle(); !cycle.empty()) {
    std::string path;
    for (const auto& id : cycle) {
      path += path.empty() ? id.str() : std::format(" -> {}", id);
    }
    log::error("Circular dependency detected: {}", path);
    return plan_error(Error::CircularDependency,
                      std::format("circular dependency: {}", path),
                      std::move(cycle));
  }

  for (auto& level : graph.levels()) {
    std::vector<std::size_t> batch(level.begin(), level.end());
    plan.batches.push_back(std::move(batch));
  }
  return plan;
}

auto format_plan(const ExecutionPlan& plan, std::span<const Step> steps)
    -> std::string {
  std::string out;
  for (std::size_t b = 0; b < plan.batches.size(); ++b) {
    out += std::format("Batch {}:", b + 1);
    for (auto idx : plan.batches[b]) {
      const auto& id = plan.step_ids[idx];
      bool serial = idx < steps.size() && steps[idx].parallel == false;
      if (idx < steps.size() && id.str() != steps[idx].agent_name) {
        out += std::format(" {} ({})", id, steps[idx].agent_name);
      } else {
        out += std::format(" {}", id);
      }
      if (serial) {
        out += " [serial]";
      }
    }
    out += '\n';
  }
  return out;
}

}  // namespace agency

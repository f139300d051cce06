#include "agency/config/config.hpp"

#include "agency/config/yaml_utils.hpp"
#include "agency/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<agency::LoggingConfig> {
  static bool decode(const Node& node, agency::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = agency::yaml_get_or<std::string>(node, "level", l.level);
    return true;
  }
};

template <>
struct convert<agency::ExecutionConfig> {
  static bool decode(const Node& node, agency::ExecutionConfig& e) {
    if (!node.IsMap()) {
      return false;
    }
    e.max_concurrency = agency::yaml_get_or(node, "max_concurrency", e.max_concurrency);
    e.default_timeout = agency::yaml_get_ms_or(node, "default_timeout_ms", e.default_timeout);
    e.max_timeout = agency::yaml_get_ms_or(node, "max_timeout_ms", e.max_timeout);
    e.max_context_files = agency::yaml_get_or(node, "max_context_files", e.max_context_files);
    e.agents = agency::yaml_get_or(node, "agents", e.agents);
    if (auto policy = node["dependency_policy"]) {
      auto parsed = agency::parse_trigger_rule(policy.as<std::string>());
      if (!parsed) {
        return false;
      }
      e.dependency_policy = *parsed;
    }
    return true;
  }
};

template <>
struct convert<agency::RuntimeConfig> {
  static bool decode(const Node& node, agency::RuntimeConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.command = agency::yaml_get_or<std::string>(node, "command", r.command);
    r.working_dir = agency::yaml_get_or<std::string>(node, "working_dir", r.working_dir);
    r.env = agency::yaml_get_or(node, "env", r.env);
    r.max_output_bytes = agency::yaml_get_or(node, "max_output_bytes", r.max_output_bytes);
    return true;
  }
};

template <>
struct convert<agency::CacheConfig> {
  static bool decode(const Node& node, agency::CacheConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.enabled = agency::yaml_get_or(node, "enabled", c.enabled);
    c.max_entries = agency::yaml_get_or(node, "max_entries", c.max_entries);
    c.memory_max_bytes = agency::yaml_get_or(node, "memory_max_bytes", c.memory_max_bytes);
    c.persistent_max_bytes = agency::yaml_get_or(node, "persistent_max_bytes", c.persistent_max_bytes);
    c.ttl = agency::yaml_get_ms_or(node, "ttl_ms", c.ttl);
    c.db_file = agency::yaml_get_or<std::string>(node, "db_file", c.db_file);
    c.sweep_interval = agency::yaml_get_ms_or(node, "sweep_interval_ms", c.sweep_interval);
    return true;
  }
};

template <>
struct convert<agency::HistoryConfig> {
  static bool decode(const Node& node, agency::HistoryConfig& h) {
    if (!node.IsMap()) {
      return false;
    }
    h.max_entries = agency::yaml_get_or(node, "max_entries", h.max_entries);
    h.max_bytes = agency::yaml_get_or(node, "max_bytes", h.max_bytes);
    h.ttl = agency::yaml_get_ms_or(node, "ttl_ms", h.ttl);
    h.pressure_threshold = agency::yaml_get_or(node, "pressure_threshold", h.pressure_threshold);
    h.pressure_evict_fraction = agency::yaml_get_or(node, "pressure_evict_fraction", h.pressure_evict_fraction);
    h.sweep_interval = agency::yaml_get_ms_or(node, "sweep_interval_ms", h.sweep_interval);
    return true;
  }
};

template <>
struct convert<agency::SecurityPolicy> {
  static bool decode(const Node& node, agency::SecurityPolicy& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.allowed_base_paths = agency::yaml_get_or(node, "allowed_base_paths", s.allowed_base_paths);
    s.allowed_extensions = agency::yaml_get_or(node, "allowed_extensions", s.allowed_extensions);
    s.restricted_paths = agency::yaml_get_or(node, "restricted_paths", s.restricted_paths);
    s.max_file_size = agency::yaml_get_or(node, "max_file_size", s.max_file_size);
    s.max_files = agency::yaml_get_or(node, "max_files", s.max_files);
    s.max_depth = agency::yaml_get_or(node, "max_depth", s.max_depth);
    s.allow_symlinks = agency::yaml_get_or(node, "allow_symlinks", s.allow_symlinks);
    s.max_audit_events = agency::yaml_get_or(node, "max_audit_events", s.max_audit_events);
    return true;
  }
};

template <>
struct convert<agency::SystemConfig> {
  static bool decode(const Node& node, agency::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<agency::LoggingConfig>();
    }
    if (auto execution = node["execution"]) {
      c.execution = execution.as<agency::ExecutionConfig>();
    }
    if (auto runtime = node["runtime"]) {
      c.runtime = runtime.as<agency::RuntimeConfig>();
    }
    if (auto cache = node["cache"]) {
      c.cache = cache.as<agency::CacheConfig>();
    }
    if (auto history = node["history"]) {
      c.history = history.as<agency::HistoryConfig>();
    }
    if (auto security = node["security"]) {
      c.security = security.as<agency::SecurityPolicy>();
    }
    return true;
  }
};

}  // namespace YAML

namespace agency {

auto ConfigLoader::validate(const SystemConfig& config)
    -> std::vector<std::string> {
  std::vector<std::string> errors;
  const auto& e = config.execution;
  if (e.max_concurrency == 0) {
    errors.emplace_back("execution.max_concurrency must be at least 1");
  }
  if (e.default_timeout.count() <= 0 || e.max_timeout.count() <= 0) {
    errors.emplace_back("execution timeouts must be positive");
  } else if (e.default_timeout > e.max_timeout) {
    errors.push_back(std::format(
        "execution.default_timeout_ms ({}) exceeds max_timeout_ms ({})",
        e.default_timeout.count(), e.max_timeout.count()));
  }
  const auto& h = config.history;
  if (h.pressure_threshold <= 0.0 || h.pressure_threshold > 1.0) {
    errors.emplace_back("history.pressure_threshold must be in (0, 1]");
  }
  if (h.pressure_evict_fraction <= 0.0 || h.pressure_evict_fraction > 1.0) {
    errors.emplace_back("history.pressure_evict_fraction must be in (0, 1]");
  }
  if (h.max_entries == 0 || h.max_bytes == 0) {
    errors.emplace_back("history limits must be positive");
  }
  if (config.cache.max_entries == 0 || config.cache.memory_max_bytes == 0) {
    errors.emplace_back("cache limits must be positive");
  }
  if (config.runtime.command.empty()) {
    errors.emplace_back("runtime.command cannot be empty");
  }
  return errors;
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      return ok(SystemConfig{});
    }
    SystemConfig config = root.as<SystemConfig>();
    auto errors = validate(config);
    if (!errors.empty()) {
      for (const auto& err : errors) {
        log::error("Config validation error: {}", err);
      }
      return fail(Error::ValidationError);
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace agency

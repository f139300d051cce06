#pragma once

#include "agency/util/id.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace YAML {

template <typename Tag>
struct convert<agency::TypedId<Tag>> {
  static auto encode(const agency::TypedId<Tag>& id) -> Node {
    return Node(std::string(id.value()));
  }
  static auto decode(const Node& node, agency::TypedId<Tag>& id) -> bool {
    if (!node.IsScalar()) return false;
    id = agency::TypedId<Tag>{node.as<std::string>()};
    return true;
  }
};

}  // namespace YAML

namespace agency {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

[[nodiscard]] inline auto yaml_get_ms_or(const YAML::Node& node,
                                         std::string_view key,
                                         std::chrono::milliseconds default_val)
    -> std::chrono::milliseconds {
  return std::chrono::milliseconds(
      yaml_get_or<std::int64_t>(node, key, default_val.count()));
}

// Scalars become bool/int/float/null when they read as such unless quoted.
[[nodiscard]] inline auto yaml_to_json(const YAML::Node& node)
    -> nlohmann::json {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;
    case YAML::NodeType::Sequence: {
      auto arr = nlohmann::json::array();
      for (const auto& item : node) {
        arr.push_back(yaml_to_json(item));
      }
      return arr;
    }
    case YAML::NodeType::Map: {
      auto obj = nlohmann::json::object();
      for (const auto& kv : node) {
        obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return obj;
    }
    case YAML::NodeType::Scalar:
      break;
  }

  const auto& s = node.Scalar();
  if (node.Tag() == "!") {
    return s;
  }
  if (s == "true") return true;
  if (s == "false") return false;
  if (s == "null" || s == "~") return nullptr;

  const char* first = s.data();
  const char* last = s.data() + s.size();
  std::int64_t i = 0;
  if (auto [p, ec] = std::from_chars(first, last, i);
      ec == std::errc{} && p == last) {
    return i;
  }
  double d = 0;
  if (auto [p, ec] = std::from_chars(first, last, d);
      ec == std::errc{} && p == last) {
    return d;
  }
  return s;
}

}  // namespace agency

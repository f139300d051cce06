#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace agency {

// Never throws on invalid UTF-8; bad sequences become U+FFFD.
[[nodiscard]] inline auto dump_json(const nlohmann::json& value, int indent = -1)
    -> std::string {
  return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace agency

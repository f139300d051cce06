#pragma once

#include "agency/config/system_config.hpp"
#include "agency/core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace agency {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  // Every key is optional. ParseError for malformed YAML, ValidationError
  // for out-of-range values.
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> std::vector<std::string>;
};

}  // namespace agency

#pragma once

#include "agency/core/error.hpp"
#include "agency/recipe/recipe.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace agency {

class RecipeLoader {
public:
  // ParseError for malformed YAML, ValidationError when the document does
  // not describe a runnable recipe.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<Recipe>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<Recipe>;

  [[nodiscard]] static auto validate(const Recipe& recipe)
      -> std::vector<std::string>;
};

}  // namespace agency

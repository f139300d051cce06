#pragma once

#include "agency/executor/task.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace agency {

// Strings render raw, null renders empty, anything else as compact JSON.
[[nodiscard]] auto stringify(const nlohmann::json& value) -> std::string;

// Replaces "{{ name }}" with the variable's value. "\{{" yields a literal
// "{{"; unknown names and unclosed braces are kept verbatim.
[[nodiscard]] auto render_template(std::string_view tmpl,
                                   const VariableMap& variables) -> std::string;

// Names referenced by placeholders, in order of first appearance.
[[nodiscard]] auto template_placeholders(std::string_view tmpl)
    -> std::vector<std::string>;

}  // namespace agency

#include "agency/executor/template_renderer.hpp"

#include "agency/util/json.hpp"

#include <algorithm>
#include <cctype>

namespace agency {

namespace {

auto trim(std::string_view sv) -> std::string_view {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

auto find_closing_braces(std::string_view tmpl, std::size_t start)
    -> std::size_t {
  for (std::size_t i = start; i + 1 < tmpl.size(); ++i) {
    if (tmpl[i] == '}' && tmpl[i + 1] == '}') {
      return i;
    }
  }
  return std::string_view::npos;
}

auto is_escape(std::string_view tmpl, std::size_t pos) -> bool {
  return pos + 2 < tmpl.size() && tmpl[pos] == '\\' && tmpl[pos + 1] == '{' &&
         tmpl[pos + 2] == '{';
}

auto is_open(std::string_view tmpl, std::size_t pos) -> bool {
  return pos + 1 < tmpl.size() && tmpl[pos] == '{' && tmpl[pos + 1] == '{';
}

// Calls on_text for literal runs and on_token(name, raw) for each closed
// placeholder.
template <typename OnText, typename OnToken>
auto scan(std::string_view tmpl, OnText&& on_text, OnToken&& on_token) -> void {
  std::size_t pos = 0;
  while (pos < tmpl.size()) {
    if (is_escape(tmpl, pos)) {
      on_text("{{");
      pos += 3;
      continue;
    }
    if (is_open(tmpl, pos)) {
      auto close = find_closing_braces(tmpl, pos + 2);
      if (close == std::string_view::npos) {
        on_text("{{");
        pos += 2;
        continue;
      }
      on_token(trim(tmpl.substr(pos + 2, close - pos - 2)),
               tmpl.substr(pos, close + 2 - pos));
      pos = close + 2;
      continue;
    }
    on_text(tmpl.substr(pos, 1));
    ++pos;
  }
}

}  // namespace

auto stringify(const nlohmann::json& value) -> std::string {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_null()) {
    return {};
  }
  return dump_json(value);
}

auto render_template(std::string_view tmpl, const VariableMap& variables)
    -> std::string {
  std::string out;
  out.reserve(tmpl.size());
  scan(
      tmpl, [&](std::string_view text) { out.append(text); },
      [&](std::string_view name, std::string_view raw) {
        auto it = variables.find(name);
        if (it == variables.end()) {
          out.append(raw);
          return;
        }
        out.append(stringify(it->second));
      });
  return out;
}

auto template_placeholders(std::string_view tmpl) -> std::vector<std::string> {
  std::vector<std::string> names;
  scan(
      tmpl, [](std::string_view) {},
      [&](std::string_view name, std::string_view) {
        if (!name.empty() && std::ranges::find(names, name) == names.end()) {
          names.emplace_back(name);
        }
      });
  return names;
}

}  // namespace agency

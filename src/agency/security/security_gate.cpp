#include "agency/security/security_gate.hpp"

#include "agency/util/log.hpp"
#include "agency/util/util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <utility>

namespace agency {

namespace fs = std::filesystem;

namespace {

constexpr std::array kOperationNames = {"read", "write", "execute"};
constexpr std::array kEventKindNames = {
    "access_granted",     "path_traversal_attempt", "unauthorized_path_access",
    "access_denied",      "invalid_path",           "depth_violation",
    "symlink_rejected",   "extension_violation",    "file_size_violation",
    "injection_attempt"};
constexpr std::array kSeverityNames = {"low", "medium", "high", "critical"};

// Encoded dot and separator forms, matched case-insensitively against the raw
// input. A literal ".." only counts as a whole path segment.
constexpr std::array<std::string_view, 8> kTraversalTokens = {
    "%2e%2e", "%2e.", ".%2e", "%252e", ".%2f", ".%5c", "%c0%ae", "%uff0e"};

auto is_stripped_control(unsigned char c) -> bool {
  return (c <= 0x08) || c == 0x0b || c == 0x0c || (c >= 0x0e && c <= 0x1f) ||
         c == 0x7f;
}

auto has_control_chars(std::string_view s) -> bool {
  return std::ranges::any_of(s, [](char c) {
    auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7f;
  });
}

auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Backslashes become '/', repeated separators collapse.
auto normalize_separators(std::string_view raw) -> std::string {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (c == '\\') {
      c = '/';
    }
    if (c == '/' && !out.empty() && out.back() == '/') {
      continue;
    }
    out.push_back(c);
  }
  return out;
}

auto looks_like_traversal(std::string_view raw) -> bool {
  auto lowered = to_lower(raw);
  if (std::ranges::any_of(kTraversalTokens, [&](std::string_view token) {
        return lowered.find(token) != std::string::npos;
      })) {
    return true;
  }
  auto normalized = normalize_separators(lowered);
  std::string_view rest{normalized};
  while (!rest.empty()) {
    auto slash = rest.find('/');
    if (rest.substr(0, slash) == "..") {
      return true;
    }
    if (slash == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(slash + 1);
  }
  return false;
}

auto strip_trailing_separator(fs::path p) -> fs::path {
  if (!p.has_filename() && p.has_relative_path()) {
    return p.parent_path();
  }
  return p;
}

auto resolve(const fs::path& p) -> fs::path {
  std::error_code ec;
  auto canonical = fs::weakly_canonical(p, ec);
  if (ec) {
    return strip_trailing_separator(p.lexically_normal());
  }
  return strip_trailing_separator(std::move(canonical));
}

auto is_within(const fs::path& p, const fs::path& base) -> bool {
  auto [pi, bi] = std::mismatch(p.begin(), p.end(), base.begin(), base.end());
  return bi == base.end();
}

// '*' matches any run of characters inside one path segment.
auto segment_matches(std::string_view pattern, std::string_view text) -> bool {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t star = std::string_view::npos;
  std::size_t mark = 0;
  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      mark = t;
    } else if (p < pattern.size() && pattern[p] == text[t]) {
      ++p;
      ++t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++mark;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

auto glob_prefix_matches(const fs::path& pattern, const fs::path& p) -> bool {
  auto it = p.begin();
  for (const auto& component : pattern) {
    if (it == p.end()) {
      return false;
    }
    if (!segment_matches(component.native(), it->native())) {
      return false;
    }
    ++it;
  }
  return true;
}

auto path_depth(const fs::path& p) -> std::size_t {
  std::size_t depth = 0;
  for (const auto& component : p.relative_path()) {
    if (!component.empty()) {
      ++depth;
    }
  }
  return depth;
}

struct InjectionPattern {
  std::string_view name;
  std::regex re;
};

// Short token patterns only; every repeat is bounded. Script elements are
// handled by neutralize_scripts().
auto injection_patterns() -> const std::vector<InjectionPattern>& {
  static const std::vector<InjectionPattern> patterns = [] {
    constexpr auto icase =
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    constexpr auto exact = std::regex::ECMAScript | std::regex::optimize;
    std::vector<InjectionPattern> p;
    p.push_back({"javascript_url", std::regex(R"(javascript\s{0,16}:)", icase)});
    p.push_back({"event_handler", std::regex(R"(\bon[a-z]{1,32}\s{0,16}=)", icase)});
    p.push_back({"eval_call", std::regex(R"(\beval\s{0,16}\()", exact)});
    p.push_back({"function_constructor",
                 std::regex(R"(\bFunction\s{0,16}\()", exact)});
    return p;
  }();
  return patterns;
}

auto starts_with_icase(std::string_view s, std::string_view prefix) -> bool {
  return s.size() >= prefix.size() &&
         std::ranges::equal(s.substr(0, prefix.size()), prefix,
                            [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                            });
}

auto find_icase(std::string_view s, std::string_view needle, std::size_t from)
    -> std::size_t {
  if (from >= s.size()) {
    return std::string_view::npos;
  }
  auto hit = std::ranges::search(s.substr(from), needle, [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
  if (hit.empty()) {
    return std::string_view::npos;
  }
  return static_cast<std::size_t>(hit.begin() - s.begin());
}

// One past the '>' closing the tag whose name ends at `name_end`; npos when
// the name continues (as in "<scripts>") or the tag never closes.
auto tag_end(std::string_view s, std::size_t name_end) -> std::size_t {
  if (name_end < s.size()) {
    auto c = static_cast<unsigned char>(s[name_end]);
    if (std::isalnum(c) || c == '_') {
      return std::string_view::npos;
    }
  }
  auto close = s.find('>', name_end);
  return close == std::string_view::npos ? close : close + 1;
}

struct ScriptMatches {
  std::size_t blocks{0};
  std::size_t tags{0};
};

// Replaces whole <script>...</script> elements, then stray opening or closing
// script tags. Single pass, linear in the input.
auto neutralize_scripts(std::string_view text, std::string_view placeholder,
                        ScriptMatches& matches) -> std::string {
  constexpr std::string_view kOpen = "<script";
  constexpr std::string_view kClose = "</script";
  std::string out;
  out.reserve(text.size());
  bool closer_ahead = true;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto lt = text.find('<', pos);
    if (lt == std::string_view::npos) {
      break;
    }
    out.append(text.substr(pos, lt - pos));
    auto rest = text.substr(lt);

    auto end = std::string_view::npos;
    bool opening = false;
    if (starts_with_icase(rest, kOpen)) {
      end = tag_end(text, lt + kOpen.size());
      opening = true;
    } else if (starts_with_icase(rest, kClose)) {
      end = tag_end(text, lt + kClose.size());
    }
    if (end == std::string_view::npos) {
      out.push_back('<');
      pos = lt + 1;
      continue;
    }

    if (opening && closer_ahead) {
      auto close = find_icase(text, kClose, end);
      auto close_end = std::string_view::npos;
      while (close != std::string_view::npos &&
             (close_end = tag_end(text, close + kClose.size())) ==
                 std::string_view::npos) {
        close = find_icase(text, kClose, close + kClose.size());
      }
      if (close_end != std::string_view::npos) {
        out.append(placeholder);
        ++matches.blocks;
        pos = close_end;
        continue;
      }
      closer_ahead = false;
    }
    out.append(placeholder);
    ++matches.tags;
    pos = end;
  }
  if (pos < text.size()) {
    out.append(text.substr(pos));
  }
  return out;
}

}  // namespace

auto to_string_view(FileOperation op) noexcept -> std::string_view {
  auto idx = std::to_underlying(op);
  return idx < kOperationNames.size() ? kOperationNames[idx] : "unknown";
}

auto to_string_view(SecurityEventKind kind) noexcept -> std::string_view {
  auto idx = std::to_underlying(kind);
  return idx < kEventKindNames.size() ? kEventKindNames[idx] : "unknown";
}

auto to_string_view(Severity severity) noexcept -> std::string_view {
  auto idx = std::to_underlying(severity);
  return idx < kSeverityNames.size() ? kSeverityNames[idx] : "unknown";
}

SecurityGate::SecurityGate(SecurityPolicy policy) : policy_(std::move(policy)) {
  std::error_code ec;
  working_dir_ = fs::current_path(ec);
  if (ec) {
    log::warn("SecurityGate: cannot determine working directory: {}",
              ec.message());
    working_dir_ = "/";
  }

  if (policy_.allowed_base_paths.empty()) {
    allowed_bases_.push_back(resolve(working_dir_));
  } else {
    for (const auto& base : policy_.allowed_base_paths) {
      fs::path p{normalize_separators(base)};
      allowed_bases_.push_back(resolve(p.is_absolute() ? p : working_dir_ / p));
    }
  }

  for (auto& ext : policy_.allowed_extensions) {
    ext = to_lower(ext);
    if (!ext.empty() && ext.front() != '.') {
      ext.insert(ext.begin(), '.');
    }
  }
}

auto SecurityGate::validate_path(std::string_view path, FileOperation op)
    -> PathValidation {
  PathValidation v;

  if (path.empty()) {
    reject(v, SecurityEventKind::InvalidPath, Severity::Medium, op, path,
           "empty path");
    return v;
  }
  if (has_control_chars(path)) {
    reject(v, SecurityEventKind::InvalidPath, Severity::High, op, path,
           "path contains null or control characters");
    return v;
  }
  if (looks_like_traversal(path)) {
    reject(v, SecurityEventKind::PathTraversalAttempt, Severity::High, op, path,
           "path traversal attempt detected");
    return v;
  }

  fs::path input{normalize_separators(path)};
  auto lexical = strip_trailing_separator(
      (input.is_absolute() ? input : working_dir_ / input).lexically_normal());
  auto resolved = resolve(lexical);
  v.resolved_path = resolved;

  if (!is_allowed(resolved)) {
    reject(v, SecurityEventKind::UnauthorizedPathAccess, Severity::High, op,
           path, "path is outside allowed base paths");
    return v;
  }
  if (is_restricted(resolved) || is_restricted(lexical)) {
    reject(v, SecurityEventKind::AccessDenied, Severity::Critical, op, path,
           "access to restricted path denied");
    return v;
  }
  if (path_depth(resolved) > policy_.max_depth) {
    reject(v, SecurityEventKind::DepthViolation, Severity::Medium, op, path,
           std::format("path depth exceeds maximum ({})", policy_.max_depth));
    return v;
  }

  std::error_code ec;
  auto link_status = fs::symlink_status(lexical, ec);
  if (!ec && fs::is_symlink(link_status) && !policy_.allow_symlinks) {
    reject(v, SecurityEventKind::SymlinkRejected, Severity::Medium, op, path,
           "symbolic links are not allowed");
    return v;
  }

  auto status = fs::status(resolved, ec);
  if (!ec && fs::is_regular_file(status)) {
    if (!extension_allowed(resolved)) {
      reject(v, SecurityEventKind::ExtensionViolation, Severity::Medium, op,
             path,
             std::format("file extension '{}' is not allowed",
                         resolved.extension().string()));
      return v;
    }
    auto size = fs::file_size(resolved, ec);
    if (!ec && size > policy_.max_file_size) {
      reject(v, SecurityEventKind::FileSizeViolation, Severity::Medium, op,
             path,
             std::format("file size {} exceeds maximum allowed ({} bytes)",
                         size, policy_.max_file_size));
      return v;
    }
  }

  v.valid = true;
  record(SecurityEvent{.timestamp = std::chrono::system_clock::now(),
                       .kind = SecurityEventKind::AccessGranted,
                       .severity = Severity::Low,
                       .operation = op,
                       .original_path = std::string(path),
                       .resolved_path = resolved.string(),
                       .detail = "path validated"});
  return v;
}

auto SecurityGate::sanitize_content(std::string_view text) -> std::string {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (char c : text) {
    if (!is_stripped_control(static_cast<unsigned char>(c))) {
      cleaned.push_back(c);
    }
  }

  auto note = [this](std::string_view name, std::size_t matches) {
    log::warn("Neutralized {} {} pattern(s) in content", matches, name);
    record(SecurityEvent{.timestamp = std::chrono::system_clock::now(),
                         .kind = SecurityEventKind::InjectionAttempt,
                         .severity = Severity::High,
                         .operation = FileOperation::Write,
                         .original_path = {},
                         .resolved_path = {},
                         .detail = std::format("{} x{}", name, matches)});
  };

  ScriptMatches scripts;
  cleaned = neutralize_scripts(cleaned, kSanitizedPlaceholder, scripts);
  if (scripts.blocks > 0) {
    note("script_block", scripts.blocks);
  }
  if (scripts.tags > 0) {
    note("script_tag", scripts.tags);
  }

  const std::string placeholder{kSanitizedPlaceholder};
  for (const auto& pattern : injection_patterns()) {
    auto begin = std::sregex_iterator(cleaned.begin(), cleaned.end(), pattern.re);
    auto matches = std::distance(begin, std::sregex_iterator());
    if (matches == 0) {
      continue;
    }
    cleaned = std::regex_replace(cleaned, pattern.re, placeholder);
    note(pattern.name, static_cast<std::size_t>(matches));
  }
  return cleaned;
}

auto SecurityGate::read_file(std::string_view path) -> Result<std::string> {
  auto v = validate_path(path, FileOperation::Read);
  if (!v) {
    return fail(Error::SecurityViolation);
  }

  std::error_code ec;
  if (!fs::is_regular_file(v.resolved_path, ec)) {
    return fail(Error::FileNotFound);
  }

  std::ifstream file(v.resolved_path, std::ios::binary);
  if (!file.is_open()) {
    log::error("Failed to open {}", v.resolved_path.string());
    return fail(Error::FileOpenFailed);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return fail(Error::IoError);
  }
  return buffer.str();
}

auto SecurityGate::write_file(std::string_view path, std::string_view content)
    -> Result<void> {
  auto v = validate_path(path, FileOperation::Write);
  if (!v) {
    return fail(Error::SecurityViolation);
  }

  std::error_code ec;
  if (auto parent = v.resolved_path.parent_path(); !parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      log::error("Failed to create {}: {}", parent.string(), ec.message());
      return fail(Error::IoError);
    }
  }

  auto sanitized = sanitize_content(content);
  std::ofstream file(v.resolved_path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    log::error("Failed to open {} for writing", v.resolved_path.string());
    return fail(Error::FileOpenFailed);
  }
  file.write(sanitized.data(), static_cast<std::streamsize>(sanitized.size()));
  file.flush();
  if (!file.good()) {
    return fail(Error::IoError);
  }
  return ok();
}

auto SecurityGate::validate_glob_pattern(std::string_view pattern) const
    -> bool {
  if (pattern.empty() || has_control_chars(pattern)) {
    return false;
  }
  if (pattern.front() == '/' || pattern.front() == '\\' ||
      pattern.front() == '~') {
    return false;
  }
  return !looks_like_traversal(pattern);
}

auto SecurityGate::audit_log(Severity min_severity, std::size_t limit) const
    -> std::vector<SecurityEvent> {
  std::lock_guard lock(audit_mu_);
  std::vector<SecurityEvent> out;
  for (auto it = audit_.rbegin(); it != audit_.rend(); ++it) {
    if (it->severity < min_severity) {
      continue;
    }
    out.push_back(*it);
    if (limit != 0 && out.size() >= limit) {
      break;
    }
  }
  return out;
}

auto SecurityGate::report() const -> SecurityReport {
  std::lock_guard lock(audit_mu_);
  SecurityReport r;
  r.total_events = audit_.size();
  std::array<std::size_t, kEventKindNames.size()> by_kind{};
  for (const auto& event : audit_) {
    ++r.events_by_severity[std::to_underlying(event.severity)];
    ++by_kind[std::to_underlying(event.kind)];
    if (event.severity == Severity::Critical) {
      r.recent_critical.push_back(event);
    }
  }
  for (std::size_t i = 0; i < by_kind.size(); ++i) {
    if (by_kind[i] > 0) {
      r.events_by_kind.emplace_back(static_cast<SecurityEventKind>(i),
                                    by_kind[i]);
    }
  }
  if (r.recent_critical.size() > 10) {
    r.recent_critical.erase(r.recent_critical.begin(),
                            r.recent_critical.end() - 10);
  }
  return r;
}

auto SecurityGate::clear_audit_log() -> void {
  std::lock_guard lock(audit_mu_);
  audit_.clear();
}

auto SecurityGate::reject(PathValidation& v, SecurityEventKind kind,
                          Severity severity, FileOperation op,
                          std::string_view original, std::string violation)
    -> void {
  v.valid = false;
  v.rejection = kind;
  log::warn("Security: {} {} '{}': {}", to_string_view(kind),
            to_string_view(op), original, violation);
  record(SecurityEvent{.timestamp = std::chrono::system_clock::now(),
                       .kind = kind,
                       .severity = severity,
                       .operation = op,
                       .original_path = std::string(original),
                       .resolved_path = v.resolved_path.string(),
                       .detail = violation});
  v.violations.push_back(std::move(violation));
}

auto SecurityGate::record(SecurityEvent event) -> void {
  std::lock_guard lock(audit_mu_);
  audit_.push_back(std::move(event));
  if (policy_.max_audit_events > 0 && audit_.size() > policy_.max_audit_events) {
    auto keep = policy_.max_audit_events / 2;
    audit_.erase(audit_.begin(),
                 audit_.begin() + static_cast<std::ptrdiff_t>(audit_.size() - keep));
  }
}

auto SecurityGate::is_allowed(const fs::path& p) const -> bool {
  return std::ranges::any_of(allowed_bases_, [&](const fs::path& base) {
    return is_within(p, base);
  });
}

auto SecurityGate::is_restricted(const fs::path& p) const -> bool {
  return std::ranges::any_of(policy_.restricted_paths, [&](const std::string& r) {
    fs::path pattern = fs::path(r).lexically_normal();
    if (r.find('*') != std::string::npos) {
      return glob_prefix_matches(strip_trailing_separator(pattern), p);
    }
    return is_within(p, strip_trailing_separator(pattern)) ||
           is_within(p, resolve(pattern));
  });
}

auto SecurityGate::extension_allowed(const fs::path& p) const -> bool {
  if (policy_.allowed_extensions.empty()) {
    return true;
  }
  auto ext = to_lower(p.extension().string());
  return std::ranges::find(policy_.allowed_extensions, ext) !=
         policy_.allowed_extensions.end();
}

auto SecurityReport::to_markdown() const -> std::string {
  std::string out = "# Security Report\n\n";
  std::format_to(std::back_inserter(out), "- Total events: {}\n", total_events);
  for (std::size_t i = 0; i < std::size(events_by_severity); ++i) {
    std::format_to(std::back_inserter(out), "- {}: {}\n", kSeverityNames[i],
                   events_by_severity[i]);
  }
  if (!events_by_kind.empty()) {
    out += "\n## Events by kind\n\n";
    for (const auto& [kind, count] : events_by_kind) {
      std::format_to(std::back_inserter(out), "- {}: {}\n",
                     to_string_view(kind), count);
    }
  }
  if (!recent_critical.empty()) {
    out += "\n## Recent critical events\n\n";
    for (const auto& event : recent_critical) {
      std::format_to(std::back_inserter(out), "- {} {} {}: {}\n",
                     format_timestamp(event.timestamp),
                     to_string_view(event.operation), event.original_path,
                     event.detail);
    }
  }
  return out;
}

}  // namespace agency

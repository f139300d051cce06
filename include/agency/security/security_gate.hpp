#pragma once

#include "agency/core/error.hpp"
#include "agency/security/security_policy.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agency {

enum class FileOperation : std::uint8_t { Read, Write, Execute };

enum class SecurityEventKind : std::uint8_t {
  AccessGranted,
  PathTraversalAttempt,
  UnauthorizedPathAccess,
  AccessDenied,
  InvalidPath,
  DepthViolation,
  SymlinkRejected,
  ExtensionViolation,
  FileSizeViolation,
  InjectionAttempt,
};

enum class Severity : std::uint8_t { Low, Medium, High, Critical };

[[nodiscard]] auto to_string_view(FileOperation op) noexcept -> std::string_view;
[[nodiscard]] auto to_string_view(SecurityEventKind kind) noexcept
    -> std::string_view;
[[nodiscard]] auto to_string_view(Severity severity) noexcept
    -> std::string_view;

struct SecurityEvent {
  std::chrono::system_clock::time_point timestamp;
  SecurityEventKind kind{SecurityEventKind::AccessGranted};
  Severity severity{Severity::Low};
  FileOperation operation{FileOperation::Read};
  std::string original_path;
  std::string resolved_path;
  std::string detail;
};

struct PathValidation {
  bool valid{false};
  std::filesystem::path resolved_path;
  std::vector<std::string> violations;
  std::optional<SecurityEventKind> rejection;

  [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

struct SecurityReport {
  std::size_t total_events{0};
  std::size_t events_by_severity[4]{};
  std::vector<std::pair<SecurityEventKind, std::size_t>> events_by_kind;
  std::vector<SecurityEvent> recent_critical;

  [[nodiscard]] auto to_markdown() const -> std::string;
};

// Sole boundary between caller-supplied paths/content and the filesystem.
// Thread-safe; the policy is fixed at construction.
class SecurityGate {
public:
  explicit SecurityGate(SecurityPolicy policy = {});

  [[nodiscard]] auto validate_path(std::string_view path,
                                   FileOperation op = FileOperation::Read)
      -> PathValidation;

  // Strips control characters (tab, newline and carriage return survive) and
  // replaces script-like constructs with kSanitizedPlaceholder.
  [[nodiscard]] auto sanitize_content(std::string_view text) -> std::string;

  [[nodiscard]] auto read_file(std::string_view path) -> Result<std::string>;
  [[nodiscard]] auto write_file(std::string_view path, std::string_view content)
      -> Result<void>;

  // Relative patterns only, no traversal.
  [[nodiscard]] auto validate_glob_pattern(std::string_view pattern) const
      -> bool;

  [[nodiscard]] auto audit_log(Severity min_severity = Severity::Low,
                               std::size_t limit = 0) const
      -> std::vector<SecurityEvent>;
  [[nodiscard]] auto report() const -> SecurityReport;
  auto clear_audit_log() -> void;

  [[nodiscard]] auto policy() const noexcept -> const SecurityPolicy& {
    return policy_;
  }
  [[nodiscard]] auto allowed_bases() const noexcept
      -> const std::vector<std::filesystem::path>& {
    return allowed_bases_;
  }

  static constexpr std::string_view kSanitizedPlaceholder =
      "[SANITIZED_CONTENT]";

private:
  auto reject(PathValidation& v, SecurityEventKind kind, Severity severity,
              FileOperation op, std::string_view original,
              std::string violation) -> void;
  auto record(SecurityEvent event) -> void;

  [[nodiscard]] auto is_allowed(const std::filesystem::path& p) const -> bool;
  [[nodiscard]] auto is_restricted(const std::filesystem::path& p) const
      -> bool;
  [[nodiscard]] auto extension_allowed(const std::filesystem::path& p) const
      -> bool;

  SecurityPolicy policy_;
  std::vector<std::filesystem::path> allowed_bases_;
  std::filesystem::path working_dir_;

  mutable std::mutex audit_mu_;
  std::deque<SecurityEvent> audit_;
};

}  // namespace agency

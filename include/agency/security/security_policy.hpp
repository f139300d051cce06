#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace agency {

struct SecurityPolicy {
  // Empty means "the working directory at gate construction".
  std::vector<std::string> allowed_base_paths;
  // Lower-case, with the leading dot. Empty allows every extension.
  std::vector<std::string> allowed_extensions{".md",   ".ts",  ".js", ".json",
                                              ".yaml", ".yml", ".txt"};
  // Plain prefixes or glob-style prefixes where '*' matches one segment.
  std::vector<std::string> restricted_paths{
      "/etc",       "/bin",       "/sbin",          "/usr/bin",
      "/usr/sbin",  "/proc",      "/sys",           "/root/.ssh",
      "/home/*/.ssh", "/home/*/.config"};
  std::uint64_t max_file_size{10 * 1024 * 1024};
  std::size_t max_files{100};
  std::size_t max_depth{10};
  bool allow_symlinks{false};
  std::size_t max_audit_events{1000};
};

}  // namespace agency

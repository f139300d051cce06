#pragma once

#include "agency/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agency {

class SecurityGate;
class ResourceCache;

struct LoadedContext {
  std::string content;
  std::string fingerprint;
  std::size_t file_count{0};
  std::uint64_t source_bytes{0};
  bool from_cache{false};
};

// Turns a file or directory into a prompt context. Every path goes through
// the gate; the formatted result is cached under a content fingerprint so an
// unchanged source hits and a modified one never returns stale text.
class ContextLoader {
public:
  ContextLoader(SecurityGate& gate, ResourceCache* cache,
                std::size_t max_files);

  // SecurityViolation when the gate refuses the path, FileNotFound when it
  // does not exist, IoError when a file cannot be read.
  [[nodiscard]] auto load(std::string_view path) -> Result<LoadedContext>;

private:
  struct SourceFile {
    std::string display_name;
    std::string path;
  };

  [[nodiscard]] auto collect(const std::string& resolved)
      -> Result<std::vector<SourceFile>>;

  SecurityGate& gate_;
  ResourceCache* cache_;
  std::size_t max_files_;
};

}  // namespace agency

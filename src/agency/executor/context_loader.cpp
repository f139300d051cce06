#include "agency/executor/context_loader.hpp"

#include "agency/cache/resource_cache.hpp"
#include "agency/security/security_gate.hpp"
#include "agency/util/hash.hpp"
#include "agency/util/log.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <format>
#include <system_error>

namespace agency {

namespace {

namespace fs = std::filesystem;

constexpr std::array<std::string_view, 4> kSkippedDirs = {
    "node_modules", ".git", "dist", "build"};

auto skipped_dir(const fs::path& p) -> bool {
  auto name = p.filename().string();
  return std::ranges::find(kSkippedDirs, name) != kSkippedDirs.end();
}

auto append_block(std::string& out, std::string_view name,
                  std::string_view content) -> void {
  out += std::format("### {}\n```\n{}\n```\n\n", name, content);
}

}  // namespace

ContextLoader::ContextLoader(SecurityGate& gate, ResourceCache* cache,
                             std::size_t max_files)
    : gate_(gate), cache_(cache), max_files_(max_files) {}

auto ContextLoader::collect(const std::string& resolved)
    -> Result<std::vector<SourceFile>> {
  std::error_code ec;
  auto status = fs::status(resolved, ec);
  if (ec || !fs::exists(status)) {
    return fail(Error::FileNotFound);
  }

  std::vector<SourceFile> files;
  if (fs::is_regular_file(status)) {
    files.push_back({fs::path(resolved).filename().string(), resolved});
    return files;
  }
  if (!fs::is_directory(status)) {
    return fail(Error::InvalidArgument);
  }

  fs::recursive_directory_iterator it(
      resolved, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    log::warn("Cannot list context directory {}: {}", resolved, ec.message());
    return fail(Error::IoError);
  }
  for (auto end = fs::recursive_directory_iterator{}; it != end;
       it.increment(ec)) {
    if (ec) {
      log::warn("Error walking {}: {}", resolved, ec.message());
      break;
    }
    const auto& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      if (skipped_dir(entry.path())) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(type_ec)) {
      continue;
    }
    files.push_back({fs::relative(entry.path(), resolved, type_ec).string(),
                     entry.path().string()});
  }

  std::ranges::sort(files, {}, &SourceFile::display_name);

  std::vector<SourceFile> permitted;
  for (auto& file : files) {
    if (permitted.size() >= max_files_) {
      log::debug("Context {} truncated at {} files", resolved, max_files_);
      break;
    }
    if (!gate_.validate_path(file.path, FileOperation::Read)) {
      log::debug("Skipping context file {}", file.path);
      continue;
    }
    permitted.push_back(std::move(file));
  }
  return permitted;
}

auto ContextLoader::load(std::string_view path) -> Result<LoadedContext> {
  auto validation = gate_.validate_path(path, FileOperation::Read);
  if (!validation) {
    log::warn("Context path rejected: {}", path);
    return fail(Error::SecurityViolation);
  }
  auto resolved = validation.resolved_path.string();

  auto files = collect(resolved);
  if (!files) {
    return std::unexpected(files.error());
  }
  bool single = files->size() == 1 && files->front().path == resolved;

  util::Fingerprinter fp;
  std::vector<std::pair<const SourceFile*, std::string>> contents;
  contents.reserve(files->size());
  std::uint64_t total_bytes = 0;
  for (const auto& file : *files) {
    auto data = gate_.read_file(file.path);
    if (!data) {
      if (single) {
        return std::unexpected(data.error());
      }
      log::warn("Failed to read context file {}: {}", file.path,
                data.error().message());
      continue;
    }
    fp.feed(file.display_name)
        .feed(static_cast<std::uint64_t>(data->size()))
        .feed(*data);
    total_bytes += data->size();
    contents.emplace_back(&file, std::move(*data));
  }
  auto fingerprint = fp.hex();

  if (cache_) {
    if (auto hit = cache_->get_context(resolved, fingerprint)) {
      log::debug("Context cache hit for {}", resolved);
      return LoadedContext{.content = std::move(hit->content),
                           .fingerprint = std::move(fingerprint),
                           .file_count = hit->file_count,
                           .source_bytes = hit->source_bytes,
                           .from_cache = true};
    }
  }

  LoadedContext loaded;
  loaded.fingerprint = fingerprint;
  loaded.file_count = contents.size();
  loaded.source_bytes = total_bytes;
  for (const auto& [file, data] : contents) {
    append_block(loaded.content, file->display_name, data);
  }

  if (cache_) {
    cache_->put_context(ContextEntry{.source_path = resolved,
                                     .fingerprint = std::move(fingerprint),
                                     .content = loaded.content,
                                     .file_count = loaded.file_count,
                                     .source_bytes = loaded.source_bytes});
  }
  return loaded;
}

}  // namespace agency

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <string>
#include <string_view>

namespace agency {

[[nodiscard]] inline auto to_epoch_ms(std::chrono::system_clock::time_point tp)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// ISO 8601, UTC, millisecond precision.
[[nodiscard]] inline auto format_timestamp(
    std::chrono::system_clock::time_point tp) -> std::string {
  auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  auto ms = to_epoch_ms(tp) % 1000;
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, ms);
}

[[nodiscard]] inline auto format_timestamp() -> std::string {
  return format_timestamp(std::chrono::system_clock::now());
}

// Anything outside [A-Za-z0-9_-] becomes '_'.
[[nodiscard]] inline auto sanitize_file_component(std::string_view name)
    -> std::string {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '-' || c == '_';
    out.push_back(keep ? c : '_');
  }
  return out;
}

}  // namespace agency

#pragma once

#include "agency/core/lockfree_queue.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <print>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace agency::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"TRACE", "DEBUG", "INFO ", "WARN ",
                                        "ERROR"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {"\033[90m", "\033[36m", "\033[32m",
                                         "\033[33m", "\033[31m"};
  return colors[static_cast<std::uint8_t>(level)];
}

// Unknown names fall back to info.
[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn" || name == "warning") return Level::Warn;
  if (name == "error") return Level::Error;
  return Level::Info;
}

// Lines go to stderr; stdout belongs to command output. Before start() and
// after stop(), and whenever the queue is full, lines are written inline.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kWriteBatch = 64;
  static constexpr auto kIdleWait = std::chrono::microseconds(200);

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> accepting_{false};
  bool color_{isatty(STDERR_FILENO) == 1};
  BoundedMPSCQueue<std::string> queue_{kQueueCapacity};
  std::jthread writer_;

  auto flush(std::vector<std::string>& batch) -> void {
    for (const auto& line : batch) {
      std::fputs(line.c_str(), stderr);
    }
    batch.clear();
  }

  auto writer_loop(std::stop_token stop) -> void {
    std::vector<std::string> batch;
    batch.reserve(kWriteBatch);
    while (!stop.stop_requested()) {
      if (queue_.drain_into(batch, kWriteBatch) == 0) {
        std::this_thread::sleep_for(kIdleWait);
        continue;
      }
      flush(batch);
    }
    while (queue_.drain_into(batch, kWriteBatch) > 0) {
      flush(batch);
    }
    std::fflush(stderr);
  }

  template <typename... Args>
  auto format_line(Level level, std::format_string<Args...> fmt,
                   Args&&... args) const -> std::string {
    std::string out;
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    if (color_) {
      std::format_to(std::back_inserter(out), "{:%H:%M:%S} {}{}\033[0m ",
                     now, level_color(level), level_name(level));
    } else {
      std::format_to(std::back_inserter(out), "{:%H:%M:%S} {} ", now,
                     level_name(level));
    }
    std::format_to(std::back_inserter(out), fmt, std::forward<Args>(args)...);
    out.push_back('\n');
    return out;
  }

public:
  Logger() = default;
  ~Logger() { stop(); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (writer_.joinable()) {
      return;
    }
    accepting_.store(true, std::memory_order_release);
    writer_ = std::jthread([this](std::stop_token stop) { writer_loop(stop); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    if (writer_.joinable()) {
      writer_.request_stop();
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line = format_line(level, fmt, std::forward<Args>(args)...);
    if (accepting_.load(std::memory_order_acquire) && queue_.push(line)) {
      return;
    }
    std::fputs(line.c_str(), stderr);
  }
};

inline auto logger() -> Logger& {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto start() -> void { logger().start(); }

inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace agency::log

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace agency {

// Runs a callback every `interval` on a background thread until stopped.
class PeriodicSweeper {
public:
  PeriodicSweeper() = default;
  ~PeriodicSweeper() { stop(); }

  PeriodicSweeper(const PeriodicSweeper&) = delete;
  PeriodicSweeper& operator=(const PeriodicSweeper&) = delete;

  auto start(std::chrono::milliseconds interval, std::function<void()> fn)
      -> void {
    if (thread_.joinable() || interval <= std::chrono::milliseconds::zero()) {
      return;
    }
    thread_ = std::jthread([interval, fn = std::move(fn)](std::stop_token st) {
      std::mutex mu;
      std::condition_variable_any cv;
      std::unique_lock lock(mu);
      while (!cv.wait_for(lock, st, interval, [] { return false; })) {
        if (st.stop_requested()) {
          break;
        }
        fn();
      }
    });
  }

  auto stop() -> void {
    if (thread_.joinable()) {
      thread_.request_stop();
      thread_.join();
    }
  }

  [[nodiscard]] auto running() const noexcept -> bool {
    return thread_.joinable();
  }

private:
  std::jthread thread_;
};

}  // namespace agency

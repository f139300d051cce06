#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace agency {

class CancellationToken;

class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {}

  [[nodiscard]] auto token() const noexcept -> CancellationToken;
  auto cancel() noexcept -> void {
    state_->cancelled.store(true, std::memory_order_release);
  }
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  // Sleeps in short slices; returns false if cancelled before `duration`.
  auto sleep_for(std::chrono::milliseconds duration) const -> bool {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!is_cancelled()) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return true;
      }
      std::this_thread::sleep_for(
          std::min<std::chrono::steady_clock::duration>(
              deadline - now, std::chrono::milliseconds(5)));
    }
    return false;
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken { return {}; }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {}

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace agency

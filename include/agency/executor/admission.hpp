#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>

namespace agency {

// Counting admission gate bounding how many tasks hold a slot at once.
class AdmissionGate {
public:
  class Slot {
  public:
    Slot() = default;
    Slot(Slot&& other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}
    auto operator=(Slot&& other) noexcept -> Slot& {
      if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
      }
      return *this;
    }
    Slot(const Slot&) = delete;
    auto operator=(const Slot&) -> Slot& = delete;
    ~Slot() { release(); }

    auto release() -> void {
      if (gate_) {
        gate_->release_one();
        gate_ = nullptr;
      }
    }
    [[nodiscard]] auto held() const noexcept -> bool { return gate_ != nullptr; }

  private:
    explicit Slot(AdmissionGate* gate) : gate_(gate) {}
    AdmissionGate* gate_{nullptr};
    friend class AdmissionGate;
  };

  explicit AdmissionGate(std::size_t capacity)
      : capacity_(std::max<std::size_t>(capacity, 1)) {}

  AdmissionGate(const AdmissionGate&) = delete;
  auto operator=(const AdmissionGate&) -> AdmissionGate& = delete;

  [[nodiscard]] auto acquire() -> Slot {
    std::unique_lock lock(mu_);
    ++waiting_;
    cv_.wait(lock, [this] { return in_use_ < capacity_; });
    --waiting_;
    take_locked();
    return Slot{this};
  }

  // Empty when no slot frees up before `deadline`.
  [[nodiscard]] auto acquire_until(std::chrono::steady_clock::time_point deadline)
      -> std::optional<Slot> {
    std::unique_lock lock(mu_);
    ++waiting_;
    bool got = cv_.wait_until(lock, deadline,
                              [this] { return in_use_ < capacity_; });
    --waiting_;
    if (!got) {
      return std::nullopt;
    }
    take_locked();
    return Slot{this};
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }
  [[nodiscard]] auto in_use() const -> std::size_t {
    std::lock_guard lock(mu_);
    return in_use_;
  }
  [[nodiscard]] auto peak() const -> std::size_t {
    std::lock_guard lock(mu_);
    return peak_;
  }
  [[nodiscard]] auto waiting() const -> std::size_t {
    std::lock_guard lock(mu_);
    return waiting_;
  }

private:
  auto take_locked() -> void {
    ++in_use_;
    peak_ = std::max(peak_, in_use_);
  }

  auto release_one() -> void {
    {
      std::lock_guard lock(mu_);
      --in_use_;
    }
    cv_.notify_one();
  }

  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::size_t in_use_{0};
  std::size_t peak_{0};
  std::size_t waiting_{0};
};

}  // namespace agency

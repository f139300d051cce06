#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace agency::util {

inline constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
inline constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

// MurmurHash3 64-bit finalizer
[[nodiscard]] inline constexpr auto murmur3_mix64(std::uint64_t h) noexcept
    -> std::uint64_t {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

[[nodiscard]] inline constexpr auto fnv1a64(std::string_view data,
                                            std::uint64_t seed = kFnvOffset) noexcept
    -> std::uint64_t {
  std::uint64_t h = seed;
  for (char c : data) {
    h ^= static_cast<unsigned char>(c);
    h *= kFnvPrime;
  }
  return h;
}

// Incremental content hasher; feed() order matters.
class Fingerprinter {
public:
  auto feed(std::string_view data) noexcept -> Fingerprinter& {
    state_ = fnv1a64(data, state_);
    // Length separator so ("ab","c") and ("a","bc") differ.
    state_ = murmur3_mix64(state_ ^ data.size());
    return *this;
  }

  auto feed(std::uint64_t value) noexcept -> Fingerprinter& {
    state_ = murmur3_mix64(state_ ^ murmur3_mix64(value + kFnvPrime));
    return *this;
  }

  [[nodiscard]] auto digest() const noexcept -> std::uint64_t { return state_; }

  [[nodiscard]] auto hex() const -> std::string {
    return std::format("{:016x}", state_);
  }

private:
  std::uint64_t state_{kFnvOffset};
};

}  // namespace agency::util

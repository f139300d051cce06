#pragma once

#include "agency/cache/lru_store.hpp"
#include "agency/cache/persistent_store.hpp"
#include "agency/cache/sweeper.hpp"
#include "agency/config/system_config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace agency {

// A prepared context blob plus the signature of the sources it came from.
struct ContextEntry {
  std::string source_path;
  std::string fingerprint;
  std::string content;
  std::size_t file_count{0};
  std::uint64_t source_bytes{0};
};

void to_json(nlohmann::json& j, const ContextEntry& e);
void from_json(const nlohmann::json& j, ContextEntry& e);

struct CacheMetrics {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t fast_hits{0};
  std::uint64_t persistent_hits{0};
  std::uint64_t stale_evictions{0};
  std::size_t fast_evictions{0};
  std::size_t persistent_evictions{0};
  std::size_t fast_entries{0};
  std::size_t fast_bytes{0};
  std::size_t persistent_entries{0};
  std::size_t persistent_bytes{0};
  double hit_rate{0.0};
  double average_lookup_ms{0.0};
};

// Two-tier cache: a bounded in-memory LRU in front of a persisted SQLite
// tier. Reads try the fast tier, then the persisted one (promoting hits);
// writes go to both. Keys are "<category>:<key>". Every operation is safe
// to call from concurrently running tasks. A miss is never an error.
class ResourceCache {
public:
  explicit ResourceCache(CacheConfig config);
  ~ResourceCache();

  ResourceCache(const ResourceCache&) = delete;
  ResourceCache& operator=(const ResourceCache&) = delete;

  // Opens the persisted tier (a failure only disables it) and starts the
  // sweeper when an interval is configured. Not concurrent with lookups.
  auto start() -> void;
  auto stop() -> void;

  // Returns the entry only if it was recorded with the same fingerprint;
  // a mismatch evicts the stale entry from both tiers and misses.
  [[nodiscard]] auto get_context(std::string_view source_path,
                                 std::string_view fingerprint)
      -> std::optional<ContextEntry>;
  auto put_context(const ContextEntry& entry) -> void;

  [[nodiscard]] auto get(std::string_view category, std::string_view key)
      -> std::optional<nlohmann::json>;
  auto set(std::string_view category, std::string_view key,
           nlohmann::json value,
           std::optional<std::chrono::milliseconds> ttl = std::nullopt)
      -> void;
  auto erase(std::string_view category, std::string_view key) -> void;
  // Empty category clears everything.
  auto clear(std::string_view category = {}) -> void;

  // Purges expired entries from both tiers; returns how many were dropped.
  auto sweep() -> std::size_t;

  [[nodiscard]] auto metrics() const -> CacheMetrics;
  [[nodiscard]] auto is_healthy() const -> bool;
  [[nodiscard]] auto persistent_enabled() const -> bool;
  [[nodiscard]] auto config() const noexcept -> const CacheConfig& {
    return config_;
  }

  [[nodiscard]] static auto context_key(std::string_view source_path)
      -> std::string;

  static constexpr std::string_view kContextCategory = "context";

private:
  enum class Tier : std::uint8_t { Fast, Persistent };
  struct Lookup {
    nlohmann::json value;
    Tier tier;
  };

  [[nodiscard]] auto lookup(const std::string& key) -> std::optional<Lookup>;
  auto store(const std::string& key, const nlohmann::json& value,
             std::optional<std::chrono::milliseconds> ttl) -> void;
  auto remove(const std::string& key) -> void;
  auto record_lookup(std::optional<Tier> hit,
                     std::chrono::steady_clock::duration elapsed) -> void;

  CacheConfig config_;
  mutable std::mutex mu_;
  LruStore<std::string, nlohmann::json> fast_;
  std::unique_ptr<PersistentStore> persistent_;

  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t fast_hits_{0};
  std::uint64_t persistent_hits_{0};
  std::uint64_t stale_evictions_{0};
  std::chrono::steady_clock::duration lookup_time_{};

  PeriodicSweeper sweeper_;
};

}  // namespace agency

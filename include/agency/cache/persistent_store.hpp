#pragma once

#include "agency/core/error.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace agency {

// The slower, larger cache tier: one SQLite table of serialized values with
// its own byte ceiling. Rows are evicted least-recently-accessed first.
// All timestamps are Unix milliseconds. Thread-safe.
class PersistentStore {
public:
  struct StoredEntry {
    std::string key;
    std::string value;
    std::size_t size{0};
    std::int64_t created_at{0};
    std::optional<std::int64_t> expires_at;
  };

  struct Stats {
    std::size_t entries{0};
    std::size_t bytes{0};
  };

  PersistentStore(std::string_view db_path, std::size_t max_bytes);
  ~PersistentStore();

  PersistentStore(const PersistentStore&) = delete;
  PersistentStore& operator=(const PersistentStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool;

  // Error::CacheMiss when absent or expired (expired rows are deleted).
  [[nodiscard]] auto get(std::string_view key, std::int64_t now_ms)
      -> Result<StoredEntry>;
  [[nodiscard]] auto put(std::string_view key, std::string_view value,
                         std::int64_t now_ms,
                         std::optional<std::int64_t> expires_at)
      -> Result<void>;
  [[nodiscard]] auto erase(std::string_view key) -> Result<void>;
  [[nodiscard]] auto erase_prefix(std::string_view prefix)
      -> Result<std::size_t>;
  [[nodiscard]] auto purge_expired(std::int64_t now_ms) -> Result<std::size_t>;
  [[nodiscard]] auto stats() -> Result<Stats>;
  [[nodiscard]] auto evictions() const noexcept -> std::size_t {
    return evictions_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto max_bytes() const noexcept -> std::size_t {
    return max_bytes_;
  }

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto total_bytes() -> Result<std::size_t>;
  [[nodiscard]] auto evict_to_fit(std::size_t incoming) -> Result<void>;
  [[nodiscard]] auto erase_locked(std::string_view key) -> Result<void>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {}
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {}
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* { return stmt_; }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::size_t max_bytes_;
  std::atomic<std::size_t> evictions_{0};
  mutable std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace agency

#include "agency/cache/persistent_store.hpp"

#include "agency/util/log.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <string>
#include <vector>

namespace agency {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  if (!p) {
    return {};
  }
  return std::string(p, static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

}  // namespace

auto PersistentStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db) {
    sqlite3_close(db);
  }
}

PersistentStore::Statement::~Statement() {
  reset();
}

auto PersistentStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

PersistentStore::PersistentStore(std::string_view db_path, std::size_t max_bytes)
    : db_path_(db_path), max_bytes_(max_bytes) {}

PersistentStore::~PersistentStore() {
  close();
}

auto PersistentStore::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  if (db_path_ != ":memory:") {
    auto parent = std::filesystem::path(db_path_).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
      std::filesystem::create_directories(parent, ec);
    }
    if (ec) {
      log::error("Failed to create cache directory {}: {}", parent.string(),
                 ec.message());
      return fail(Error::DatabaseOpenFailed);
    }
  }

  sqlite3* raw_db = nullptr;
  if (sqlite3_open(db_path_.c_str(), &raw_db) != SQLITE_OK) {
    log::error("Failed to open cache database: {}",
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::debug("Cache database opened: {}", db_path_);
  return ok();
}

auto PersistentStore::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto PersistentStore::is_open() const noexcept -> bool {
  std::lock_guard lock(mu_);
  return db_ != nullptr;
}

auto PersistentStore::create_tables() -> Result<void> {
  return execute(R"(
    CREATE TABLE IF NOT EXISTS cache_entries (
      key TEXT PRIMARY KEY,
      value TEXT NOT NULL,
      size INTEGER NOT NULL,
      created_at INTEGER NOT NULL,
      last_access INTEGER NOT NULL,
      expires_at INTEGER
    );

    CREATE INDEX IF NOT EXISTS idx_cache_entries_access
      ON cache_entries(last_access);
    CREATE INDEX IF NOT EXISTS idx_cache_entries_expires
      ON cache_entries(expires_at);
  )");
}

auto PersistentStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  if (sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg) !=
      SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto PersistentStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto PersistentStore::get(std::string_view key, std::int64_t now_ms)
    -> Result<StoredEntry> {
  std::lock_guard lock(mu_);
  auto result = prepare(
      "SELECT key, value, size, created_at, expires_at FROM cache_entries "
      "WHERE key = ?;");
  if (!result) {
    return std::unexpected(result.error());
  }
  Statement stmt(*result);
  bind_text(stmt.get(), 1, key);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return fail(Error::CacheMiss);
  }

  StoredEntry entry{
      .key = col_text(stmt.get(), 0),
      .value = col_text(stmt.get(), 1),
      .size = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 2)),
      .created_at = sqlite3_column_int64(stmt.get(), 3),
      .expires_at = std::nullopt,
  };
  if (sqlite3_column_type(stmt.get(), 4) != SQLITE_NULL) {
    entry.expires_at = sqlite3_column_int64(stmt.get(), 4);
  }
  stmt.reset();

  if (entry.expires_at && *entry.expires_at <= now_ms) {
    if (auto r = erase_locked(key); !r) {
      return std::unexpected(r.error());
    }
    return fail(Error::CacheMiss);
  }

  auto touch = prepare("UPDATE cache_entries SET last_access = ? WHERE key = ?;");
  if (!touch) {
    return std::unexpected(touch.error());
  }
  Statement touch_stmt(*touch);
  sqlite3_bind_int64(touch_stmt.get(), 1, now_ms);
  bind_text(touch_stmt.get(), 2, key);
  if (sqlite3_step(touch_stmt.get()) != SQLITE_DONE) {
    log::warn("Failed to update cache access time: {}",
              sqlite3_errmsg(db_.get()));
  }
  return entry;
}

auto PersistentStore::put(std::string_view key, std::string_view value,
                          std::int64_t now_ms,
                          std::optional<std::int64_t> expires_at)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto size = value.size() + key.size();
  if (size > max_bytes_) {
    return fail(Error::InvalidArgument);
  }

  if (auto r = erase_locked(key); !r) {
    return r;
  }
  if (auto r = evict_to_fit(size); !r) {
    return r;
  }

  auto result = prepare(
      "INSERT INTO cache_entries (key, value, size, created_at, last_access, "
      "expires_at) VALUES (?, ?, ?, ?, ?, ?);");
  if (!result) {
    return std::unexpected(result.error());
  }
  Statement stmt(*result);
  bind_text(stmt.get(), 1, key);
  bind_text(stmt.get(), 2, value);
  sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(size));
  sqlite3_bind_int64(stmt.get(), 4, now_ms);
  sqlite3_bind_int64(stmt.get(), 5, now_ms);
  if (expires_at) {
    sqlite3_bind_int64(stmt.get(), 6, *expires_at);
  } else {
    sqlite3_bind_null(stmt.get(), 6);
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to store cache entry: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto PersistentStore::erase(std::string_view key) -> Result<void> {
  std::lock_guard lock(mu_);
  return erase_locked(key);
}

auto PersistentStore::erase_locked(std::string_view key) -> Result<void> {
  auto result = prepare("DELETE FROM cache_entries WHERE key = ?;");
  if (!result) {
    return std::unexpected(result.error());
  }
  Statement stmt(*result);
  bind_text(stmt.get(), 1, key);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto PersistentStore::erase_prefix(std::string_view prefix)
    -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  auto result = prepare("DELETE FROM cache_entries WHERE substr(key, 1, ?) = ?;");
  if (!result) {
    return std::unexpected(result.error());
  }
  Statement stmt(*result);
  sqlite3_bind_int(stmt.get(), 1, static_cast<int>(prefix.size()));
  bind_text(stmt.get(), 2, prefix);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

auto PersistentStore::purge_expired(std::int64_t now_ms)
    -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  auto result = prepare(
      "DELETE FROM cache_entries WHERE expires_at IS NOT NULL AND "
      "expires_at <= ?;");
  if (!result) {
    return std::unexpected(result.error());
  }
  Statement stmt(*result);
  sqlite3_bind_int64(stmt.get(), 1, now_ms);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

auto PersistentStore::stats() -> Result<Stats> {
  std::lock_guard lock(mu_);
  auto result =
      prepare("SELECT COUNT(*), COALESCE(SUM(size), 0) FROM cache_entries;");
  if (!result) {
    return std::unexpected(result.error());
  }
  Statement stmt(*result);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  return Stats{
      .entries = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0)),
      .bytes = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 1)),
  };
}

auto PersistentStore::total_bytes() -> Result<std::size_t> {
  auto result = prepare("SELECT COALESCE(SUM(size), 0) FROM cache_entries;");
  if (!result) {
    return std::unexpected(result.error());
  }
  Statement stmt(*result);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

auto PersistentStore::evict_to_fit(std::size_t incoming) -> Result<void> {
  auto current = total_bytes();
  if (!current) {
    return std::unexpected(current.error());
  }
  if (*current + incoming <= max_bytes_) {
    return ok();
  }

  auto result = prepare(
      "SELECT key, size FROM cache_entries ORDER BY last_access ASC, "
      "created_at ASC;");
  if (!result) {
    return std::unexpected(result.error());
  }
  Statement stmt(*result);

  std::vector<std::string> victims;
  auto remaining = *current;
  while (remaining + incoming > max_bytes_ &&
         sqlite3_step(stmt.get()) == SQLITE_ROW) {
    victims.push_back(col_text(stmt.get(), 0));
    remaining -= static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 1));
  }
  stmt.reset();

  for (const auto& key : victims) {
    if (auto r = erase_locked(key); !r) {
      return r;
    }
  }
  evictions_ += victims.size();
  if (!victims.empty()) {
    log::debug("Persistent cache evicted {} entries", victims.size());
  }
  return ok();
}

}  // namespace agency

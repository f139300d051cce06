#include "agency/cache/resource_cache.hpp"

#include "agency/util/hash.hpp"
#include "agency/util/json.hpp"
#include "agency/util/log.hpp"
#include "agency/util/util.hpp"

#include <format>

namespace agency {

namespace {

constexpr std::size_t kEntryOverhead = 64;

auto entry_size(const std::string& key, const std::string& serialized)
    -> std::size_t {
  return serialized.size() + key.size() + kEntryOverhead;
}

auto make_key(std::string_view category, std::string_view key) -> std::string {
  return std::format("{}:{}", category, key);
}

auto now_ms() -> std::int64_t {
  return to_epoch_ms(std::chrono::system_clock::now());
}

}  // namespace

void to_json(nlohmann::json& j, const ContextEntry& e) {
  j = nlohmann::json{{"source_path", e.source_path},
                     {"fingerprint", e.fingerprint},
                     {"content", e.content},
                     {"file_count", e.file_count},
                     {"source_bytes", e.source_bytes}};
}

void from_json(const nlohmann::json& j, ContextEntry& e) {
  j.at("source_path").get_to(e.source_path);
  j.at("fingerprint").get_to(e.fingerprint);
  j.at("content").get_to(e.content);
  e.file_count = j.value("file_count", std::size_t{0});
  e.source_bytes = j.value("source_bytes", std::uint64_t{0});
}

ResourceCache::ResourceCache(CacheConfig config)
    : config_(std::move(config)),
      fast_({.max_entries = config_.max_entries,
             .max_bytes = config_.memory_max_bytes,
             .default_ttl = std::nullopt}) {}

ResourceCache::~ResourceCache() {
  stop();
}

auto ResourceCache::start() -> void {
  if (!config_.enabled) {
    return;
  }
  if (!persistent_ && !config_.db_file.empty()) {
    auto store = std::make_unique<PersistentStore>(
        config_.db_file, config_.persistent_max_bytes);
    if (auto r = store->open(); r) {
      persistent_ = std::move(store);
    } else {
      log::warn("Persistent cache tier disabled ({}): {}", config_.db_file,
                r.error().message());
    }
  }
  sweeper_.start(config_.sweep_interval, [this] {
    if (auto n = sweep(); n > 0) {
      log::debug("Cache sweep purged {} expired entries", n);
    }
  });
}

auto ResourceCache::stop() -> void {
  sweeper_.stop();
}

auto ResourceCache::context_key(std::string_view source_path) -> std::string {
  return std::format("{:016x}", util::fnv1a64(source_path));
}

auto ResourceCache::get_context(std::string_view source_path,
                                std::string_view fingerprint)
    -> std::optional<ContextEntry> {
  if (!config_.enabled) {
    return std::nullopt;
  }
  auto started = std::chrono::steady_clock::now();
  auto key = make_key(kContextCategory, context_key(source_path));

  auto found = lookup(key);
  if (!found) {
    record_lookup(std::nullopt, std::chrono::steady_clock::now() - started);
    return std::nullopt;
  }

  ContextEntry entry;
  try {
    entry = found->value.get<ContextEntry>();
  } catch (const nlohmann::json::exception& e) {
    log::warn("Dropping malformed context cache entry {}: {}", key, e.what());
    remove(key);
    record_lookup(std::nullopt, std::chrono::steady_clock::now() - started);
    return std::nullopt;
  }

  if (entry.fingerprint != fingerprint || entry.source_path != source_path) {
    log::debug("Context cache entry for {} is stale", source_path);
    remove(key);
    {
      std::lock_guard lock(mu_);
      ++stale_evictions_;
    }
    record_lookup(std::nullopt, std::chrono::steady_clock::now() - started);
    return std::nullopt;
  }

  record_lookup(found->tier, std::chrono::steady_clock::now() - started);
  return entry;
}

auto ResourceCache::put_context(const ContextEntry& entry) -> void {
  if (!config_.enabled) {
    return;
  }
  store(make_key(kContextCategory, context_key(entry.source_path)),
        nlohmann::json(entry), std::nullopt);
}

auto ResourceCache::get(std::string_view category, std::string_view key)
    -> std::optional<nlohmann::json> {
  if (!config_.enabled) {
    return std::nullopt;
  }
  auto started = std::chrono::steady_clock::now();
  auto found = lookup(make_key(category, key));
  record_lookup(found ? std::optional{found->tier} : std::nullopt,
                std::chrono::steady_clock::now() - started);
  if (!found) {
    return std::nullopt;
  }
  return std::move(found->value);
}

auto ResourceCache::set(std::string_view category, std::string_view key,
                        nlohmann::json value,
                        std::optional<std::chrono::milliseconds> ttl) -> void {
  if (!config_.enabled) {
    return;
  }
  store(make_key(category, key), value, ttl);
}

auto ResourceCache::erase(std::string_view category, std::string_view key)
    -> void {
  remove(make_key(category, key));
}

auto ResourceCache::clear(std::string_view category) -> void {
  std::string prefix = category.empty() ? std::string{}
                                        : std::format("{}:", category);
  {
    std::lock_guard lock(mu_);
    if (prefix.empty()) {
      fast_.clear();
    } else {
      fast_.erase_if([&](const auto& entry) {
        return entry.key.starts_with(prefix);
      });
    }
  }
  if (persistent_) {
    if (auto r = persistent_->erase_prefix(prefix); !r) {
      log::warn("Failed to clear persistent cache: {}", r.error().message());
    }
  }
}

auto ResourceCache::sweep() -> std::size_t {
  std::size_t purged = 0;
  {
    std::lock_guard lock(mu_);
    purged += fast_.purge_expired();
  }
  if (persistent_) {
    if (auto r = persistent_->purge_expired(now_ms()); r) {
      purged += *r;
    } else {
      log::warn("Persistent cache sweep failed: {}", r.error().message());
    }
  }
  return purged;
}

auto ResourceCache::metrics() const -> CacheMetrics {
  CacheMetrics m;
  {
    std::lock_guard lock(mu_);
    m.hits = hits_;
    m.misses = misses_;
    m.fast_hits = fast_hits_;
    m.persistent_hits = persistent_hits_;
    m.stale_evictions = stale_evictions_;
    m.fast_evictions = fast_.evictions();
    m.fast_entries = fast_.size();
    m.fast_bytes = fast_.bytes();
    auto lookups = hits_ + misses_;
    if (lookups > 0) {
      m.hit_rate = static_cast<double>(hits_) / static_cast<double>(lookups);
      m.average_lookup_ms =
          std::chrono::duration<double, std::milli>(lookup_time_).count() /
          static_cast<double>(lookups);
    }
  }
  if (persistent_) {
    m.persistent_evictions = persistent_->evictions();
    if (auto stats = persistent_->stats(); stats) {
      m.persistent_entries = stats->entries;
      m.persistent_bytes = stats->bytes;
    }
  }
  return m;
}

auto ResourceCache::is_healthy() const -> bool {
  auto m = metrics();
  if (m.hits + m.misses < 10) {
    return true;
  }
  return m.hit_rate > 0.3 && m.average_lookup_ms < 100.0;
}

auto ResourceCache::persistent_enabled() const -> bool {
  return persistent_ && persistent_->is_open();
}

auto ResourceCache::lookup(const std::string& key) -> std::optional<Lookup> {
  {
    std::lock_guard lock(mu_);
    if (auto* value = fast_.get(key)) {
      return Lookup{.value = *value, .tier = Tier::Fast};
    }
  }
  if (!persistent_) {
    return std::nullopt;
  }

  auto now = now_ms();
  auto stored = persistent_->get(key, now);
  if (!stored) {
    if (stored.error() != make_error_code(Error::CacheMiss)) {
      log::warn("Persistent cache read failed: {}", stored.error().message());
    }
    return std::nullopt;
  }

  auto value = nlohmann::json::parse(stored->value, nullptr, false);
  if (value.is_discarded()) {
    log::warn("Dropping unparsable persistent cache entry {}", key);
    remove(key);
    return std::nullopt;
  }

  std::optional<LruStore<std::string, nlohmann::json>::Clock::duration> ttl;
  if (stored->expires_at) {
    ttl = std::chrono::milliseconds(*stored->expires_at - now);
  }
  {
    std::lock_guard lock(mu_);
    fast_.put(key, value, entry_size(key, stored->value), ttl);
  }
  return Lookup{.value = std::move(value), .tier = Tier::Persistent};
}

auto ResourceCache::store(const std::string& key, const nlohmann::json& value,
                          std::optional<std::chrono::milliseconds> ttl)
    -> void {
  auto serialized = dump_json(value);
  auto effective_ttl = ttl ? *ttl : config_.ttl;
  std::optional<LruStore<std::string, nlohmann::json>::Clock::duration> fast_ttl;
  if (effective_ttl > std::chrono::milliseconds::zero()) {
    fast_ttl = effective_ttl;
  }
  {
    std::lock_guard lock(mu_);
    if (!fast_.put(key, value, entry_size(key, serialized), fast_ttl)) {
      log::debug("Cache entry {} exceeds the in-memory ceiling", key);
    }
  }
  if (persistent_) {
    auto now = now_ms();
    std::optional<std::int64_t> expires_at;
    if (effective_ttl > std::chrono::milliseconds::zero()) {
      expires_at = now + effective_ttl.count();
    }
    if (auto r = persistent_->put(key, serialized, now, expires_at); !r) {
      log::warn("Persistent cache write failed for {}: {}", key,
                r.error().message());
    }
  }
}

auto ResourceCache::remove(const std::string& key) -> void {
  {
    std::lock_guard lock(mu_);
    fast_.erase(key);
  }
  if (persistent_) {
    if (auto r = persistent_->erase(key); !r) {
      log::warn("Persistent cache erase failed for {}: {}", key,
                r.error().message());
    }
  }
}

auto ResourceCache::record_lookup(std::optional<Tier> hit,
                                  std::chrono::steady_clock::duration elapsed)
    -> void {
  std::lock_guard lock(mu_);
  lookup_time_ += elapsed;
  if (!hit) {
    ++misses_;
    return;
  }
  ++hits_;
  if (*hit == Tier::Fast) {
    ++fast_hits_;
  } else {
    ++persistent_hits_;
  }
}

}  // namespace agency

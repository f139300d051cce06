#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace agency {

// Count-, byte- and TTL-bounded LRU map. Not synchronized: owners lock.
//
// Inserting evicts least-recently-used entries until the new entry fits, so
// size() <= max_entries and bytes() <= max_bytes hold after every call. An
// entry larger than max_bytes is refused.
template <typename K, typename V, typename Hash = std::hash<K>>
class LruStore {
public:
  using Clock = std::chrono::steady_clock;

  struct Limits {
    std::size_t max_entries{1000};
    std::size_t max_bytes{50 * 1024 * 1024};
    std::optional<Clock::duration> default_ttl;
  };

  struct Entry {
    K key;
    V value;
    std::size_t size{0};
    Clock::time_point inserted;
    std::optional<Clock::time_point> expires;
  };

  explicit LruStore(Limits limits) : limits_(limits) {}

  auto put(K key, V value, std::size_t size,
           std::optional<Clock::duration> ttl = std::nullopt,
           Clock::time_point now = Clock::now()) -> bool {
    erase(key);
    if (size > limits_.max_bytes || limits_.max_entries == 0) {
      return false;
    }
    while (!order_.empty() && (order_.size() + 1 > limits_.max_entries ||
                               bytes_ + size > limits_.max_bytes)) {
      pop_lru();
      ++evictions_;
    }

    std::optional<Clock::time_point> expires;
    if (auto effective = ttl ? ttl : limits_.default_ttl) {
      expires = now + *effective;
    }
    order_.push_front(Entry{.key = key,
                            .value = std::move(value),
                            .size = size,
                            .inserted = now,
                            .expires = expires});
    index_.emplace(std::move(key), order_.begin());
    bytes_ += size;
    return true;
  }

  // Marks the entry most recently used. Expired entries are dropped.
  [[nodiscard]] auto get(const K& key, Clock::time_point now = Clock::now())
      -> V* {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    if (is_expired(*it->second, now)) {
      remove(it);
      ++expirations_;
      return nullptr;
    }
    order_.splice(order_.begin(), order_, it->second);
    return &it->second->value;
  }

  [[nodiscard]] auto peek(const K& key) const -> const Entry* {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &*it->second;
  }

  auto erase(const K& key) -> bool {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return false;
    }
    remove(it);
    return true;
  }

  template <typename Pred>
  auto erase_if(Pred pred) -> std::size_t {
    std::size_t removed = 0;
    for (auto it = order_.begin(); it != order_.end();) {
      if (pred(*it)) {
        bytes_ -= it->size;
        index_.erase(it->key);
        it = order_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  auto purge_expired(Clock::time_point now = Clock::now()) -> std::size_t {
    auto removed =
        erase_if([&](const Entry& e) { return is_expired(e, now); });
    expirations_ += removed;
    return removed;
  }

  // Drops up to n entries from the least-recently-used end.
  auto evict_oldest(std::size_t n) -> std::size_t {
    std::size_t removed = 0;
    while (removed < n && !order_.empty()) {
      pop_lru();
      ++removed;
    }
    evictions_ += removed;
    return removed;
  }

  auto clear() -> void {
    order_.clear();
    index_.clear();
    bytes_ = 0;
  }

  // Most recently used first.
  template <typename Fn>
  auto for_each(Fn&& fn) const -> void {
    for (const auto& entry : order_) {
      fn(entry);
    }
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return order_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return order_.empty(); }
  [[nodiscard]] auto bytes() const noexcept -> std::size_t { return bytes_; }
  [[nodiscard]] auto limits() const noexcept -> const Limits& {
    return limits_;
  }
  [[nodiscard]] auto evictions() const noexcept -> std::size_t {
    return evictions_;
  }
  [[nodiscard]] auto expirations() const noexcept -> std::size_t {
    return expirations_;
  }

private:
  using Iter = typename std::list<Entry>::iterator;

  static auto is_expired(const Entry& e, Clock::time_point now) -> bool {
    return e.expires && *e.expires <= now;
  }

  auto remove(typename std::unordered_map<K, Iter, Hash>::iterator it)
      -> void {
    bytes_ -= it->second->size;
    order_.erase(it->second);
    index_.erase(it);
  }

  auto pop_lru() -> void {
    auto& victim = order_.back();
    bytes_ -= victim.size;
    index_.erase(victim.key);
    order_.pop_back();
  }

  Limits limits_;
  std::list<Entry> order_;
  std::unordered_map<K, Iter, Hash> index_;
  std::size_t bytes_{0};
  std::size_t evictions_{0};
  std::size_t expirations_{0};
};

}  // namespace agency

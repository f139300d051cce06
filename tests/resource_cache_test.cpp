#include "agency/cache/resource_cache.hpp"

#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agency;
using namespace std::chrono_literals;

class ResourceCacheTest : public ::testing::Test {
protected:
  static auto memory_config() -> CacheConfig {
    CacheConfig config;
    config.db_file = ":memory:";
    config.sweep_interval = 0ms;
    return config;
  }

  static auto context(std::string fingerprint, std::string content)
      -> ContextEntry {
    return ContextEntry{.source_path = "/work/docs",
                        .fingerprint = std::move(fingerprint),
                        .content = std::move(content),
                        .file_count = 2,
                        .source_bytes = 42};
  }
};

TEST_F(ResourceCacheTest, MissIsNotAnError) {
  ResourceCache cache(memory_config());
  cache.start();

  EXPECT_FALSE(cache.get("analysis", "nothing").has_value());
  EXPECT_FALSE(cache.get_context("/work/docs", "abc").has_value());

  auto m = cache.metrics();
  EXPECT_EQ(m.hits, 0);
  EXPECT_EQ(m.misses, 2);
}

TEST_F(ResourceCacheTest, ContextHitRequiresSameFingerprint) {
  ResourceCache cache(memory_config());
  cache.start();
  cache.put_context(context("fp-1", "### a.md\nbody"));

  auto hit = cache.get_context("/work/docs", "fp-1");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->content, "### a.md\nbody");
  EXPECT_EQ(hit->file_count, 2);
  EXPECT_EQ(hit->source_bytes, 42);

  // Source changed: the stale entry is dropped, not served.
  EXPECT_FALSE(cache.get_context("/work/docs", "fp-2").has_value());
  EXPECT_FALSE(cache.get_context("/work/docs", "fp-1").has_value());
  EXPECT_EQ(cache.metrics().stale_evictions, 1);
}

TEST_F(ResourceCacheTest, CategoryGetSetEraseClear) {
  ResourceCache cache(memory_config());
  cache.start();

  cache.set("analysis", "repo", nlohmann::json{{"files", 3}});
  cache.set("agent", "reviewer", "ready");

  auto v = cache.get("analysis", "repo");
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ((*v)["files"].get<int>(), 3);
  auto ready = cache.get("agent", "reviewer");
  ASSERT_TRUE(ready.has_value());
  EXPECT_EQ(ready->get<std::string>(), "ready");

  cache.erase("agent", "reviewer");
  EXPECT_FALSE(cache.get("agent", "reviewer").has_value());

  cache.set("agent", "writer", 1);
  cache.clear("analysis");
  EXPECT_FALSE(cache.get("analysis", "repo").has_value());
  EXPECT_TRUE(cache.get("agent", "writer").has_value());

  cache.clear();
  EXPECT_FALSE(cache.get("agent", "writer").has_value());
}

TEST_F(ResourceCacheTest, InvalidUtf8ContextIsStored) {
  ResourceCache cache(memory_config());
  cache.start();
  cache.put_context(context("fp-1", "### notes.md\ncaf\xe9 \xc3"));

  auto hit = cache.get_context("/work/docs", "fp-1");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->content, "### notes.md\ncaf\xe9 \xc3");
  EXPECT_EQ(cache.metrics().persistent_entries, 1);
}

TEST_F(ResourceCacheTest, PersistentTierServesEntriesEvictedFromMemory) {
  auto config = memory_config();
  config.max_entries = 1;
  ResourceCache cache(config);
  cache.start();
  ASSERT_TRUE(cache.persistent_enabled());

  cache.set("analysis", "a", "first");
  cache.set("analysis", "b", "second");

  auto a = cache.get("analysis", "a");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->get<std::string>(), "first");

  auto m = cache.metrics();
  EXPECT_EQ(m.persistent_hits, 1);
  EXPECT_EQ(m.fast_entries, 1);
  EXPECT_GE(m.fast_evictions, 1);
  EXPECT_EQ(m.persistent_entries, 2);
}

TEST_F(ResourceCacheTest, WithoutPersistentTierMemoryStillWorks) {
  auto config = memory_config();
  config.db_file.clear();
  ResourceCache cache(config);
  cache.start();

  EXPECT_FALSE(cache.persistent_enabled());
  cache.set("analysis", "k", 7);
  auto v = cache.get("analysis", "k");
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->get<int>(), 7);
  EXPECT_EQ(cache.metrics().fast_hits, 1);
}

TEST_F(ResourceCacheTest, ExpiredEntriesMissAndSweep) {
  ResourceCache cache(memory_config());
  cache.start();

  cache.set("analysis", "short", 1, 1ms);
  cache.set("analysis", "long", 2, 60s);
  test::sleep_ms(20ms);

  EXPECT_FALSE(cache.get("analysis", "short").has_value());
  EXPECT_TRUE(cache.get("analysis", "long").has_value());

  cache.set("analysis", "short2", 3, 1ms);
  test::sleep_ms(20ms);
  EXPECT_GE(cache.sweep(), 1);
}

TEST_F(ResourceCacheTest, DisabledCacheNeverHits) {
  auto config = memory_config();
  config.enabled = false;
  ResourceCache cache(config);
  cache.start();

  cache.set("analysis", "k", 1);
  EXPECT_FALSE(cache.get("analysis", "k").has_value());
}

TEST_F(ResourceCacheTest, HitRateAndHealth) {
  ResourceCache cache(memory_config());
  cache.start();
  cache.set("analysis", "k", 1);

  for (int i = 0; i < 9; ++i) {
    (void)cache.get("analysis", "k");
  }
  (void)cache.get("analysis", "missing");

  auto m = cache.metrics();
  EXPECT_EQ(m.hits, 9);
  EXPECT_EQ(m.misses, 1);
  EXPECT_DOUBLE_EQ(m.hit_rate, 0.9);
  EXPECT_TRUE(cache.is_healthy());
}

TEST_F(ResourceCacheTest, ConcurrentAccess) {
  ResourceCache cache(memory_config());
  cache.start();

  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&cache, t] {
        for (int i = 0; i < 100; ++i) {
          auto key = std::format("{}-{}", t, i % 10);
          cache.set("stress", key, i);
          (void)cache.get("stress", key);
        }
      });
    }
  }
  auto m = cache.metrics();
  EXPECT_EQ(m.hits + m.misses, 400);
  EXPECT_EQ(m.fast_entries, 40);
}

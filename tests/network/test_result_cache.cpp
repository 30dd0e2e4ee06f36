/*
 * test_result_cache.cpp - Tests for the command output cache
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "network/result_cache.hpp"

using namespace netfleet::network;
using netfleet::config::CacheConfig;
using namespace std::chrono_literals;

class ResultCacheTest : public ::testing::Test {
protected:
    ResultCache cache_{CacheConfig{}};
};

// ============================================================================
// Cacheability
// ============================================================================

TEST_F(ResultCacheTest, KeywordDecidesCacheability) {
    EXPECT_TRUE(cache_.isCacheable("show version"));
    EXPECT_TRUE(cache_.isCacheable("show INVENTORY"));
    EXPECT_TRUE(cache_.isCacheable("show logging last 10"));
    EXPECT_FALSE(cache_.isCacheable("show ip route"));
}

TEST_F(ResultCacheTest, NonCacheableCommandIsNotStored) {
    EXPECT_FALSE(cache_.put("10.0.0.1", "show ip route", "routes"));
    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_FALSE(cache_.get("10.0.0.1", "show ip route").has_value());
}

// ============================================================================
// Get / Put
// ============================================================================

TEST_F(ResultCacheTest, HitAfterPut) {
    ASSERT_TRUE(cache_.put("10.0.0.1", "show version", "IOS XE 17.9"));
    auto hit = cache_.get("10.0.0.1", "show version");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "IOS XE 17.9");

    auto stats = cache_.statistics();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.inserts, 1u);
}

TEST_F(ResultCacheTest, KeyIncludesDevice) {
    cache_.put("10.0.0.1", "show version", "A");
    EXPECT_FALSE(cache_.get("10.0.0.2", "show version").has_value());
    EXPECT_EQ(cache_.statistics().misses, 1u);
}

TEST(ResultCacheExpiryTest, ExpiredEntryIsMiss) {
    CacheConfig config;
    config.ttlSeconds = 0;
    ResultCache cache(config);

    cache.put("10.0.0.1", "show version", "A");
    EXPECT_FALSE(cache.get("10.0.0.1", "show version").has_value());
    EXPECT_EQ(cache.statistics().expirations, 1u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(ResultCacheCapacityTest, OldestEntryEvictedWhenFull) {
    CacheConfig config;
    config.maxEntries = 2;
    ResultCache cache(config);

    cache.put("10.0.0.1", "show version", "A");
    std::this_thread::sleep_for(2ms);
    cache.put("10.0.0.2", "show version", "B");
    std::this_thread::sleep_for(2ms);
    cache.put("10.0.0.3", "show version", "C");

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.get("10.0.0.1", "show version").has_value());
    EXPECT_TRUE(cache.get("10.0.0.3", "show version").has_value());
}

// ============================================================================
// Invalidation
// ============================================================================

TEST_F(ResultCacheTest, InvalidateDropsOnlyThatDevice) {
    cache_.put("10.0.0.1", "show version", "A");
    cache_.put("10.0.0.1", "show inventory", "A-inv");
    cache_.put("10.0.0.2", "show version", "B");

    cache_.invalidate("10.0.0.1");

    EXPECT_FALSE(cache_.get("10.0.0.1", "show version").has_value());
    EXPECT_FALSE(cache_.get("10.0.0.1", "show inventory").has_value());
    EXPECT_TRUE(cache_.get("10.0.0.2", "show version").has_value());
}

TEST_F(ResultCacheTest, InvalidateBumpsGeneration) {
    auto before = cache_.generation("10.0.0.1");
    cache_.invalidate("10.0.0.1");
    EXPECT_EQ(cache_.generation("10.0.0.1"), before + 1);
    EXPECT_EQ(cache_.generation("10.0.0.2"), 0u);
}

TEST_F(ResultCacheTest, StalePutAfterInvalidateIsRejected) {
    // Output fetched under generation 0, connection evicted meanwhile.
    auto generation = cache_.generation("10.0.0.1");
    cache_.invalidate("10.0.0.1");

    EXPECT_FALSE(cache_.put("10.0.0.1", "show version", "old", generation));
    EXPECT_FALSE(cache_.get("10.0.0.1", "show version").has_value());
    EXPECT_EQ(cache_.statistics().rejectedStale, 1u);

    EXPECT_TRUE(cache_.put("10.0.0.1", "show version", "fresh",
                           cache_.generation("10.0.0.1")));
}

TEST_F(ResultCacheTest, ClearEmptiesCache) {
    cache_.put("10.0.0.1", "show version", "A");
    cache_.clear();
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(ResultCacheTest, StatisticsJson) {
    cache_.put("10.0.0.1", "show version", "A");
    cache_.get("10.0.0.1", "show version");
    auto j = cache_.statistics().toJson();
    EXPECT_EQ(j["hits"], 1);
    EXPECT_EQ(j["inserts"], 1);
    EXPECT_TRUE(j.contains("rejected_stale"));
}

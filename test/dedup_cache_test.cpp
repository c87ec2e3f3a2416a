#include <stdexcept>

#include <gtest/gtest.h>

#include "relaydeck/pool/dedup_cache.hpp"

using namespace relaydeck::pool;
using namespace std;
using namespace ::testing;

TEST(DedupCacheTest, MarkSeen_ReturnsTrue_OnlyTheFirstTime)
{
    DedupCache cache(4);

    ASSERT_TRUE(cache.markSeen("a"));
    ASSERT_FALSE(cache.markSeen("a"));
    ASSERT_TRUE(cache.contains("a"));
    ASSERT_EQ(cache.size(), 1);
}

TEST(DedupCacheTest, MarkSeen_Evicts_LeastRecentlySeen)
{
    DedupCache cache(2);

    cache.markSeen("a");
    cache.markSeen("b");
    cache.markSeen("c");

    ASSERT_FALSE(cache.contains("a"));
    ASSERT_TRUE(cache.contains("b"));
    ASSERT_TRUE(cache.contains("c"));
    ASSERT_EQ(cache.size(), 2);
}

TEST(DedupCacheTest, MarkSeen_RefreshesRecency_OfDuplicates)
{
    DedupCache cache(2);

    cache.markSeen("a");
    cache.markSeen("b");
    cache.markSeen("a");
    cache.markSeen("c");

    ASSERT_TRUE(cache.contains("a"));
    ASSERT_FALSE(cache.contains("b"));
}

TEST(DedupCacheTest, EvictedIds_AreNewAgain)
{
    DedupCache cache(1);

    cache.markSeen("a");
    cache.markSeen("b");

    ASSERT_TRUE(cache.markSeen("a"));
}

TEST(DedupCacheTest, Constructor_Throws_ForZeroCapacity)
{
    ASSERT_THROW(DedupCache(0), invalid_argument);
}

/**
 * @file AttenuationCache_test.cpp
 * @brief Tests for the lattice attenuation cache and scratch buffer pool.
 */

#include "core/AttenuationCache.h"
#include "core/DecayGrid.h"
#include "core/ScratchBufferPool.h"
#include "core/SweepEngine.h"
#include <gtest/gtest.h>
#include <thread>
#include <utility>
#include <vector>

using namespace SweepLight;

namespace {

AttenuationKey keyAt(int x, int y, uint64_t revision = 1)
{
    return AttenuationKey{
        .x = x, .y = y, .width = 8, .height = 8, .revision = revision, .decay_rate = 1.0f,
    };
}

} // namespace

TEST(AttenuationCacheTest, FindMissesThenHits)
{
    AttenuationCache cache(4);
    EXPECT_EQ(cache.find(keyAt(1, 1)), nullptr);

    cache.insert(keyAt(1, 1), AttenuationGrid(8, 8, 0.5f));
    auto found = cache.find(keyAt(1, 1));
    ASSERT_NE(found, nullptr);
    EXPECT_FLOAT_EQ(found->at(3, 3), 0.5f);

    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.hits(), 1u);
}

TEST(AttenuationCacheTest, RevisionIsPartOfKey)
{
    AttenuationCache cache(4);
    cache.insert(keyAt(2, 2, 10), AttenuationGrid(8, 8, 1.0f));
    EXPECT_EQ(cache.find(keyAt(2, 2, 11)), nullptr);
    EXPECT_NE(cache.find(keyAt(2, 2, 10)), nullptr);
}

TEST(AttenuationCacheTest, EvictsOldestFirst)
{
    AttenuationCache cache(2);
    cache.insert(keyAt(0, 0), AttenuationGrid(8, 8));
    cache.insert(keyAt(1, 0), AttenuationGrid(8, 8));
    cache.insert(keyAt(2, 0), AttenuationGrid(8, 8));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.find(keyAt(0, 0)), nullptr);
    EXPECT_NE(cache.find(keyAt(1, 0)), nullptr);
    EXPECT_NE(cache.find(keyAt(2, 0)), nullptr);
}

TEST(AttenuationCacheTest, EvictedGridStaysValidForHolder)
{
    AttenuationCache cache(1);
    auto held = cache.insert(keyAt(0, 0), AttenuationGrid(8, 8, 0.25f));
    cache.insert(keyAt(1, 0), AttenuationGrid(8, 8));
    cache.clear();

    ASSERT_NE(held, nullptr);
    EXPECT_FLOAT_EQ(held->at(0, 0), 0.25f);
}

TEST(AttenuationCacheTest, ZeroCapacityStoresNothing)
{
    AttenuationCache cache(0);
    auto grid = cache.insert(keyAt(0, 0), AttenuationGrid(8, 8));
    EXPECT_NE(grid, nullptr);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(AttenuationCacheTest, GetOrComputeRunsComputeOnce)
{
    AttenuationCache cache(8);
    SweepEngine engine;
    DecayGrid grid(8, 8, 0.3f);
    auto field = engine.prepare(grid);
    ASSERT_TRUE(field.isValue());

    int computed = 0;
    auto compute = [&]() {
        computed++;
        return engine.sweep(field.value(), 4, 4);
    };
    const auto key = AttenuationKey::forSource(field.value(), 4, 4);

    auto first = cache.getOrCompute(key, compute);
    auto second = cache.getOrCompute(key, compute);
    ASSERT_TRUE(first.isValue());
    ASSERT_TRUE(second.isValue());
    EXPECT_EQ(computed, 1);
    EXPECT_EQ(first.value(), second.value());
}

TEST(AttenuationCacheTest, GetOrComputePropagatesErrors)
{
    AttenuationCache cache(8);
    auto result = cache.getOrCompute(keyAt(9, 9), []() {
        return Result<AttenuationGrid, LightingError>::error(LightingError::outOfBounds("nope"));
    });
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, LightingError::Code::OutOfBounds);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(AttenuationCacheTest, ConcurrentAccessIsSafe)
{
    AttenuationCache cache(64);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache]() {
            for (int i = 0; i < 200; ++i) {
                const auto key = keyAt(i % 16, 0);
                if (!cache.find(key)) {
                    cache.insert(key, AttenuationGrid(8, 8, 1.0f));
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(cache.size(), 16u);
}

TEST(ScratchBufferPoolTest, LeaseIsFilledAndReturned)
{
    ScratchBufferPool pool;
    {
        auto lease = pool.acquire(10, 0.5f);
        ASSERT_TRUE(lease.isValid());
        EXPECT_EQ(lease.size(), 10u);
        lease.buffer()[3] = 9.0f;
        EXPECT_EQ(pool.outstandingCount(), 1u);
    }
    EXPECT_EQ(pool.outstandingCount(), 0u);
    EXPECT_EQ(pool.idleCount(), 1u);

    // The recycled buffer must not leak the previous caller's data.
    auto again = pool.acquire(10, 0.0f);
    for (float v : again.buffer()) {
        EXPECT_EQ(v, 0.0f);
    }
}

TEST(ScratchBufferPoolTest, ConcurrentLeasesAreDistinct)
{
    ScratchBufferPool pool;
    auto a = pool.acquire(4);
    auto b = pool.acquire(4);
    EXPECT_NE(a.data(), b.data());
    EXPECT_EQ(pool.outstandingCount(), 2u);
}

TEST(ScratchBufferPoolTest, MovedLeaseReturnsOnce)
{
    ScratchBufferPool pool;
    {
        auto a = pool.acquire(4);
        ScratchBufferPool::Lease b = std::move(a);
        EXPECT_FALSE(a.isValid());
        EXPECT_TRUE(b.isValid());
    }
    EXPECT_EQ(pool.outstandingCount(), 0u);
    EXPECT_EQ(pool.idleCount(), 1u);
}

TEST(ScratchBufferPoolTest, RetainsAtMostConfiguredBuffers)
{
    ScratchBufferPool pool(1);
    {
        auto a = pool.acquire(4);
        auto b = pool.acquire(4);
    }
    EXPECT_EQ(pool.idleCount(), 1u);
}

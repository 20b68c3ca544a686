#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/pool/flat_object_pool.h"

#include <random>
#include <string>

using namespace Recpool;

class FlatObjectPoolTest : public ::testing::Test {
protected:
    FlatObjectPool<int> pool_{100, 10};
};

TEST_F(FlatObjectPoolTest, Creation) {
    EXPECT_EQ(pool_.BufferSize(), 100u);
    EXPECT_EQ(pool_.RangeCapacity(), 10u);
    EXPECT_EQ(pool_.Watermark(), 0u);
    EXPECT_EQ(pool_.AvailableCount(), 0u);
}

TEST_F(FlatObjectPoolTest, AcquireBumpsWatermark) {
    Range r = pool_.Acquire(10);
    EXPECT_EQ(r.begin, 0u);
    EXPECT_EQ(r.end, 10u);
    EXPECT_EQ(r.Size(), 10u);
    EXPECT_EQ(pool_.Watermark(), 10u);
}

TEST_F(FlatObjectPoolTest, ReleaseAddsFreeRange) {
    Range r = pool_.Acquire(10);
    EXPECT_EQ(pool_.AvailableCount(), 0u);

    pool_.Release(r);
    EXPECT_EQ(pool_.AvailableCount(), 1u);
}

TEST(FlatObjectPoolReuseTest, ReleasedRangeIsReusedWithoutGrowingWatermark) {
    FlatObjectPool<int> pool(1000, 10);

    Range first = pool.Acquire(50);
    EXPECT_EQ(first, (Range{0, 50}));

    pool.Release(0, 50);
    Range second = pool.Acquire(50);

    EXPECT_EQ(second, (Range{0, 50}));
    EXPECT_EQ(pool.Watermark(), 50u);
    EXPECT_EQ(pool.AvailableCount(), 0u);
}

TEST_F(FlatObjectPoolTest, PartialReuseKeepsRemainder) {
    Range big = pool_.Acquire(20);
    pool_.Release(big);

    Range small = pool_.Acquire(10);
    EXPECT_EQ(small.begin, big.begin);
    EXPECT_EQ(small.Size(), 10u);

    // Leftover [10, 20) stays on the free list in the same slot
    EXPECT_EQ(pool_.AvailableCount(), 1u);
    Range rest = pool_.Acquire(10);
    EXPECT_EQ(rest, (Range{10, 20}));
    EXPECT_EQ(pool_.AvailableCount(), 0u);
    EXPECT_EQ(pool_.Watermark(), 20u);
}

TEST_F(FlatObjectPoolTest, FirstFitFollowsInsertionOrder) {
    Range a = pool_.Acquire(5);
    Range b = pool_.Acquire(30);
    Range c = pool_.Acquire(20);
    (void)a;

    pool_.Release(c);
    pool_.Release(b);

    // c was released first and is large enough, so it is picked over b
    Range r = pool_.Acquire(15);
    EXPECT_EQ(r.begin, c.begin);

    // Only b can hold 25
    Range r2 = pool_.Acquire(25);
    EXPECT_EQ(r2.begin, b.begin);
}

TEST_F(FlatObjectPoolTest, TooLargeForFreeRangesFallsBackToBump) {
    Range r = pool_.Acquire(5);
    pool_.Release(r);

    Range big = pool_.Acquire(8);
    EXPECT_EQ(big, (Range{5, 13}));
    EXPECT_EQ(pool_.AvailableCount(), 1u);
}

TEST_F(FlatObjectPoolTest, MultipleRangesAreDisjoint) {
    Range r1 = pool_.Acquire(10);
    Range r2 = pool_.Acquire(15);
    Range r3 = pool_.Acquire(20);

    EXPECT_LE(r1.end, r2.begin);
    EXPECT_LE(r2.end, r3.begin);

    for (size_t i = r1.begin; i < r1.end; ++i) pool_.Set(i, 100);
    for (size_t i = r2.begin; i < r2.end; ++i) pool_.Set(i, 200);
    for (size_t i = r3.begin; i < r3.end; ++i) pool_.Set(i, 300);

    EXPECT_EQ(*pool_.Get(r1.begin), 100);
    EXPECT_EQ(*pool_.Get(r2.begin), 200);
    EXPECT_EQ(*pool_.Get(r3.end - 1), 300);
}

TEST_F(FlatObjectPoolTest, SetAndGet) {
    Range r = pool_.Acquire(10);
    for (size_t i = r.begin; i < r.end; ++i) {
        pool_.Set(i, static_cast<int>(i * 2));
    }
    for (size_t i = r.begin; i < r.end; ++i) {
        ASSERT_NE(pool_.Get(i), nullptr);
        EXPECT_EQ(*pool_.Get(i), static_cast<int>(i * 2));
    }
    // Beyond the watermark nothing has been assigned
    EXPECT_EQ(pool_.Get(r.end), nullptr);
}

TEST_F(FlatObjectPoolTest, GetSlice) {
    Range r = pool_.Acquire(10);
    for (size_t i = r.begin; i < r.end; ++i) {
        pool_.Set(i, static_cast<int>(i));
    }

    Slice<const int> slice = pool_.GetSlice(r.begin, r.end);
    ASSERT_EQ(slice.Size(), 10u);
    size_t idx = 0;
    for (int v : slice) {
        EXPECT_EQ(v, static_cast<int>(r.begin + idx));
        ++idx;
    }
}

TEST_F(FlatObjectPoolTest, GetSliceMut) {
    Range r = pool_.Acquire(10);
    {
        Slice<int> slice = pool_.GetSliceMut(r.begin, r.end);
        for (size_t i = 0; i < slice.Size(); ++i) {
            slice[i] = static_cast<int>(i * 3);
        }
    }

    Slice<const int> slice = pool_.GetSlice(r);
    for (size_t i = 0; i < slice.Size(); ++i) {
        EXPECT_EQ(slice[i], static_cast<int>(i * 3));
    }
}

TEST_F(FlatObjectPoolTest, ReleaseResetsSlots) {
    Range r = pool_.Acquire(10);
    for (size_t i = r.begin; i < r.end; ++i) {
        pool_.Set(i, 42);
    }

    pool_.Release(r);

    for (size_t i = r.begin; i < r.end; ++i) {
        ASSERT_NE(pool_.Get(i), nullptr);
        EXPECT_EQ(*pool_.Get(i), 0);
    }
}

TEST(FlatObjectPoolCapacityTest, FullFreeListLosesRanges) {
    FlatObjectPool<int> pool(100, 3);
    std::vector<Range> ranges;
    for (int i = 0; i < 5; ++i) {
        ranges.push_back(pool.Acquire(5));
    }

    for (const auto& r : ranges) {
        pool.Release(r);
    }
    EXPECT_EQ(pool.AvailableCount(), 3u);

    // The three remembered ranges are reused, the other two are gone
    for (int i = 0; i < 3; ++i) {
        Range r = pool.Acquire(5);
        EXPECT_LT(r.end, 16u);
    }
    EXPECT_EQ(pool.Watermark(), 25u);
    Range bumped = pool.Acquire(5);
    EXPECT_EQ(bumped, (Range{25, 30}));
}

TEST(FlatObjectPoolCapacityTest, RepeatedCyclesStayBounded) {
    FlatObjectPool<int> pool(100, 3);
    for (int i = 0; i < 50; ++i) {
        Range r = pool.Acquire(5);
        pool.Release(r);
        ASSERT_LE(pool.AvailableCount(), 3u);
    }
    EXPECT_EQ(pool.Watermark(), 5u);
}

TEST(FlatObjectPoolCapacityTest, ZeroRangeCapacityNeverReuses) {
    FlatObjectPool<int> pool(20, 0);
    Range r = pool.Acquire(5);
    pool.Release(r);

    EXPECT_EQ(pool.AvailableCount(), 0u);
    EXPECT_EQ(pool.Acquire(5), (Range{5, 10}));
}

TEST(FlatObjectPoolCapacityTest, ExhaustedArenaThrows) {
    FlatObjectPool<int> pool(10, 5);

    try {
        pool.Acquire(20);
        FAIL() << "Expected CapacityExceeded";
    } catch (const CapacityExceeded& e) {
        EXPECT_EQ(e.Requested(), 20u);
        EXPECT_EQ(e.Available(), 10u);
    }
    // A failed acquire changes nothing
    EXPECT_EQ(pool.Watermark(), 0u);
    EXPECT_EQ(pool.BufferSize(), 10u);

    pool.Acquire(10);
    EXPECT_THROW(pool.Acquire(1), CapacityExceeded);
}

TEST(FlatObjectPoolCapacityTest, FreeRangeServesRequestWhenBumpCannot) {
    FlatObjectPool<int> pool(10, 5);
    Range r = pool.Acquire(4);
    pool.Acquire(6);
    pool.Release(r);

    EXPECT_EQ(pool.Acquire(3), (Range{0, 3}));
    EXPECT_THROW(pool.Acquire(2), CapacityExceeded);
}

TEST(FlatObjectPoolConstructionTest, ZeroBufferSizeRejected) {
    EXPECT_THROW(FlatObjectPool<int>(0, 4), std::invalid_argument);
}

TEST_F(FlatObjectPoolTest, AcquireZeroIsEmpty) {
    pool_.Acquire(7);
    Range r = pool_.Acquire(0);
    EXPECT_TRUE(r.Empty());
    EXPECT_EQ(r.begin, 7u);
    EXPECT_EQ(pool_.Watermark(), 7u);
}

TEST_F(FlatObjectPoolTest, EmptyReleaseIsNoOp) {
    pool_.Acquire(60);
    pool_.Release(50, 50);
    EXPECT_EQ(pool_.AvailableCount(), 0u);
}

TEST_F(FlatObjectPoolTest, InvalidRangesAreRejected) {
    pool_.Acquire(60);

    EXPECT_THROW(pool_.Release(60, 50), std::out_of_range);
    EXPECT_THROW(pool_.Release(50, 70), std::out_of_range);
    EXPECT_THROW(pool_.GetSlice(0, 61), std::out_of_range);
    EXPECT_THROW(pool_.GetSliceMut(10, 5), std::out_of_range);
    EXPECT_THROW(pool_.Set(60, 1), std::out_of_range);
    EXPECT_EQ(pool_.AvailableCount(), 0u);
}

TEST(FlatObjectPoolTypesTest, Strings) {
    FlatObjectPool<std::string> pool(50, 5);
    Range r = pool.Acquire(5);

    for (size_t i = r.begin; i < r.end; ++i) {
        pool.Set(i, "String " + std::to_string(i));
    }
    for (size_t i = r.begin; i < r.end; ++i) {
        EXPECT_EQ(*pool.Get(i), "String " + std::to_string(i));
    }

    pool.Release(r);
    for (size_t i = r.begin; i < r.end; ++i) {
        EXPECT_EQ(*pool.Get(i), std::string());
    }
}

TEST(FlatObjectPoolPropertyTest, LiveRangesNeverOverlap) {
    FlatObjectPool<int> pool(500, 8);
    std::vector<Range> live;
    std::mt19937 gen(7);
    std::uniform_int_distribution<size_t> size_dis(1, 20);
    std::uniform_int_distribution<int> coin(0, 2);

    for (int round = 0; round < 2000; ++round) {
        if (live.empty() || coin(gen) != 0) {
            try {
                live.push_back(pool.Acquire(size_dis(gen)));
            } catch (const CapacityExceeded&) {
                // Arena full for this size; release something next round
            }
        } else {
            std::uniform_int_distribution<size_t> pick(0, live.size() - 1);
            size_t idx = pick(gen);
            pool.Release(live[idx]);
            live.erase(live.begin() + idx);
        }

        ASSERT_LE(pool.AvailableCount(), 8u);
        ASSERT_LE(pool.Watermark(), pool.BufferSize());
        for (size_t i = 0; i < live.size(); ++i) {
            ASSERT_LE(live[i].end, pool.Watermark());
            for (size_t j = i + 1; j < live.size(); ++j) {
                bool disjoint = live[i].end <= live[j].begin || live[j].end <= live[i].begin;
                ASSERT_TRUE(disjoint) << "[" << live[i].begin << "," << live[i].end << ") overlaps ["
                                      << live[j].begin << "," << live[j].end << ")";
            }
        }
    }
}

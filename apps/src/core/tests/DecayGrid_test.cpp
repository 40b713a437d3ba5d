/**
 * @file DecayGrid_test.cpp
 * @brief Tests for DecayGrid validation, clamping and revisions, plus WallMask packing.
 */

#include "core/DecayGrid.h"
#include "core/WallMask.h"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace SweepLight;

TEST(DecayGridTest, FromFlatKeepsRowMajorLayout)
{
    auto grid = DecayGrid::fromFlat(3, 2, { 0.0f, 0.1f, 0.2f, 0.3f, 0.4f, 0.5f });
    ASSERT_TRUE(grid.isValue());
    EXPECT_EQ(grid.value().width(), 3);
    EXPECT_EQ(grid.value().height(), 2);
    EXPECT_FLOAT_EQ(grid.value().at(2, 0), 0.2f);
    EXPECT_FLOAT_EQ(grid.value().at(0, 1), 0.3f);
}

TEST(DecayGridTest, FromFlatClampsValues)
{
    const float nan = std::numeric_limits<float>::quiet_NaN();
    auto grid = DecayGrid::fromFlat(3, 1, { -1.0f, 7.0f, nan });
    ASSERT_TRUE(grid.isValue());
    EXPECT_FLOAT_EQ(grid.value().at(0, 0), 0.0f);
    EXPECT_FLOAT_EQ(grid.value().at(1, 0), 1.0f);
    EXPECT_FLOAT_EQ(grid.value().at(2, 0), 0.0f);
}

TEST(DecayGridTest, FromFlatRejectsBadShapes)
{
    auto wrongLength = DecayGrid::fromFlat(3, 3, std::vector<float>(8, 0.0f));
    ASSERT_TRUE(wrongLength.isError());
    EXPECT_EQ(wrongLength.errorValue().code, LightingError::Code::InvalidDimensions);

    auto zeroWidth = DecayGrid::fromFlat(0, 3, {});
    ASSERT_TRUE(zeroWidth.isError());
    EXPECT_EQ(zeroWidth.errorValue().code, LightingError::Code::InvalidDimensions);

    auto negative = DecayGrid::fromFlat(-2, -2, std::vector<float>(4, 0.0f));
    ASSERT_TRUE(negative.isError());
}

TEST(DecayGridTest, MutationsClampAndBumpRevision)
{
    DecayGrid grid(4, 4, 0.2f);
    const uint64_t initial = grid.revision();
    EXPECT_GT(initial, 0u);

    grid.set(1, 1, 3.0f);
    EXPECT_FLOAT_EQ(grid.at(1, 1), 1.0f);
    const uint64_t afterSet = grid.revision();
    EXPECT_GT(afterSet, initial);

    grid.fill(0.5f);
    EXPECT_GT(grid.revision(), afterSet);
    EXPECT_FLOAT_EQ(grid.at(1, 1), 0.5f);
}

TEST(DecayGridTest, RevisionsAreUniqueAcrossGrids)
{
    DecayGrid a(2, 2);
    DecayGrid b(2, 2);
    EXPECT_NE(a.revision(), b.revision());
}

TEST(DecayGridTest, CopiesShareRevisionUntilModified)
{
    DecayGrid original(3, 3, 0.4f);
    DecayGrid copy = original;
    EXPECT_EQ(copy.revision(), original.revision());

    copy.set(0, 0, 0.9f);
    EXPECT_NE(copy.revision(), original.revision());
}

TEST(WallMaskTest, PackPutsCellInWordAndBit)
{
    WallMask mask(10, 7); // 70 cells, 3 words.
    mask.set(0, 0, true);  // Cell 0.
    mask.set(1, 3, true);  // Cell 31.
    mask.set(2, 3, true);  // Cell 32.
    mask.set(9, 6, true);  // Cell 69.

    const auto words = mask.pack();
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], 0x80000001u);
    EXPECT_EQ(words[1], 0x00000001u);
    EXPECT_EQ(words[2], 1u << 5);
}

TEST(WallMaskTest, UnpackRestoresMask)
{
    WallMask mask(6, 6);
    mask.set(2, 1, true);
    mask.set(5, 5, true);
    mask.toggle(0, 4);

    const WallMask restored = WallMask::unpack(6, 6, mask.pack());
    EXPECT_EQ(restored.count(), 3u);
    EXPECT_TRUE(restored.isWall(2, 1));
    EXPECT_TRUE(restored.isWall(0, 4));
    EXPECT_TRUE(restored.isWall(5, 5));
    EXPECT_FALSE(restored.isWall(1, 1));
}

TEST(WallMaskTest, ToggleAndClear)
{
    WallMask mask(3, 3);
    mask.toggle(1, 1);
    EXPECT_TRUE(mask.isWall(1, 1));
    mask.toggle(1, 1);
    EXPECT_FALSE(mask.isWall(1, 1));

    mask.set(0, 0, true);
    mask.clear();
    EXPECT_EQ(mask.count(), 0u);
}

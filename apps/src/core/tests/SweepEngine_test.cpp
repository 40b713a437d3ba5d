/**
 * @file SweepEngine_test.cpp
 * @brief Tests for sweep-and-merge light attenuation.
 */

#include "core/DecayGrid.h"
#include "core/SweepEngine.h"
#include <cmath>
#include <gtest/gtest.h>
#include <random>
#include <utility>
#include <vector>

using namespace SweepLight;

class SweepEngineTest : public ::testing::Test {
protected:
    SweepEngine engine;

    AttenuationGrid calculate(
        const std::vector<float>& decay, int width, int height, int sx, int sy, float rate = 1.0f)
    {
        auto result = engine.calculate(decay, width, height, sx, sy, rate);
        EXPECT_TRUE(result.isValue()) << result.errorValue().message;
        return result.takeValue();
    }
};

TEST_F(SweepEngineTest, TransparentGridIsFullyLit)
{
    const std::vector<float> decay(25, 0.0f);
    const AttenuationGrid att = calculate(decay, 5, 5, 2, 2);

    ASSERT_EQ(att.width, 5);
    ASSERT_EQ(att.height, 5);
    for (float value : att.data) {
        EXPECT_FLOAT_EQ(value, 1.0f);
    }
}

TEST_F(SweepEngineTest, OpaqueGridFallsOffFromSource)
{
    std::vector<float> decay(25, 1.0f);
    decay[2 * 5 + 2] = 0.0f;
    const AttenuationGrid att = calculate(decay, 5, 5, 2, 2);

    const float source = att.at(2, 2);
    const float near = att.at(1, 2);
    const float far = att.at(0, 2);

    EXPECT_FLOAT_EQ(source, 1.0f);
    EXPECT_GT(near, far) << "Closer cell should be brighter";
    EXPECT_GT(far, 0.0f) << "Light should still reach through two opaque cells";
    EXPECT_LT(near, 1.0f);
    EXPECT_NEAR(near, std::exp(-1.0f), 1e-6f);
    EXPECT_NEAR(far, std::exp(-2.0f), 1e-6f);
}

TEST_F(SweepEngineTest, AttenuationIsNonIncreasingAlongStraightPaths)
{
    const int size = 9;
    const int c = size / 2;
    std::vector<float> decay(size * size, 1.0f);
    const AttenuationGrid att = calculate(decay, size, size, c, c);

    const int directions[8][2] = { { 1, 0 }, { -1, 0 }, { 0, 1 },  { 0, -1 },
                                   { 1, 1 }, { -1, -1 }, { 1, -1 }, { -1, 1 } };
    for (const auto& dir : directions) {
        float previous = att.at(c, c);
        for (int step = 1; step <= c; ++step) {
            const float value = att.at(c + dir[0] * step, c + dir[1] * step);
            EXPECT_LE(value, previous) << "direction (" << dir[0] << ", " << dir[1] << ") step "
                                       << step;
            previous = value;
        }
    }
}

TEST_F(SweepEngineTest, LowDecayNeighborsStayBright)
{
    const std::vector<float> decay(25, 0.1f);
    const AttenuationGrid att = calculate(decay, 5, 5, 2, 2);

    EXPECT_NEAR(att.at(2, 2), 1.0f, 0.001f);
    for (auto [x, y] : { std::pair{ 2, 1 }, std::pair{ 2, 3 }, std::pair{ 1, 2 }, std::pair{ 3, 2 } }) {
        EXPECT_GT(att.at(x, y), 0.85f);
        EXPECT_LT(att.at(x, y), 0.95f);
    }
}

TEST_F(SweepEngineTest, HomogeneousGridFollowsOctileDistance)
{
    const int size = 11;
    const int c = 5;
    const float decay = 0.5f;
    const AttenuationGrid att = calculate(std::vector<float>(size * size, decay), size, size, c, c);

    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            const int dx = std::abs(x - c);
            const int dy = std::abs(y - c);
            const float distance =
                std::max(dx, dy) - std::min(dx, dy) + kSqrt2 * std::min(dx, dy);
            EXPECT_NEAR(att.at(x, y), std::exp(-decay * distance), 1e-5f)
                << "at (" << x << ", " << y << ")";
        }
    }
}

TEST_F(SweepEngineTest, PointReflectedInputGivesPointReflectedOutput)
{
    const int width = 13;
    const int height = 9;
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);

    std::vector<float> decay(width * height);
    for (float& d : decay) {
        d = dist(rng);
    }
    std::vector<float> reflected(decay.size());
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            reflected[y * width + x] = decay[(height - 1 - y) * width + (width - 1 - x)];
        }
    }

    const AttenuationGrid a = calculate(decay, width, height, 3, 2);
    const AttenuationGrid b = calculate(reflected, width, height, width - 1 - 3, height - 1 - 2);

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            EXPECT_FLOAT_EQ(a.at(x, y), b.at(width - 1 - x, height - 1 - y))
                << "at (" << x << ", " << y << ")";
        }
    }
}

TEST_F(SweepEngineTest, SymmetricDiagonalBarriersLightOppositeCornersEqually)
{
    // Barriers at (1,1) and (5,5) around a light at (3,3).
    std::vector<float> decay(49, 0.1f);
    decay[1 * 7 + 1] = 0.9f;
    decay[5 * 7 + 5] = 0.9f;
    const AttenuationGrid att = calculate(decay, 7, 7, 3, 3);

    EXPECT_NEAR(att.at(0, 0), att.at(6, 6), 0.001f);
}

TEST_F(SweepEngineTest, CavePocketReceivesDimmedLight)
{
    std::vector<float> decay(100, 0.1f);
    const std::pair<int, int> walls[] = { { 6, 1 }, { 6, 2 }, { 6, 3 }, { 6, 4 }, { 6, 5 },
                                          { 6, 6 }, { 3, 6 }, { 4, 6 }, { 5, 6 }, { 7, 1 },
                                          { 7, 2 }, { 8, 2 }, { 7, 7 } };
    for (auto [x, y] : walls) {
        decay[y * 10 + x] = 0.9f;
    }

    const AttenuationGrid att = calculate(decay, 10, 10, 5, 4);
    const float nearSource = att.at(4, 4);
    const float inPocket = att.at(8, 8);

    EXPECT_GT(inPocket, 0.0f) << "Pocket should receive some light";
    EXPECT_LT(inPocket, nearSource) << "Pocket should be dimmer than near source";
}

TEST_F(SweepEngineTest, CenteredLightInCupIsLeftRightSymmetric)
{
    const int size = 15;
    std::vector<float> decay(size * size, 0.1f);
    for (int y = 3; y < 11; ++y) {
        decay[y * size + 4] = 1.0f;
        decay[y * size + 10] = 1.0f;
    }
    for (int x = 4; x < 11; ++x) {
        decay[10 * size + x] = 1.0f;
    }

    const AttenuationGrid att = calculate(decay, size, size, 7, 6);
    for (int y = 0; y < size; ++y) {
        for (int dx = 1; dx <= 7; ++dx) {
            EXPECT_NEAR(att.at(7 - dx, y), att.at(7 + dx, y), 0.01f)
                << "dx=" << dx << " y=" << y;
        }
    }
}

TEST_F(SweepEngineTest, DecayRateScalesFalloff)
{
    const std::vector<float> decay(49, 0.5f);
    const AttenuationGrid none = calculate(decay, 7, 7, 3, 3, 0.0f);
    const AttenuationGrid normal = calculate(decay, 7, 7, 3, 3, 1.0f);
    const AttenuationGrid strong = calculate(decay, 7, 7, 3, 3, 2.0f);

    EXPECT_FLOAT_EQ(none.at(0, 0), 1.0f);
    EXPECT_GT(normal.at(0, 3), strong.at(0, 3));
    EXPECT_FLOAT_EQ(strong.at(3, 3), 1.0f);
}

TEST_F(SweepEngineTest, NegativeDecayRateActsAsTransparent)
{
    const AttenuationGrid att = calculate(std::vector<float>(9, 1.0f), 3, 3, 1, 1, -4.0f);
    for (float value : att.data) {
        EXPECT_FLOAT_EQ(value, 1.0f);
    }
}

TEST_F(SweepEngineTest, OutOfRangeDecayIsClamped)
{
    std::vector<float> decay(9, 5.0f);
    decay[0] = -3.0f;
    const AttenuationGrid att = calculate(decay, 3, 3, 1, 1);

    // 5.0 behaves as 1.0; the negative corner as 0.0.
    EXPECT_NEAR(att.at(2, 1), std::exp(-1.0f), 1e-6f);
    EXPECT_FLOAT_EQ(att.at(0, 0), 1.0f);
}

TEST_F(SweepEngineTest, DecayGridOverloadMatchesFlatBuffer)
{
    std::vector<float> values(30);
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(i % 7) / 7.0f;
    }
    auto grid = DecayGrid::fromFlat(6, 5, values);
    ASSERT_TRUE(grid.isValue());

    auto fromGrid = engine.calculate(grid.value(), 4, 1);
    ASSERT_TRUE(fromGrid.isValue());
    const AttenuationGrid fromFlat = calculate(values, 6, 5, 4, 1);

    EXPECT_EQ(fromGrid.value().data, fromFlat.data);
}

TEST_F(SweepEngineTest, PreparedFieldCanBeSweptFromManySources)
{
    const std::vector<float> decay(16, 0.3f);
    auto field = engine.prepare(decay, 4, 4);
    ASSERT_TRUE(field.isValue());

    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            auto swept = engine.sweep(field.value(), x, y);
            ASSERT_TRUE(swept.isValue());
            EXPECT_EQ(swept.value().data, calculate(decay, 4, 4, x, y).data);
        }
    }
}

TEST_F(SweepEngineTest, SingleScanOnlyReachesCellsDownstream)
{
    auto field = engine.prepare(std::vector<float>(3, 0.0f), 3, 1);
    ASSERT_TRUE(field.isValue());

    std::vector<float> forward{ 0.0f, 1.0f, 0.0f };
    runScan(ScanOrder::RowsForward, field.value(), forward.data());
    EXPECT_EQ(forward, (std::vector<float>{ 0.0f, 1.0f, 1.0f }));

    std::vector<float> reverse{ 0.0f, 1.0f, 0.0f };
    runScan(ScanOrder::RowsReverse, field.value(), reverse.data());
    EXPECT_EQ(reverse, (std::vector<float>{ 1.0f, 1.0f, 0.0f }));

    // One pass of four scans covers every direction.
    std::vector<float> pass(3, 0.0f);
    runPass(kForwardPass, field.value(), 1, pass.data());
    EXPECT_EQ(pass, (std::vector<float>{ 1.0f, 1.0f, 1.0f }));
}

TEST_F(SweepEngineTest, SingleCellGrid)
{
    const AttenuationGrid att = calculate({ 1.0f }, 1, 1, 0, 0);
    ASSERT_EQ(att.size(), 1u);
    EXPECT_FLOAT_EQ(att.data[0], 1.0f);
}

TEST_F(SweepEngineTest, EmptyGridIsInvalidDimensions)
{
    auto result = engine.calculate(std::vector<float>{}, 0, 0, 0, 0);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, LightingError::Code::InvalidDimensions);
}

TEST_F(SweepEngineTest, LengthMismatchIsInvalidDimensions)
{
    auto result = engine.calculate(std::vector<float>(24, 0.0f), 5, 5, 2, 2);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().code, LightingError::Code::InvalidDimensions);
}

TEST_F(SweepEngineTest, SourceOutsideGridIsOutOfBounds)
{
    const std::vector<float> decay(25, 0.0f);
    for (auto [x, y] : { std::pair{ 5, 0 }, std::pair{ 0, 5 }, std::pair{ -1, 2 } }) {
        auto result = engine.calculate(decay, 5, 5, x, y);
        ASSERT_TRUE(result.isError());
        EXPECT_EQ(result.errorValue().code, LightingError::Code::OutOfBounds);
    }
}

TEST_F(SweepEngineTest, ParallelAndSerialPassesAgree)
{
    SweepEngine serial(SweepConfig{ .parallel_min_cells = 1 << 30 });
    SweepEngine parallel(SweepConfig{ .parallel_min_cells = 0 });

    std::mt19937 rng(7);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> decay(64 * 48);
    for (float& d : decay) {
        d = dist(rng);
    }

    auto a = serial.calculate(decay, 64, 48, 10, 30);
    auto b = parallel.calculate(decay, 64, 48, 10, 30);
    ASSERT_TRUE(a.isValue());
    ASSERT_TRUE(b.isValue());
    EXPECT_EQ(a.value().data, b.value().data);
}

TEST_F(SweepEngineTest, ScratchBuffersReturnToPoolAfterCall)
{
    calculate(std::vector<float>(25, 0.2f), 5, 5, 2, 2);
    calculate(std::vector<float>(100, 0.2f), 10, 10, 2, 2);

    EXPECT_EQ(engine.getScratchPool().outstandingCount(), 0u);
    EXPECT_EQ(engine.getScratchPool().idleCount(), 1u);
}

TEST_F(SweepEngineTest, DiagonalMultiplierBelowOneIsClamped)
{
    SweepEngine cheapDiagonals(SweepConfig{ .diagonal_mult = 0.2f });
    EXPECT_FLOAT_EQ(cheapDiagonals.getConfig().diagonal_mult, 1.0f);
}

/**
 * @file LightingPipeline_test.cpp
 * @brief Tests for whole-frame lighting.
 */

#include "core/ColorNames.h"
#include "core/DecayGrid.h"
#include "core/LightManager.h"
#include "core/LightingPipeline.h"
#include "core/Timers.h"
#include "core/WallMask.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace SweepLight;

class LightingPipelineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        grid = DecayGrid(16, 12, 0.1f);
        walls = WallMask(16, 12);
        for (int y = 0; y < 12; ++y) {
            if (y < 4 || y > 7) {
                grid.set(8, y, 0.9f);
                walls.set(8, y, true);
            }
        }
    }

    LightFrame run(LightingPipeline& pipeline, const std::vector<LightSource>& lights)
    {
        auto frame = pipeline.calculate(grid, lights, &walls, timers);
        EXPECT_TRUE(frame.isValue()) << frame.errorValue().message;
        return frame.takeValue();
    }

    DecayGrid grid;
    WallMask walls;
    Timers timers;
};

TEST_F(LightingPipelineTest, SingleLightMatchesManualStages)
{
    LightingPipeline pipeline;
    const LightSource torch{ .position = Vector2f{ 3.0f, 5.0f }, .color = ColorNames::warmTorch() };
    const LightFrame frame = run(pipeline, { torch });

    auto att = pipeline.getEngine().calculate(grid, 3, 5);
    ASSERT_TRUE(att.isValue());
    const ColorNames::RgbF color = lightColor(torch);

    EXPECT_EQ(frame.lights_rendered, 1u);
    EXPECT_NEAR(frame.linear.at(5, 5).r, att.value().at(5, 5) * color.r, 1e-6f);
    EXPECT_NEAR(frame.linear.at(5, 5).g, att.value().at(5, 5) * color.g, 1e-6f);
    EXPECT_EQ(frame.pixels.at(3, 5), ColorNames::toRgba(frame.normalized.at(3, 5)));
}

TEST_F(LightingPipelineTest, WallCellsAreNeverBlack)
{
    LightingPipeline pipeline;
    const LightFrame frame =
        run(pipeline, { LightSource{ .position = Vector2f{ 2.0f, 2.0f }, .intensity = 0.0f } });

    const ColorNames::RgbF wall = frame.normalized.at(8, 0);
    EXPECT_GE(wall.r, 0.12f);
    EXPECT_GE(wall.g, 0.12f);
    EXPECT_GE(wall.b, 0.12f);
}

TEST_F(LightingPipelineTest, OutOfBoundsLightsAreSkipped)
{
    LightingPipeline pipeline;
    const LightFrame frame = run(
        pipeline,
        { LightSource{ .position = Vector2f{ 3.0f, 3.0f } },
          LightSource{ .position = Vector2f{ 40.0f, 3.0f } },
          LightSource{ .position = Vector2f{ -1.0f, 0.0f } } });

    EXPECT_EQ(frame.lights_rendered, 1u);
    EXPECT_EQ(frame.lights_skipped, 2u);
}

TEST_F(LightingPipelineTest, EmptyLightListIsDark)
{
    LightingPipeline pipeline;
    const LightFrame frame = run(pipeline, {});

    EXPECT_FLOAT_EQ(frame.linear.at(2, 2).r, 0.0f);
    EXPECT_FLOAT_EQ(frame.normalized.at(2, 2).g, 0.0f);
}

TEST_F(LightingPipelineTest, StaticLightsAreCachedAcrossFrames)
{
    LightingPipeline pipeline;
    const std::vector<LightSource> lights{
        LightSource{ .position = Vector2f{ 4.5f, 6.5f }, .is_static = true },
    };

    const LightFrame first = run(pipeline, lights);
    EXPECT_EQ(pipeline.getCache().misses(), 4u);
    EXPECT_EQ(pipeline.getCache().size(), 4u);

    const LightFrame second = run(pipeline, lights);
    EXPECT_EQ(pipeline.getCache().hits(), 4u);
    EXPECT_EQ(first.pixels.data, second.pixels.data);
}

TEST_F(LightingPipelineTest, GeometryChangeInvalidatesCachedLight)
{
    LightingPipeline pipeline;
    const std::vector<LightSource> lights{
        LightSource{ .position = Vector2f{ 2.0f, 6.0f }, .is_static = true },
    };
    const LightFrame before = run(pipeline, lights);

    grid.set(3, 6, 1.0f);
    const LightFrame after = run(pipeline, lights);

    EXPECT_EQ(pipeline.getCache().hits(), 0u);
    EXPECT_LT(after.linear.at(5, 6).r, before.linear.at(5, 6).r);
}

TEST_F(LightingPipelineTest, DynamicLightsBypassCache)
{
    LightingPipeline pipeline;
    run(pipeline, { LightSource{ .position = Vector2f{ 4.5f, 6.5f } } });

    EXPECT_EQ(pipeline.getCache().size(), 0u);
}

TEST_F(LightingPipelineTest, LightOrderDoesNotChangeFrame)
{
    LightingPipeline pipeline;
    const LightSource a{ .position = Vector2f{ 2.0f, 2.0f }, .color = ColorNames::red() };
    const LightSource b{ .position = Vector2f{ 13.25f, 9.5f }, .color = ColorNames::blue(), .decay_rate = 2.0f };

    const LightFrame ab = run(pipeline, { a, b });
    const LightFrame ba = run(pipeline, { b, a });
    EXPECT_EQ(ab.pixels.data, ba.pixels.data);
}

TEST_F(LightingPipelineTest, ManagerOverloadMatchesVector)
{
    LightingPipeline pipeline;
    LightManager manager;
    const LightSource a{ .position = Vector2f{ 1.0f, 1.0f } };
    const LightSource b{ .position = Vector2f{ 12.0f, 10.0f }, .color = ColorNames::coolMoonlight() };
    manager.addLight(a);
    manager.addLight(b);

    auto fromManager = pipeline.calculate(grid, manager, &walls, timers);
    ASSERT_TRUE(fromManager.isValue());
    const LightFrame fromVector = run(pipeline, { a, b });
    EXPECT_EQ(fromManager.value().pixels.data, fromVector.pixels.data);
}

TEST_F(LightingPipelineTest, StagesAreTimed)
{
    LightingPipeline pipeline;
    run(pipeline, { LightSource{ .position = Vector2f{ 1.0f, 1.0f } } });

    for (const char* stage : { "lighting_prepare",
                               "lighting_attenuation",
                               "lighting_blend",
                               "lighting_normalize",
                               "lighting_pack" }) {
        EXPECT_EQ(timers.getCallCount(stage), 1u) << stage;
    }
}

TEST_F(LightingPipelineTest, WallMaskShapeMismatchFailsFrame)
{
    LightingPipeline pipeline;
    WallMask wrong(3, 3);
    auto frame = pipeline.calculate(grid, std::vector<LightSource>{}, &wrong, timers);
    ASSERT_TRUE(frame.isError());
    EXPECT_EQ(frame.errorValue().code, LightingError::Code::InvalidDimensions);
}

TEST_F(LightingPipelineTest, EmptyGridFailsFrame)
{
    LightingPipeline pipeline;
    auto frame = pipeline.calculate(DecayGrid{}, std::vector<LightSource>{}, nullptr, timers);
    ASSERT_TRUE(frame.isError());
    EXPECT_EQ(frame.errorValue().code, LightingError::Code::InvalidDimensions);
}

TEST_F(LightingPipelineTest, LightMapMarksWallsAndBrightSource)
{
    LightingPipeline pipeline;
    const LightFrame frame = run(pipeline, { LightSource{ .position = Vector2f{ 3.0f, 5.0f } } });
    const std::string map = pipeline.lightMapString(frame, &walls);

    // 16 columns plus newline per row.
    ASSERT_EQ(map.size(), 17u * 12u);
    EXPECT_EQ(map[0 * 17 + 8], 'X');
    EXPECT_EQ(map[5 * 17 + 3], '@');
    EXPECT_EQ(map[5 * 17 + 16], '\n');
}

TEST_F(LightingPipelineTest, SetConfigSwitchesNormalization)
{
    LightingPipeline pipeline;
    LightConfig config = getDefaultLightConfig();
    config.normalization_mode = NormalizationMode::BrightnessLimited;
    pipeline.setConfig(config);

    const LightFrame frame = run(
        pipeline, { LightSource{ .position = Vector2f{ 3.0f, 5.0f }, .intensity = 4.0f } });
    // Peak of 4 at the source scales the whole frame by 1/4.
    EXPECT_FLOAT_EQ(frame.normalized.at(3, 5).r, 1.0f);
    EXPECT_NEAR(frame.normalized.at(4, 5).r, frame.linear.at(4, 5).r * 0.25f, 1e-6f);
    EXPECT_LT(frame.normalized.at(4, 5).r, 1.0f);
}

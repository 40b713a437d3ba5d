#include "BenchmarkRunner.h"
#include "core/DecayGrid.h"
#include "core/LightingPipeline.h"
#include "core/LoggingChannels.h"
#include "core/ScopeTimer.h"
#include "core/SubpixelInterpolator.h"
#include "core/SweepEngine.h"
#include "core/Timers.h"
#include "core/WallMask.h"

namespace SweepLight {
namespace Cli {

nlohmann::json BenchmarkResults::toJson() const
{
    nlohmann::json stageJson = nlohmann::json::array();
    for (const auto& stage : stages) {
        stageJson.push_back({
            { "name", stage.name },
            { "calls", stage.calls },
            { "total_ms", stage.total_ms },
            { "avg_ms", stage.avg_ms },
        });
    }

    nlohmann::json j{
        { "size", size },
        { "iterations", iterations },
        { "success", success },
        { "stages", stageJson },
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

BenchmarkResults BenchmarkRunner::run(int size, int iterations, const LightConfig& config)
{
    BenchmarkResults results;
    results.size = size;
    results.iterations = iterations;

    if (size <= 0 || iterations <= 0) {
        results.error = "size and iterations must be positive";
        return results;
    }

    // Sparse pillars every 8 cells give the sweeps something to route around.
    DecayGrid grid(size, size, 0.1f);
    WallMask walls(size, size);
    for (int y = 4; y < size; y += 8) {
        for (int x = 4; x < size; x += 8) {
            grid.set(x, y, 0.9f);
            walls.set(x, y, true);
        }
    }

    SweepEngine engine(toSweepConfig(config));
    SubpixelInterpolator interpolator(engine);
    LightingPipeline pipeline(config);
    Timers timers;

    const int center = size / 2;
    for (int i = 0; i < iterations; ++i) {
        {
            ScopeTimer t(timers, "sweep_single");
            auto result = engine.calculate(grid, center, center);
            if (result.isError()) {
                results.error = result.errorValue().message;
                return results;
            }
        }

        {
            ScopeTimer t(timers, "sweep_subpixel");
            auto result = interpolator.calculate(
                grid, Vector2f{ center + 0.25f, center + 0.75f }, 1.0f);
            if (result.isError()) {
                results.error = result.errorValue().message;
                return results;
            }
        }

        const float phase = static_cast<float>(i) / static_cast<float>(iterations);
        const std::vector<LightSource> lights{
            LightSource{
                .position = Vector2f{ phase * (size - 1), center + 0.5f },
                .color = ColorNames::warmTorch(),
            },
            LightSource{
                .position = Vector2f{ 1.0f, 1.0f },
                .color = ColorNames::coolMoonlight(),
                .intensity = 0.6f,
                .is_static = true,
            },
        };

        ScopeTimer t(timers, "frame");
        auto frame = pipeline.calculate(grid, lights, &walls, timers);
        if (frame.isError()) {
            results.error = frame.errorValue().message;
            return results;
        }
    }

    for (const auto& name : timers.getAllTimerNames()) {
        results.stages.push_back(BenchmarkStage{
            .name = name,
            .calls = timers.getCallCount(name),
            .total_ms = timers.getAccumulatedTime(name),
            .avg_ms = timers.getAverageTime(name),
        });
    }

    LOG_INFO(
        Cli,
        "Benchmark {}x{} x{}: cache {} hits / {} misses",
        size,
        size,
        iterations,
        pipeline.getCache().hits(),
        pipeline.getCache().misses());
    results.success = true;
    return results;
}

} // namespace Cli
} // namespace SweepLight

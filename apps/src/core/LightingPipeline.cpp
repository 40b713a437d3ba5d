#include "LightingPipeline.h"
#include "LightManager.h"
#include "LoggingChannels.h"
#include "ScopeTimer.h"
#include "Timers.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <utility>

namespace SweepLight {

LightingPipeline::LightingPipeline(const LightConfig& config)
    : config_(config),
      engine_(std::make_unique<SweepEngine>(toSweepConfig(config))),
      cache_(config.cache_enabled ? static_cast<size_t>(std::max(config.cache_capacity, 0)) : 0),
      interpolator_(std::make_unique<SubpixelInterpolator>(*engine_, &cache_)),
      blender_(config.parallel_min_cells),
      normalizer_(toNormalizerConfig(config), config.parallel_min_cells)
{}

void LightingPipeline::setConfig(const LightConfig& config)
{
    config_ = config;
    engine_ = std::make_unique<SweepEngine>(toSweepConfig(config));
    interpolator_ = std::make_unique<SubpixelInterpolator>(*engine_, &cache_);
    blender_ = ColorBlender(config.parallel_min_cells);
    normalizer_ = Normalizer(toNormalizerConfig(config), config.parallel_min_cells);

    // The diagonal multiplier is part of the cache key, so old entries could never hit again.
    cache_.clear();
    cache_.setCapacity(
        config.cache_enabled ? static_cast<size_t>(std::max(config.cache_capacity, 0)) : 0);
}

bool LightingPipeline::isRenderable(const LightSource& light, const DecayGrid& grid) const
{
    if (!light.position.isFinite()) {
        return false;
    }
    const float fx = std::floor(light.position.x);
    const float fy = std::floor(light.position.y);
    return fx >= 0.0f && fy >= 0.0f && fx < static_cast<float>(grid.width())
        && fy < static_cast<float>(grid.height());
}

Result<LightFrame, LightingError> LightingPipeline::calculate(
    const DecayGrid& grid, const LightManager& lights, const WallMask* walls, Timers& timers)
{
    return calculate(grid, lights.snapshot(), walls, timers);
}

Result<LightFrame, LightingError> LightingPipeline::calculate(
    const DecayGrid& grid,
    const std::vector<LightSource>& lights,
    const WallMask* walls,
    Timers& timers)
{
    auto shape = DecayGrid::validateShape(grid.width(), grid.height(), grid.size());
    if (shape.isError()) {
        return Result<LightFrame, LightingError>::error(shape.errorValue());
    }

    LightFrame frame;

    // One transmittance field per distinct decay rate, shared by every light using it.
    std::vector<const LightSource*> active;
    std::vector<const TransmittanceField*> activeFields;
    std::map<float, TransmittanceField> fields;
    {
        ScopeTimer t(timers, "lighting_prepare");
        for (const auto& light : lights) {
            if (!isRenderable(light, grid)) {
                LOG_WARN(
                    Pipeline,
                    "Skipping light at ({}, {}): outside {}x{} grid",
                    light.position.x,
                    light.position.y,
                    grid.width(),
                    grid.height());
                frame.lights_skipped++;
                continue;
            }

            const float rate = effectiveDecayRate(light);
            auto it = fields.find(rate);
            if (it == fields.end()) {
                auto field = engine_->prepare(grid, rate);
                if (field.isError()) {
                    return Result<LightFrame, LightingError>::error(field.errorValue());
                }
                it = fields.emplace(rate, field.takeValue()).first;
            }
            active.push_back(&light);
            activeFields.push_back(&it->second);
        }
    }

    const int count = static_cast<int>(active.size());
    std::vector<std::optional<AttenuationGrid>> attenuation(active.size());
    std::vector<std::optional<LightingError>> errors(active.size());
    {
        ScopeTimer t(timers, "lighting_attenuation");
#pragma omp parallel for schedule(dynamic, 1) if (count > 1)
        for (int i = 0; i < count; ++i) {
            const LightSource& light = *active[i];
            auto result = interpolator_->calculate(*activeFields[i], light.position, light.is_static);
            if (result.isError()) {
                errors[i] = result.errorValue();
            }
            else {
                attenuation[i] = result.takeValue();
            }
        }
    }

    for (const auto& error : errors) {
        if (error) {
            LOG_ERROR(Pipeline, "Attenuation failed: {}", error->message);
            return Result<LightFrame, LightingError>::error(*error);
        }
    }

    {
        ScopeTimer t(timers, "lighting_blend");
        std::vector<LightContribution> contributions;
        contributions.reserve(active.size());
        for (size_t i = 0; i < active.size(); ++i) {
            contributions.push_back(LightContribution{
                .attenuation = &*attenuation[i],
                .color = lightColor(*active[i]),
                .intensity = effectiveIntensity(*active[i]),
            });
        }

        auto blended = blender_.blend(grid.width(), grid.height(), contributions);
        if (blended.isError()) {
            return Result<LightFrame, LightingError>::error(blended.errorValue());
        }
        frame.linear = blended.takeValue();
    }

    {
        ScopeTimer t(timers, "lighting_normalize");
        auto normalized = normalizer_.normalize(frame.linear, walls);
        if (normalized.isError()) {
            return Result<LightFrame, LightingError>::error(normalized.errorValue());
        }
        frame.normalized = normalized.takeValue();
    }

    {
        ScopeTimer t(timers, "lighting_pack");
        frame.pixels.pack(frame.normalized);
    }

    frame.lights_rendered = active.size();
    LOG_DEBUG(
        Pipeline,
        "Frame {}x{}: {} light(s), {} skipped, cache {} hits / {} misses",
        grid.width(),
        grid.height(),
        frame.lights_rendered,
        frame.lights_skipped,
        cache_.hits(),
        cache_.misses());
    return Result<LightFrame, LightingError>::okay(std::move(frame));
}

std::string LightingPipeline::lightMapString(const LightFrame& frame, const WallMask* walls) const
{
    const char* shades = " .:-=+*#%@"; // 10 levels, dark to bright.
    const ColorGrid& colors = frame.normalized;
    const bool markWalls =
        walls != nullptr && walls->width() == colors.width && walls->height() == colors.height;

    std::string result;
    result.reserve((colors.width + 1) * colors.height);

    for (int y = 0; y < colors.height; ++y) {
        for (int x = 0; x < colors.width; ++x) {
            if (markWalls && walls->isWall(x, y)) {
                result += 'X';
            }
            else {
                const float b = ColorNames::clampUnit(ColorNames::luminance(colors.at(x, y)));
                const int idx = std::min(9, static_cast<int>(b * 10));
                result += shades[idx];
            }
        }
        result += '\n';
    }
    return result;
}

} // namespace SweepLight

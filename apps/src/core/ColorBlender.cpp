#include "ColorBlender.h"
#include "LoggingChannels.h"

#include <spdlog/fmt/fmt.h>
#include <utility>

namespace SweepLight {

LightContribution LightContribution::fromPacked(
    const AttenuationGrid& attenuation, uint32_t rgba, float intensity)
{
    return LightContribution{
        .attenuation = &attenuation,
        .color = ColorNames::toRgbF(rgba),
        .intensity = intensity,
    };
}

ColorBlender::ColorBlender(int parallelMinCells) : parallelMinCells_(parallelMinCells)
{}

Result<ColorGrid, LightingError> ColorBlender::blend(
    int width, int height, const std::vector<LightContribution>& contributions) const
{
    if (width <= 0 || height <= 0) {
        return Result<ColorGrid, LightingError>::error(LightingError::invalidDimensions(
            fmt::format("Blend target must be non-empty, got {}x{}", width, height)));
    }

    ColorGrid out(width, height, ColorNames::RgbF{});
    for (const auto& contribution : contributions) {
        auto added = accumulate(out, contribution);
        if (added.isError()) {
            return Result<ColorGrid, LightingError>::error(added.errorValue());
        }
    }

    LOG_TRACE(Blend, "Blended {} light(s) into {}x{}", contributions.size(), width, height);
    return Result<ColorGrid, LightingError>::okay(std::move(out));
}

Result<bool, LightingError> ColorBlender::accumulate(
    ColorGrid& target, const LightContribution& contribution) const
{
    if (contribution.attenuation == nullptr || !target.sameShape(*contribution.attenuation)) {
        const int w = contribution.attenuation ? contribution.attenuation->width : 0;
        const int h = contribution.attenuation ? contribution.attenuation->height : 0;
        return Result<bool, LightingError>::error(LightingError::invalidDimensions(fmt::format(
            "Contribution {}x{} does not match target {}x{}", w, h, target.width, target.height)));
    }

    const float intensity = contribution.intensity > 0.0f ? contribution.intensity : 0.0f;
    const ColorNames::RgbF scaled = ColorNames::clampUnit(contribution.color) * intensity;
    const float* att = contribution.attenuation->begin();
    ColorNames::RgbF* dst = target.begin();
    const size_t count = target.size();

#pragma omp parallel for schedule(static) if (count >= static_cast<size_t>(parallelMinCells_))
    for (size_t i = 0; i < count; ++i) {
        dst[i] += scaled * att[i];
    }

    return Result<bool, LightingError>::okay(true);
}

Result<ColorGrid, LightingError> ColorBlender::applyLightColor(
    const LightContribution& contribution) const
{
    if (contribution.attenuation == nullptr) {
        return Result<ColorGrid, LightingError>::error(
            LightingError::invalidDimensions("Contribution has no attenuation grid"));
    }
    return blend(
        contribution.attenuation->width, contribution.attenuation->height, { contribution });
}

} // namespace SweepLight

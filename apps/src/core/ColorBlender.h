#pragma once

#include "ColorNames.h"
#include "GridBuffer.h"
#include "LightingError.h"
#include "Result.h"
#include <cstdint>
#include <vector>

namespace SweepLight {

using ColorGrid = GridBuffer<ColorNames::RgbF>;

// One light's share of a frame. The attenuation grid is borrowed for the blend call.
struct LightContribution {
    const AttenuationGrid* attenuation = nullptr;
    ColorNames::RgbF color;
    float intensity = 1.0f;

    static LightContribution fromPacked(
        const AttenuationGrid& attenuation, uint32_t rgba, float intensity);
};

/**
 * Sums colored light contributions into linear RGB.
 *
 * Per cell and channel the output is the sum of attenuation x color x intensity over all
 * contributions. Values are left unclamped for the Normalizer. Each cell sums its
 * contributions in input order, so reordering the input changes the result only by float
 * rounding.
 */
class ColorBlender {
public:
    explicit ColorBlender(int parallelMinCells = 2500);

    // No contributions produce an all-black grid of the given shape.
    Result<ColorGrid, LightingError> blend(
        int width, int height, const std::vector<LightContribution>& contributions) const;

    // Accumulates one contribution into an existing grid of the same shape.
    Result<bool, LightingError> accumulate(
        ColorGrid& target, const LightContribution& contribution) const;

    // A single light's colored grid.
    Result<ColorGrid, LightingError> applyLightColor(const LightContribution& contribution) const;

private:
    int parallelMinCells_;
};

} // namespace SweepLight

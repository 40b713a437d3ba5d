#pragma once

#include "AttenuationCache.h"
#include "DecayGrid.h"
#include "GridBuffer.h"
#include "LightingError.h"
#include "Result.h"
#include "SweepEngine.h"
#include "Vector2.h"
#include <array>
#include <memory>

namespace SweepLight {

/**
 * The four lattice-aligned attenuation grids around a fractional source, with their bilinear
 * weights. Corner order is (x0,y0), (x1,y0), (x0,y1), (x1,y1). A corner with zero weight has a
 * null grid.
 */
struct SubpixelSample {
    int width = 0;
    int height = 0;
    std::array<Vector2i, 4> lattice{};
    std::array<float, 4> weights{};
    std::array<AttenuationCache::GridPtr, 4> corners{};

    size_t activeCount() const;
};

/**
 * Attenuation for sources at fractional positions.
 *
 * Sweeps the integer lattice points around the source and blends them bilinearly, so a moving
 * light brightens and dims cells smoothly instead of jumping a whole cell at a time. An integral
 * position is a single sweep. Corners past the last row or column clamp to the edge.
 */
class SubpixelInterpolator {
public:
    // The cache is optional; corners of static lights are only cached when one is given.
    explicit SubpixelInterpolator(const SweepEngine& engine, AttenuationCache* cache = nullptr);

    Result<SubpixelSample, LightingError> sample(
        const TransmittanceField& field, Vector2f position, bool use_cache = false) const;

    Result<AttenuationGrid, LightingError> calculate(
        const TransmittanceField& field, Vector2f position, bool use_cache = false) const;

    Result<AttenuationGrid, LightingError> calculate(
        const DecayGrid& grid, Vector2f position, float decay_rate = 1.0f) const;

    // Weighted sum of the sample's corner grids.
    AttenuationGrid blend(const SubpixelSample& sample) const;

    static std::array<float, 4> bilinearWeights(float fx, float fy);

private:
    const SweepEngine& engine_;
    AttenuationCache* cache_;
};

} // namespace SweepLight

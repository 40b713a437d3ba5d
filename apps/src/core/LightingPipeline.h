#pragma once

#include "AttenuationCache.h"
#include "ColorBlender.h"
#include "DecayGrid.h"
#include "LightBuffer.h"
#include "LightConfig.h"
#include "LightTypes.h"
#include "LightingError.h"
#include "Normalizer.h"
#include "Result.h"
#include "SubpixelInterpolator.h"
#include "SweepEngine.h"
#include "WallMask.h"
#include <memory>
#include <string>
#include <vector>

class Timers;

namespace SweepLight {

class LightManager;

struct LightFrame {
    ColorGrid linear;     // Blended, unclamped.
    ColorGrid normalized; // After the Normalizer, in [0, 1].
    LightBuffer pixels;   // Packed normalized.
    size_t lights_rendered = 0;
    size_t lights_skipped = 0;
};

/**
 * Computes a whole frame of light from a decay grid and a set of lights.
 *
 * Per light: attenuation through the SubpixelInterpolator (static lights go through the
 * AttenuationCache), then all lights are blended, normalized and packed. Lights are processed in
 * parallel and blended in input order, so the frame does not depend on scheduling.
 *
 * Lights outside the grid are skipped with a warning. Shape errors fail the frame.
 */
class LightingPipeline {
public:
    explicit LightingPipeline(const LightConfig& config = getDefaultLightConfig());

    LightingPipeline(const LightingPipeline&) = delete;
    LightingPipeline& operator=(const LightingPipeline&) = delete;

    Result<LightFrame, LightingError> calculate(
        const DecayGrid& grid,
        const std::vector<LightSource>& lights,
        const WallMask* walls,
        Timers& timers);

    Result<LightFrame, LightingError> calculate(
        const DecayGrid& grid, const LightManager& lights, const WallMask* walls, Timers& timers);

    // ASCII shades of the normalized frame, dark to bright, with 'X' on wall cells.
    std::string lightMapString(const LightFrame& frame, const WallMask* walls = nullptr) const;

    void setConfig(const LightConfig& config);
    const LightConfig& getConfig() const { return config_; }

    AttenuationCache& getCache() { return cache_; }
    const SweepEngine& getEngine() const { return *engine_; }
    const Normalizer& getNormalizer() const { return normalizer_; }

private:
    bool isRenderable(const LightSource& light, const DecayGrid& grid) const;

    LightConfig config_;
    std::unique_ptr<SweepEngine> engine_;
    AttenuationCache cache_;
    std::unique_ptr<SubpixelInterpolator> interpolator_;
    ColorBlender blender_;
    Normalizer normalizer_;
};

} // namespace SweepLight

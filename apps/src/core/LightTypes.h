#pragma once

#include "ColorNames.h"
#include "Vector2.h"
#include <cstdint>

namespace SweepLight {

/**
 * Light source placed on the grid.
 *
 * Position may be fractional; the pipeline routes non-integral positions through the
 * SubpixelInterpolator. Color is packed 0xRRGGBBAA. Alpha is carried for the caller but does
 * not scale the light. decay_rate scales every cell's opacity for this light only.
 *
 * Static lights have their lattice-aligned attenuation grids cached between frames.
 */
struct LightSource {
    Vector2f position;
    uint32_t color = 0xFFFFFFFF;
    float intensity = 1.0f;
    float decay_rate = 1.0f;
    bool is_static = false;
};

// Linear RGB of the packed color, ignoring alpha.
ColorNames::RgbF lightColor(const LightSource& light);

// Intensity with negative and NaN values mapped to 0.
float effectiveIntensity(const LightSource& light);

// Decay rate with negative and NaN values mapped to 0.
float effectiveDecayRate(const LightSource& light);

bool isIntegralPosition(const LightSource& light);

} // namespace SweepLight

#include "LightTypes.h"

#include <cmath>

namespace SweepLight {

ColorNames::RgbF lightColor(const LightSource& light)
{
    return ColorNames::toRgbF(light.color);
}

float effectiveIntensity(const LightSource& light)
{
    return light.intensity > 0.0f ? light.intensity : 0.0f;
}

float effectiveDecayRate(const LightSource& light)
{
    return light.decay_rate > 0.0f ? light.decay_rate : 0.0f;
}

bool isIntegralPosition(const LightSource& light)
{
    return std::floor(light.position.x) == light.position.x
        && std::floor(light.position.y) == light.position.y;
}

} // namespace SweepLight

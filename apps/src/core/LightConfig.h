#pragma once

#include "Normalizer.h"
#include "SweepEngine.h"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace SweepLight {

struct LightConfig {
    bool cache_enabled;
    int cache_capacity;
    float diagonal_mult;
    bool gamma_enabled;
    float luminance_threshold;
    NormalizationMode normalization_mode;
    int parallel_min_cells;
    float wall_min_brightness;
};

LightConfig getDefaultLightConfig();
SweepConfig toSweepConfig(const LightConfig& config);
NormalizerConfig toNormalizerConfig(const LightConfig& config);

void to_json(nlohmann::json& j, const LightConfig& config);

// Missing keys keep their defaults. Throws nlohmann::json::exception on wrong value types and
// std::invalid_argument on an unknown normalization mode.
void from_json(const nlohmann::json& j, LightConfig& config);

} // namespace SweepLight

#include "LightConfig.h"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace SweepLight {

void to_json(nlohmann::json& j, const LightConfig& config)
{
    j = nlohmann::json{
        { "cache_enabled", config.cache_enabled },
        { "cache_capacity", config.cache_capacity },
        { "diagonal_mult", config.diagonal_mult },
        { "gamma_enabled", config.gamma_enabled },
        { "luminance_threshold", config.luminance_threshold },
        { "normalization_mode", toString(config.normalization_mode) },
        { "parallel_min_cells", config.parallel_min_cells },
        { "wall_min_brightness", config.wall_min_brightness },
    };
}

void from_json(const nlohmann::json& j, LightConfig& config)
{
    config = getDefaultLightConfig();
    config.cache_enabled = j.value("cache_enabled", config.cache_enabled);
    config.cache_capacity = j.value("cache_capacity", config.cache_capacity);
    config.diagonal_mult = j.value("diagonal_mult", config.diagonal_mult);
    config.gamma_enabled = j.value("gamma_enabled", config.gamma_enabled);
    config.luminance_threshold = j.value("luminance_threshold", config.luminance_threshold);
    config.parallel_min_cells = j.value("parallel_min_cells", config.parallel_min_cells);
    config.wall_min_brightness = j.value("wall_min_brightness", config.wall_min_brightness);

    if (j.contains("normalization_mode")) {
        const auto name = j.at("normalization_mode").get<std::string>();
        const auto mode = parseNormalizationMode(name);
        if (!mode) {
            throw std::invalid_argument("Unknown normalization_mode '" + name + "'");
        }
        config.normalization_mode = *mode;
    }
}

LightConfig getDefaultLightConfig()
{
    return LightConfig{
        .cache_enabled = true,
        .cache_capacity = 256,
        .diagonal_mult = kSqrt2,
        .gamma_enabled = false,
        .luminance_threshold = 1.0f,
        .normalization_mode = NormalizationMode::Standard,
        .parallel_min_cells = 2500,
        .wall_min_brightness = 0.12f,
    };
}

SweepConfig toSweepConfig(const LightConfig& config)
{
    return SweepConfig{
        .diagonal_mult = config.diagonal_mult,
        .parallel_min_cells = config.parallel_min_cells,
    };
}

NormalizerConfig toNormalizerConfig(const LightConfig& config)
{
    return NormalizerConfig{
        .mode = config.normalization_mode,
        .luminance_threshold = config.luminance_threshold,
        .wall_min_brightness = config.wall_min_brightness,
        .gamma_enabled = config.gamma_enabled,
        .gamma = 2.2f,
    };
}

} // namespace SweepLight

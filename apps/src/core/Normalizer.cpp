#include "Normalizer.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace SweepLight {

using ColorNames::RgbF;

const char* toString(NormalizationMode mode)
{
    switch (mode) {
        case NormalizationMode::Standard:
            return "standard";
        case NormalizationMode::BrightnessLimited:
            return "brightness_limited";
        case NormalizationMode::Perceptual:
            return "perceptual";
    }
    return "standard";
}

std::optional<NormalizationMode> parseNormalizationMode(const std::string& name)
{
    if (name == "standard") {
        return NormalizationMode::Standard;
    }
    if (name == "brightness_limited" || name == "brightness-limited") {
        return NormalizationMode::BrightnessLimited;
    }
    if (name == "perceptual") {
        return NormalizationMode::Perceptual;
    }
    return std::nullopt;
}

namespace {

RgbF mapPerceptual(RgbF c, float threshold)
{
    const float lum = ColorNames::luminance(c);
    if (lum > threshold) {
        c *= threshold / lum;
    }
    // A saturated primary can still exceed 1 under the luminance cap.
    const float peak = c.maxChannel();
    if (peak > 1.0f) {
        c *= 1.0f / peak;
    }
    return c;
}

float applyGamma(float v, float gamma)
{
    return v > 0.0f ? std::pow(v, gamma) : 0.0f;
}

} // namespace

Normalizer::Normalizer(NormalizerConfig config, int parallelMinCells)
    : config_(config), parallelMinCells_(parallelMinCells)
{
    if (!(config_.luminance_threshold > 0.0f)) {
        config_.luminance_threshold = 1.0f;
    }
    config_.wall_min_brightness = ColorNames::clampUnit(config_.wall_min_brightness);
    if (!(config_.gamma > 0.0f)) {
        config_.gamma = 2.2f;
    }
}

float Normalizer::maxChannel(const ColorGrid& grid)
{
    const RgbF* cells = grid.begin();
    const size_t count = grid.size();
    float peak = 0.0f;

#pragma omp parallel for schedule(static) reduction(max : peak) if (count >= 2500)
    for (size_t i = 0; i < count; ++i) {
        // NaN compares false and is skipped.
        const float m = cells[i].maxChannel();
        if (m > peak) {
            peak = m;
        }
    }
    return peak;
}

float Normalizer::normalizationFactor(const ColorGrid& grid) const
{
    switch (config_.mode) {
        case NormalizationMode::BrightnessLimited: {
            const float peak = maxChannel(grid);
            return peak > 1.0f ? 1.0f / peak : 1.0f;
        }
        case NormalizationMode::Perceptual:
            return config_.luminance_threshold;
        case NormalizationMode::Standard:
            break;
    }
    return 1.0f;
}

Result<ColorGrid, LightingError> Normalizer::normalize(
    const ColorGrid& input, const WallMask* walls) const
{
    ColorGrid out = input;
    auto done = normalizeInPlace(out, walls);
    if (done.isError()) {
        return Result<ColorGrid, LightingError>::error(done.errorValue());
    }
    return Result<ColorGrid, LightingError>::okay(std::move(out));
}

Result<bool, LightingError> Normalizer::normalizeInPlace(ColorGrid& grid, const WallMask* walls) const
{
    if (walls != nullptr && (walls->width() != grid.width || walls->height() != grid.height)) {
        return Result<bool, LightingError>::error(LightingError::invalidDimensions(fmt::format(
            "Wall mask {}x{} does not match grid {}x{}",
            walls->width(),
            walls->height(),
            grid.width,
            grid.height)));
    }

    const NormalizationMode mode = config_.mode;
    const float frameScale =
        mode == NormalizationMode::BrightnessLimited ? normalizationFactor(grid) : 1.0f;
    const float threshold = config_.luminance_threshold;
    const bool gamma = config_.gamma_enabled;
    const float gammaPower = config_.gamma;
    const float wallMin = config_.wall_min_brightness;

    RgbF* cells = grid.begin();
    const size_t count = grid.size();

#pragma omp parallel for schedule(static) if (count >= static_cast<size_t>(parallelMinCells_))
    for (size_t i = 0; i < count; ++i) {
        RgbF c = cells[i];
        switch (mode) {
            case NormalizationMode::Standard:
                break;
            case NormalizationMode::BrightnessLimited:
                c *= frameScale;
                break;
            case NormalizationMode::Perceptual:
                c = mapPerceptual(c, threshold);
                break;
        }
        c = ColorNames::clampUnit(c);

        if (gamma) {
            c = RgbF(
                applyGamma(c.r, gammaPower), applyGamma(c.g, gammaPower), applyGamma(c.b, gammaPower));
        }

        if (walls != nullptr && walls->isWall(i)) {
            c = RgbF(std::max(c.r, wallMin), std::max(c.g, wallMin), std::max(c.b, wallMin));
        }
        cells[i] = c;
    }

    LOG_TRACE(
        Normalize,
        "Normalized {}x{} ({}, scale {}, gamma {})",
        grid.width,
        grid.height,
        toString(mode),
        frameScale,
        gamma ? "on" : "off");
    return Result<bool, LightingError>::okay(true);
}

LightBuffer Normalizer::toPixels(const ColorGrid& grid)
{
    LightBuffer pixels;
    pixels.pack(grid);
    return pixels;
}

} // namespace SweepLight

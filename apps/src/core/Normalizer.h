#pragma once

#include "ColorBlender.h"
#include "LightBuffer.h"
#include "LightingError.h"
#include "Result.h"
#include "WallMask.h"
#include <cstdint>
#include <optional>
#include <string>

namespace SweepLight {

enum class NormalizationMode : uint8_t {
    Standard,          // Per-channel clamp to [0, 1].
    BrightnessLimited, // Whole frame scaled by 1 / max channel when it exceeds 1.
    Perceptual,        // Per cell, luminance capped at a threshold, hue preserved.
};

const char* toString(NormalizationMode mode);
std::optional<NormalizationMode> parseNormalizationMode(const std::string& name);

struct NormalizerConfig {
    NormalizationMode mode = NormalizationMode::Standard;
    float luminance_threshold = 1.0f;
    float wall_min_brightness = 0.12f;
    bool gamma_enabled = false;
    float gamma = 2.2f;
};

/**
 * Maps unbounded linear RGB into the displayable [0, 1] range.
 *
 * Order per cell: mode mapping, final clamp, optional gamma pre-darkening, then the wall rule,
 * which raises every channel of a wall cell to at least wall_min_brightness in every mode.
 */
class Normalizer {
public:
    explicit Normalizer(NormalizerConfig config = {}, int parallelMinCells = 2500);

    Result<ColorGrid, LightingError> normalize(
        const ColorGrid& input, const WallMask* walls = nullptr) const;

    Result<bool, LightingError> normalizeInPlace(
        ColorGrid& grid, const WallMask* walls = nullptr) const;

    // Scale the current mode applies frame-wide: 1/max for brightness-limited frames above 1,
    // the luminance threshold for perceptual mode, otherwise 1.
    float normalizationFactor(const ColorGrid& grid) const;

    static float maxChannel(const ColorGrid& grid);

    // 0xRRGGBBAA display pixels, opaque.
    static LightBuffer toPixels(const ColorGrid& grid);

    const NormalizerConfig& getConfig() const { return config_; }

private:
    NormalizerConfig config_;
    int parallelMinCells_;
};

} // namespace SweepLight

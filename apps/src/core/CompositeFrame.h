#pragma once

#include "ColorNames.h"
#include "LightingError.h"
#include "Normalizer.h"
#include "Result.h"
#include "SubpixelInterpolator.h"
#include "WallMask.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <zpp_bits.h>

namespace SweepLight {

/**
 * Everything the GPU compositing backend needs to blend and tone-map one light on its side.
 *
 * attenuation holds one row-major buffer per active lattice corner, with the matching bilinear
 * weight at the same index in weights. wall_bits is WallMask::pack() output (empty when the
 * frame has no walls).
 */
struct CompositeFrame {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<std::vector<float>> attenuation;
    std::vector<float> weights;
    std::vector<uint32_t> wall_bits;
    std::array<float, 3> color{ 1.0f, 1.0f, 1.0f };
    NormalizationMode normalization_mode = NormalizationMode::Standard;
    float normalization_factor = 1.0f;
    float wall_min_brightness = 0.12f;
    bool gamma_enabled = false;

    using serialize = zpp::bits::members<10>;
};

// Color is the light's linear RGB already scaled by its intensity.
Result<CompositeFrame, LightingError> buildCompositeFrame(
    const SubpixelSample& sample,
    const ColorNames::RgbF& color,
    const Normalizer& normalizer,
    const WallMask* walls = nullptr);

Result<std::vector<std::byte>, std::string> serializeCompositeFrame(const CompositeFrame& frame);

Result<CompositeFrame, std::string> deserializeCompositeFrame(std::span<const std::byte> bytes);

} // namespace SweepLight

#include "CompositeFrame.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <system_error>
#include <utility>

namespace SweepLight {

namespace {

// Peak channel of the composited light, computed without materializing the color grid.
float compositePeak(const SubpixelSample& sample, const ColorNames::RgbF& color)
{
    const size_t count = static_cast<size_t>(sample.width) * static_cast<size_t>(sample.height);
    float peakAttenuation = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        float value = 0.0f;
        for (size_t corner = 0; corner < 4; ++corner) {
            if (sample.corners[corner]) {
                value += sample.weights[corner] * sample.corners[corner]->data[i];
            }
        }
        peakAttenuation = std::max(peakAttenuation, value);
    }
    return peakAttenuation * color.maxChannel();
}

} // namespace

Result<CompositeFrame, LightingError> buildCompositeFrame(
    const SubpixelSample& sample,
    const ColorNames::RgbF& color,
    const Normalizer& normalizer,
    const WallMask* walls)
{
    if (sample.width <= 0 || sample.height <= 0 || sample.activeCount() == 0) {
        return Result<CompositeFrame, LightingError>::error(
            LightingError::invalidDimensions("Composite frame needs a non-empty sample"));
    }
    if (walls != nullptr && (walls->width() != sample.width || walls->height() != sample.height)) {
        return Result<CompositeFrame, LightingError>::error(LightingError::invalidDimensions(
            fmt::format(
                "Wall mask {}x{} does not match sample {}x{}",
                walls->width(),
                walls->height(),
                sample.width,
                sample.height)));
    }

    const NormalizerConfig& config = normalizer.getConfig();

    CompositeFrame frame;
    frame.width = sample.width;
    frame.height = sample.height;
    for (size_t corner = 0; corner < 4; ++corner) {
        if (!sample.corners[corner]) {
            continue;
        }
        frame.attenuation.push_back(sample.corners[corner]->data);
        frame.weights.push_back(sample.weights[corner]);
    }
    if (walls != nullptr) {
        frame.wall_bits = walls->pack();
    }
    frame.color = { color.r, color.g, color.b };
    frame.normalization_mode = config.mode;
    frame.wall_min_brightness = config.wall_min_brightness;
    frame.gamma_enabled = config.gamma_enabled;

    switch (config.mode) {
        case NormalizationMode::BrightnessLimited: {
            const float peak = compositePeak(sample, color);
            frame.normalization_factor = peak > 1.0f ? 1.0f / peak : 1.0f;
            break;
        }
        case NormalizationMode::Perceptual:
            frame.normalization_factor = config.luminance_threshold;
            break;
        case NormalizationMode::Standard:
            frame.normalization_factor = 1.0f;
            break;
    }

    return Result<CompositeFrame, LightingError>::okay(std::move(frame));
}

Result<std::vector<std::byte>, std::string> serializeCompositeFrame(const CompositeFrame& frame)
{
    std::vector<std::byte> bytes;
    auto out = zpp::bits::out(bytes);
    if (auto result = out(frame); zpp::bits::failure(result)) {
        return Result<std::vector<std::byte>, std::string>::error(
            "Failed to serialize composite frame: " + std::make_error_code(result.code).message());
    }

    LOG_TRACE(
        Pipeline,
        "Serialized {}x{} composite frame ({} layers, {} bytes)",
        frame.width,
        frame.height,
        frame.attenuation.size(),
        bytes.size());
    return Result<std::vector<std::byte>, std::string>::okay(std::move(bytes));
}

Result<CompositeFrame, std::string> deserializeCompositeFrame(std::span<const std::byte> bytes)
{
    CompositeFrame frame;
    auto in = zpp::bits::in(bytes);
    if (auto result = in(frame); zpp::bits::failure(result)) {
        return Result<CompositeFrame, std::string>::error(
            "Failed to deserialize composite frame: " + std::make_error_code(result.code).message());
    }
    return Result<CompositeFrame, std::string>::okay(std::move(frame));
}

} // namespace SweepLight

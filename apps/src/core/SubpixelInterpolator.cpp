#include "SubpixelInterpolator.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace SweepLight {

size_t SubpixelSample::activeCount() const
{
    return static_cast<size_t>(std::count_if(
        corners.begin(), corners.end(), [](const auto& grid) { return grid != nullptr; }));
}

SubpixelInterpolator::SubpixelInterpolator(const SweepEngine& engine, AttenuationCache* cache)
    : engine_(engine), cache_(cache)
{}

std::array<float, 4> SubpixelInterpolator::bilinearWeights(float fx, float fy)
{
    return {
        (1.0f - fx) * (1.0f - fy),
        fx * (1.0f - fy),
        (1.0f - fx) * fy,
        fx * fy,
    };
}

Result<SubpixelSample, LightingError> SubpixelInterpolator::sample(
    const TransmittanceField& field, Vector2f position, bool use_cache) const
{
    if (!position.isFinite()) {
        return Result<SubpixelSample, LightingError>::error(
            LightingError::outOfBounds("Light position is not finite"));
    }

    const float floorX = std::floor(position.x);
    const float floorY = std::floor(position.y);
    if (floorX < 0.0f || floorY < 0.0f || floorX >= static_cast<float>(field.width)
        || floorY >= static_cast<float>(field.height)) {
        return Result<SubpixelSample, LightingError>::error(LightingError::outOfBounds(fmt::format(
            "Position ({}, {}) outside {}x{} grid",
            position.x,
            position.y,
            field.width,
            field.height)));
    }

    const int x0 = static_cast<int>(floorX);
    const int y0 = static_cast<int>(floorY);
    const int x1 = std::min(x0 + 1, field.width - 1);
    const int y1 = std::min(y0 + 1, field.height - 1);

    SubpixelSample result;
    result.width = field.width;
    result.height = field.height;
    result.lattice = { Vector2i{ x0, y0 }, Vector2i{ x1, y0 }, Vector2i{ x0, y1 }, Vector2i{ x1, y1 } };
    result.weights = bilinearWeights(position.x - floorX, position.y - floorY);

    // Revision 0 is a hand-built field with no content stamp, so it cannot be keyed.
    const bool cached = use_cache && cache_ != nullptr && field.revision != 0;
    std::array<std::optional<LightingError>, 4> errors;

#pragma omp parallel for schedule(static, 1) \
    if (field.cardinal.size() >= static_cast<size_t>(engine_.getConfig().parallel_min_cells))
    for (int corner = 0; corner < 4; ++corner) {
        if (result.weights[corner] == 0.0f) {
            continue;
        }

        const Vector2i cell = result.lattice[corner];
        if (cached) {
            auto grid = cache_->getOrCompute(
                AttenuationKey::forSource(field, cell.x, cell.y),
                [&]() { return engine_.sweep(field, cell.x, cell.y); });
            if (grid.isError()) {
                errors[corner] = grid.errorValue();
            }
            else {
                result.corners[corner] = grid.value();
            }
        }
        else {
            auto grid = engine_.sweep(field, cell.x, cell.y);
            if (grid.isError()) {
                errors[corner] = grid.errorValue();
            }
            else {
                result.corners[corner] = std::make_shared<const AttenuationGrid>(grid.takeValue());
            }
        }
    }

    for (const auto& error : errors) {
        if (error) {
            return Result<SubpixelSample, LightingError>::error(*error);
        }
    }

    LOG_TRACE(
        Interpolate,
        "Sampled ({}, {}) with {} corner(s){}",
        position.x,
        position.y,
        result.activeCount(),
        cached ? " (cached)" : "");
    return Result<SubpixelSample, LightingError>::okay(std::move(result));
}

AttenuationGrid SubpixelInterpolator::blend(const SubpixelSample& sample) const
{
    AttenuationGrid out(sample.width, sample.height, 0.0f);
    const size_t count = out.size();

    for (size_t corner = 0; corner < 4; ++corner) {
        if (!sample.corners[corner]) {
            continue;
        }
        const float weight = sample.weights[corner];
        const float* src = sample.corners[corner]->begin();
        float* dst = out.begin();

#pragma omp parallel for schedule(static) \
    if (count >= static_cast<size_t>(engine_.getConfig().parallel_min_cells))
        for (size_t i = 0; i < count; ++i) {
            dst[i] += weight * src[i];
        }
    }

    return out;
}

Result<AttenuationGrid, LightingError> SubpixelInterpolator::calculate(
    const TransmittanceField& field, Vector2f position, bool use_cache) const
{
    auto sampled = sample(field, position, use_cache);
    if (sampled.isError()) {
        return Result<AttenuationGrid, LightingError>::error(sampled.errorValue());
    }

    const SubpixelSample& s = sampled.value();
    if (s.activeCount() == 1 && s.weights[0] == 1.0f) {
        // Integral position: the single sweep is the answer.
        return Result<AttenuationGrid, LightingError>::okay(*s.corners[0]);
    }
    return Result<AttenuationGrid, LightingError>::okay(blend(s));
}

Result<AttenuationGrid, LightingError> SubpixelInterpolator::calculate(
    const DecayGrid& grid, Vector2f position, float decay_rate) const
{
    auto field = engine_.prepare(grid, decay_rate);
    if (field.isError()) {
        return Result<AttenuationGrid, LightingError>::error(field.errorValue());
    }
    return calculate(field.value(), position, false);
}

} // namespace SweepLight

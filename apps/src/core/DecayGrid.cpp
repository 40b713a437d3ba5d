#include "DecayGrid.h"
#include "ColorNames.h"
#include <algorithm>
#include <atomic>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace SweepLight {

uint64_t DecayGrid::nextRevision()
{
    static std::atomic<uint64_t> counter{ 0 };
    return ++counter;
}

DecayGrid::DecayGrid(int width, int height, float fill)
{
    resize(width, height, fill);
}

Result<bool, LightingError> DecayGrid::validateShape(int width, int height, size_t length)
{
    if (width <= 0 || height <= 0) {
        return Result<bool, LightingError>::error(LightingError::invalidDimensions(
            fmt::format("Grid must be non-empty, got {}x{}", width, height)));
    }

    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (length != expected) {
        return Result<bool, LightingError>::error(LightingError::invalidDimensions(fmt::format(
            "Buffer length {} does not match {}x{} ({} cells)", length, width, height, expected)));
    }

    return Result<bool, LightingError>::okay(true);
}

Result<DecayGrid, LightingError> DecayGrid::fromFlat(
    int width, int height, const std::vector<float>& values)
{
    auto shape = validateShape(width, height, values.size());
    if (shape.isError()) {
        return Result<DecayGrid, LightingError>::error(shape.errorValue());
    }

    DecayGrid grid;
    grid.cells_.width = width;
    grid.cells_.height = height;
    grid.cells_.data.resize(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        grid.cells_.data[i] = ColorNames::clampUnit(values[i]);
    }
    grid.touch();
    return Result<DecayGrid, LightingError>::okay(std::move(grid));
}

void DecayGrid::set(int x, int y, float decay)
{
    cells_.at(x, y) = ColorNames::clampUnit(decay);
    touch();
}

void DecayGrid::fill(float decay)
{
    cells_.clear(ColorNames::clampUnit(decay));
    touch();
}

void DecayGrid::resize(int width, int height, float fill)
{
    cells_.resize(std::max(width, 0), std::max(height, 0), ColorNames::clampUnit(fill));
    touch();
}

void DecayGrid::touch()
{
    revision_ = nextRevision();
}

} // namespace SweepLight

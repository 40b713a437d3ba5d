#pragma once

#include "GridBuffer.h"
#include "LightingError.h"
#include "Result.h"
#include <cstdint>
#include <vector>

namespace SweepLight {

/**
 * Per-cell opacity in [0, 1] (0 = transparent, 1 = opaque), row-major.
 *
 * Every mutation stamps the grid with a fresh revision drawn from a process-wide counter, so
 * equal revisions imply equal contents. AttenuationCache keys on the revision.
 */
class DecayGrid {
public:
    DecayGrid() = default;
    DecayGrid(int width, int height, float fill = 0.0f);

    // Validates the shape and clamps every value.
    static Result<DecayGrid, LightingError> fromFlat(
        int width, int height, const std::vector<float>& values);

    // Checks a caller-supplied flat buffer against the given shape.
    static Result<bool, LightingError> validateShape(int width, int height, size_t length);

    // Fresh value from the process-wide revision counter. Never returns 0.
    static uint64_t nextRevision();

    int width() const { return cells_.width; }
    int height() const { return cells_.height; }
    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }
    uint64_t revision() const { return revision_; }

    float at(int x, int y) const { return cells_.at(x, y); }
    const float* data() const { return cells_.begin(); }
    const GridBuffer<float>& buffer() const { return cells_; }

    void set(int x, int y, float decay);
    void fill(float decay);
    void resize(int width, int height, float fill = 0.0f);

private:
    void touch();

    GridBuffer<float> cells_;
    uint64_t revision_ = 0;
};

} // namespace SweepLight

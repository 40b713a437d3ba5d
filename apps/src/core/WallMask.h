#pragma once

#include "GridBuffer.h"
#include <cstdint>
#include <vector>

namespace SweepLight {

/**
 * Optional per-cell wall flags, independent of the decay grid. Wall cells are raised to a
 * minimum display brightness by the Normalizer.
 */
class WallMask {
public:
    WallMask() = default;
    WallMask(int width, int height);

    int width() const { return cells_.width; }
    int height() const { return cells_.height; }
    size_t size() const { return cells_.size(); }

    bool isWall(int x, int y) const { return cells_.at(x, y) != 0; }
    bool isWall(size_t index) const { return cells_.data[index] != 0; }

    void set(int x, int y, bool wall) { cells_.at(x, y) = wall ? 1 : 0; }
    void toggle(int x, int y) { cells_.at(x, y) ^= 1; }
    void clear() { cells_.clear(0); }

    size_t count() const;

    /**
     * Packs the mask 1 bit per cell, 32 cells per word: cell i lives in word i / 32 at bit
     * i % 32. This is the layout the GPU compositing backend consumes.
     */
    std::vector<uint32_t> pack() const;

    static WallMask unpack(int width, int height, const std::vector<uint32_t>& words);

private:
    GridBuffer<uint8_t> cells_;
};

} // namespace SweepLight

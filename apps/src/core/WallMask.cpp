#include "WallMask.h"
#include <algorithm>

namespace SweepLight {

WallMask::WallMask(int width, int height)
{
    cells_.resize(std::max(width, 0), std::max(height, 0), 0);
}

size_t WallMask::count() const
{
    return static_cast<size_t>(std::count(cells_.data.begin(), cells_.data.end(), uint8_t{ 1 }));
}

std::vector<uint32_t> WallMask::pack() const
{
    std::vector<uint32_t> words((cells_.size() + 31) / 32, 0u);
    for (size_t i = 0; i < cells_.size(); ++i) {
        if (cells_.data[i] != 0) {
            words[i / 32] |= 1u << (i % 32);
        }
    }
    return words;
}

WallMask WallMask::unpack(int width, int height, const std::vector<uint32_t>& words)
{
    WallMask mask(width, height);
    const size_t count = std::min(mask.size(), words.size() * 32);
    for (size_t i = 0; i < count; ++i) {
        mask.cells_.data[i] = (words[i / 32] >> (i % 32)) & 1u;
    }
    return mask;
}

} // namespace SweepLight

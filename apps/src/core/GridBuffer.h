#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace SweepLight {

/**
 * Row-major 2D buffer (index = y * width + x) backing every per-cell grid in the library.
 * A single contiguous vector keeps the sweeps cache friendly.
 */
template <typename T>
struct GridBuffer {
    int width = 0;
    int height = 0;
    std::vector<T> data;

    GridBuffer() = default;
    GridBuffer(int w, int h, T default_value = T{}) { resize(w, h, default_value); }

    void resize(int w, int h, T default_value = T{})
    {
        width = w;
        height = h;
        data.assign(static_cast<size_t>(w) * static_cast<size_t>(h), default_value);
    }

    void clear(T value = T{}) { std::fill(data.begin(), data.end(), value); }

    size_t index(int x, int y) const
    {
        return static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x);
    }

    template <typename U>
    bool sameShape(const GridBuffer<U>& other) const
    {
        return width == other.width && height == other.height;
    }

    const T& at(int x, int y) const { return data[index(x, y)]; }

    T& at(int x, int y) { return data[index(x, y)]; }

    T* begin() { return data.data(); }

    const T* begin() const { return data.data(); }

    size_t size() const { return data.size(); }

    bool empty() const { return data.empty(); }
};

// Fraction of source intensity surviving at each cell, in [0, 1].
using AttenuationGrid = GridBuffer<float>;

} // namespace SweepLight

#pragma once

#include <cmath>

namespace SweepLight {

template <typename T>
struct Vector2 {
    T x{};
    T y{};

    bool operator==(const Vector2& other) const { return x == other.x && y == other.y; }

    bool isFinite() const { return std::isfinite(x) && std::isfinite(y); }
};

using Vector2f = Vector2<float>;
using Vector2i = Vector2<int>;

} // namespace SweepLight

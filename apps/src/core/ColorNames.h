#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>

// Named light colors and RGBA utilities.
// Color values defined in ColorNames.cpp to minimize rebuild impact.
namespace ColorNames {

// Linear RGB in float space. Accumulated light is unbounded (HDR) until the Normalizer maps it
// to [0, 1].
struct RgbF {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    RgbF() = default;
    RgbF(float r_, float g_, float b_) : r(r_), g(g_), b(b_) {}

    RgbF& operator+=(const RgbF& other)
    {
        r += other.r;
        g += other.g;
        b += other.b;
        return *this;
    }

    RgbF& operator*=(float s)
    {
        r *= s;
        g *= s;
        b *= s;
        return *this;
    }

    float maxChannel() const { return std::max(r, std::max(g, b)); }
};

inline RgbF operator*(RgbF c, float s)
{
    c *= s;
    return c;
}

// Rec. 709 relative luminance.
inline float luminance(const RgbF& c)
{
    return 0.2126f * c.r + 0.7152f * c.g + 0.0722f * c.b;
}

// Clamp to [0, 1]; NaN maps to 0.
inline float clampUnit(float v)
{
    if (!(v > 0.0f)) {
        return 0.0f;
    }
    return v < 1.0f ? v : 1.0f;
}

inline RgbF clampUnit(const RgbF& c)
{
    return RgbF(clampUnit(c.r), clampUnit(c.g), clampUnit(c.b));
}

inline RgbF toRgbF(uint32_t color)
{
    constexpr float inv255 = 1.0f / 255.0f;
    return RgbF(
        static_cast<float>((color >> 24) & 0xFF) * inv255,
        static_cast<float>((color >> 16) & 0xFF) * inv255,
        static_cast<float>((color >> 8) & 0xFF) * inv255);
}

// Pack to 0xRRGGBBAA with opaque alpha, clamping each channel to [0, 1].
inline uint32_t toRgba(const RgbF& c)
{
    auto toByte = [](float v) -> uint32_t {
        return static_cast<uint32_t>(std::lround(clampUnit(v) * 255.0f));
    };
    return (toByte(c.r) << 24) | (toByte(c.g) << 16) | (toByte(c.b) << 8) | 0xFF;
}

// Pack components (0-255) into RGBA.
inline uint32_t rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
{
    return (static_cast<uint32_t>(r) << 24) | (static_cast<uint32_t>(g) << 16)
        | (static_cast<uint32_t>(b) << 8) | static_cast<uint32_t>(a);
}

// Light sources.
uint32_t warmTorch();
uint32_t coolMoonlight();

// Primaries and neutrals.
uint32_t blue();
uint32_t red();
uint32_t white();

} // namespace ColorNames

#pragma once

#include "ColorNames.h"
#include "GridBuffer.h"

namespace SweepLight {

/**
 * Display-ready light, one packed 0xRRGGBBAA pixel per cell. This is the buffer handed to
 * file export and viewers.
 */
struct LightBuffer : GridBuffer<uint32_t> {
    // Resize with black opaque default (0x000000FF).
    void resize(int w, int h) { GridBuffer<uint32_t>::resize(w, h, 0x000000FF); }

    // Packs normalized colors; channels are clamped to [0, 1] on the way.
    void pack(const GridBuffer<ColorNames::RgbF>& colors)
    {
        if (!sameShape(colors)) {
            resize(colors.width, colors.height);
        }
        const ColorNames::RgbF* src = colors.begin();
        uint32_t* dst = begin();
        for (size_t i = 0; i < colors.size(); ++i) {
            dst[i] = ColorNames::toRgba(src[i]);
        }
    }
};

} // namespace SweepLight

#pragma once

#include <blend2d.h>

struct LayerStyle {
    BLRgba32 color = BLRgba32(0xFF808080u);
    float opacity = 0.7F;
    bool fill_enabled = true;
    bool stroke_enabled = true;
    float line_width = 1.0F;  // Pixels

    bool operator==(const LayerStyle& other) const
    {
        return color.value == other.color.value && opacity == other.opacity && fill_enabled == other.fill_enabled && stroke_enabled == other.stroke_enabled &&
               line_width == other.line_width;
    }
    bool operator!=(const LayerStyle& other) const { return !(*this == other); }
};

#pragma once

#include <array>

#include <blend2d.h>

namespace color_utils
{
// Seed color of the default layer palette.
const BLRgba32 kLayerPaletteBaseColor(0xFF3A7BD5u);

/**
 * @brief Generates a distinct color for a layer based on its ordinal and a base color using hue rotation.
 *
 * @param layer_index The ordinal of the layer (0-based).
 * @param total_layers The total number of layers (used to determine hue step if not provided explicitly).
 * @param base_color The starting color; saturation, value and alpha are kept.
 * @param hue_step_degrees Fixed degrees to shift hue for each subsequent layer.
 *                         If 0, hues are distributed evenly across 360 degrees over total_layers.
 */
extern BLRgba32 GenerateLayerColor(int layer_index, int total_layers, BLRgba32 base_color, float hue_step_degrees = 30.0F);

// Straight (non-premultiplied) RGBA in [0, 1], the layout shader uniforms expect.
extern std::array<float, 4> ToNormalizedRgba(const BLRgba32& color);

// Same color with alpha replaced by opacity in [0, 1].
extern BLRgba32 WithOpacity(const BLRgba32& color, float opacity);

}  // namespace color_utils

#include "ColorUtils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace color_utils
{
namespace
{
// Hue in degrees [0, 360) of an RGB triple in [0, 1].
float HueOf(float red, float green, float blue)
{
    float const kMax = std::max({red, green, blue});
    float const kDelta = kMax - std::min({red, green, blue});
    if (kDelta == 0.0F) {
        return 0.0F;
    }
    float hue = 0.0F;
    if (kMax == red) {
        hue = (green - blue) / kDelta;
    } else if (kMax == green) {
        hue = ((blue - red) / kDelta) + 2.0F;
    } else {
        hue = ((red - green) / kDelta) + 4.0F;
    }
    hue = std::fmod(hue * 60.0F, 360.0F);
    return hue < 0.0F ? hue + 360.0F : hue;
}

// One channel of an HSV color; n is 5 for red, 3 for green, 1 for blue.
uint32_t HsvChannel(float n, float hue, float sat, float val)
{
    float const kSector = std::fmod(n + (hue / 60.0F), 6.0F);
    float const kWeight = std::max(0.0F, std::min({kSector, 4.0F - kSector, 1.0F}));
    return static_cast<uint32_t>(std::round((val - (val * sat * kWeight)) * 255.0F));
}
}  // namespace

BLRgba32 GenerateLayerColor(int layer_index, int total_layers, BLRgba32 base_color, float hue_step_degrees)
{
    if (total_layers <= 0) {
        return base_color;
    }
    float const kStep = hue_step_degrees == 0.0F ? 360.0F / static_cast<float>(total_layers) : hue_step_degrees;

    float const kRed = static_cast<float>(base_color.r()) / 255.0F;
    float const kGreen = static_cast<float>(base_color.g()) / 255.0F;
    float const kBlue = static_cast<float>(base_color.b()) / 255.0F;
    float const kVal = std::max({kRed, kGreen, kBlue});
    float const kSat = kVal == 0.0F ? 0.0F : (kVal - std::min({kRed, kGreen, kBlue})) / kVal;

    float hue = std::fmod(HueOf(kRed, kGreen, kBlue) + (static_cast<float>(layer_index) * kStep), 360.0F);
    if (hue < 0.0F) {
        hue += 360.0F;
    }
    return BLRgba32(HsvChannel(5.0F, hue, kSat, kVal), HsvChannel(3.0F, hue, kSat, kVal), HsvChannel(1.0F, hue, kSat, kVal), base_color.a());
}

std::array<float, 4> ToNormalizedRgba(const BLRgba32& color)
{
    return {static_cast<float>(color.r()) / 255.0F,
            static_cast<float>(color.g()) / 255.0F,
            static_cast<float>(color.b()) / 255.0F,
            static_cast<float>(color.a()) / 255.0F};
}

BLRgba32 WithOpacity(const BLRgba32& color, float opacity)
{
    float const kClamped = std::max(0.0F, std::min(1.0F, opacity));
    return BLRgba32(color.r(), color.g(), color.b(), static_cast<uint32_t>(std::round(kClamped * 255.0F)));
}

}  // namespace color_utils

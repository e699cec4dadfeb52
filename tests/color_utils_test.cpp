#include <gtest/gtest.h>

#include <cstdlib>

#include "utils/ColorUtils.hpp"

namespace
{
void ExpectColorNear(const BLRgba32& actual, const BLRgba32& expected)
{
    EXPECT_LE(std::abs(static_cast<int>(actual.r()) - static_cast<int>(expected.r())), 1);
    EXPECT_LE(std::abs(static_cast<int>(actual.g()) - static_cast<int>(expected.g())), 1);
    EXPECT_LE(std::abs(static_cast<int>(actual.b()) - static_cast<int>(expected.b())), 1);
    EXPECT_EQ(actual.a(), expected.a());
}
}  // namespace

TEST(ColorUtilsTest, FirstLayerKeepsBaseColor)
{
    ExpectColorNear(color_utils::GenerateLayerColor(0, 5, color_utils::kLayerPaletteBaseColor), color_utils::kLayerPaletteBaseColor);
    // Twelve 30 degree steps come back around.
    ExpectColorNear(color_utils::GenerateLayerColor(12, 20, color_utils::kLayerPaletteBaseColor), color_utils::kLayerPaletteBaseColor);
}

TEST(ColorUtilsTest, HueRotatesByStep)
{
    BLRgba32 const kRed(255, 0, 0, 255);
    ExpectColorNear(color_utils::GenerateLayerColor(1, 3, kRed, 120.0F), BLRgba32(0, 255, 0, 255));
    ExpectColorNear(color_utils::GenerateLayerColor(2, 3, kRed, 120.0F), BLRgba32(0, 0, 255, 255));
    // A zero step spreads hues evenly over the layer count.
    ExpectColorNear(color_utils::GenerateLayerColor(2, 4, kRed, 0.0F), BLRgba32(0, 255, 255, 255));
    ExpectColorNear(color_utils::GenerateLayerColor(3, 0, kRed), kRed);
}

TEST(ColorUtilsTest, OpacityAndNormalization)
{
    BLRgba32 const kColor = color_utils::WithOpacity(BLRgba32(255, 0, 51, 255), 0.4F);
    EXPECT_EQ(kColor.a(), 102U);
    EXPECT_EQ(color_utils::WithOpacity(kColor, 2.0F).a(), 255U);

    std::array<float, 4> const kRgba = color_utils::ToNormalizedRgba(kColor);
    EXPECT_FLOAT_EQ(kRgba[0], 1.0F);
    EXPECT_FLOAT_EQ(kRgba[1], 0.0F);
    EXPECT_FLOAT_EQ(kRgba[2], 0.2F);
    EXPECT_FLOAT_EQ(kRgba[3], 0.4F);
}

#include <gtest/gtest.h>

#include "view/Camera.hpp"
#include "view/Viewport.hpp"

TEST(ViewportTest, WorldBoundsFollowCenterSizeAndZoom)
{
    Viewport const kViewport(Vec2(10, 20), 200, 100, 2.0);
    EXPECT_EQ(kViewport.GetWorldBounds(), BBox(-40, -5, 60, 45));
    EXPECT_TRUE(kViewport.IsValid());
    EXPECT_FALSE(Viewport(Vec2(), 0, 100, 1.0).IsValid());
    EXPECT_FALSE(Viewport(Vec2(), 100, 100, 0.0).IsValid());
}

TEST(ViewportTest, ScreenAndWorldConversionsInvert)
{
    Viewport const kViewport(Vec2(3, -7), 640, 480, 4.0);

    Vec2 const kScreenCenter = kViewport.WorldToScreen(Vec2(3, -7));
    EXPECT_DOUBLE_EQ(kScreenCenter.x_ax, 320.0);
    EXPECT_DOUBLE_EQ(kScreenCenter.y_ax, 240.0);

    // Screen y grows downward while world y grows upward.
    Vec2 const kAbove = kViewport.ScreenToWorld(Vec2(320, 200));
    EXPECT_DOUBLE_EQ(kAbove.x_ax, 3.0);
    EXPECT_DOUBLE_EQ(kAbove.y_ax, 3.0);

    Vec2 const kRoundTrip = kViewport.ScreenToWorld(kViewport.WorldToScreen(Vec2(12.5, 8.25)));
    EXPECT_NEAR(kRoundTrip.x_ax, 12.5, 1e-12);
    EXPECT_NEAR(kRoundTrip.y_ax, 8.25, 1e-12);

    Vec2 const kDelta = kViewport.ScreenDeltaToWorldDelta(Vec2(8, 8));
    EXPECT_DOUBLE_EQ(kDelta.x_ax, 2.0);
    EXPECT_DOUBLE_EQ(kDelta.y_ax, -2.0);

    Vec2 const kScreenDelta = kViewport.WorldDeltaToScreenDelta(kDelta);
    EXPECT_DOUBLE_EQ(kScreenDelta.x_ax, 8.0);
    EXPECT_DOUBLE_EQ(kScreenDelta.y_ax, 8.0);
}

TEST(ViewportTest, ScreenRectToWorldOrdersCorners)
{
    Viewport const kViewport(Vec2(0, 0), 100, 100, 1.0);
    EXPECT_EQ(kViewport.ScreenRectToWorld(Vec2(60, 10), Vec2(40, 90)), BBox(-10, -40, 10, 40));
}

TEST(CameraTest, ZoomIsClampedAndRejectsInvalidValues)
{
    Camera camera;
    camera.SetZoom(1e9);
    EXPECT_DOUBLE_EQ(camera.GetZoom(), Camera::kMaxZoomLevel);
    camera.SetZoom(1e-12);
    EXPECT_DOUBLE_EQ(camera.GetZoom(), Camera::kMinZoomLevel);
    camera.SetZoom(-3.0);
    EXPECT_DOUBLE_EQ(camera.GetZoom(), Camera::kMinZoomLevel);
}

TEST(CameraTest, ZoomAtKeepsAnchorFixed)
{
    Camera camera;
    camera.SetPosition(Vec2(50, 50));
    camera.SetZoom(2.0);

    Vec2 const kAnchor(100, 30);
    Vec2 const kWorldBefore = camera.ToViewport(400, 300).ScreenToWorld(kAnchor);
    camera.ZoomAt(kAnchor, 1.2, 400, 300);
    Vec2 const kWorldAfter = camera.ToViewport(400, 300).ScreenToWorld(kAnchor);

    EXPECT_DOUBLE_EQ(camera.GetZoom(), 2.4);
    EXPECT_NEAR(kWorldAfter.x_ax, kWorldBefore.x_ax, 1e-9);
    EXPECT_NEAR(kWorldAfter.y_ax, kWorldBefore.y_ax, 1e-9);
}

TEST(CameraTest, DraggingMovesContentWithTheCursor)
{
    Camera camera;
    camera.SetZoom(2.0);
    Vec2 const kWorldPoint(10, 10);
    Vec2 const kScreenBefore = camera.ToViewport(200, 200).WorldToScreen(kWorldPoint);

    camera.PanByScreenDelta(Vec2(30, -20), 200, 200);
    Vec2 const kScreenAfter = camera.ToViewport(200, 200).WorldToScreen(kWorldPoint);
    EXPECT_NEAR(kScreenAfter.x_ax - kScreenBefore.x_ax, 30.0, 1e-9);
    EXPECT_NEAR(kScreenAfter.y_ax - kScreenBefore.y_ax, -20.0, 1e-9);
}

TEST(CameraTest, FocusOnBoundsFitsLimitingAxis)
{
    Camera camera;
    camera.FocusOnBounds(BBox(0, 0, 100, 50), 800, 600, 0.0);
    EXPECT_EQ(camera.GetPosition(), Vec2(50, 25));
    EXPECT_DOUBLE_EQ(camera.GetZoom(), 8.0);

    camera.FocusOnBounds(BBox(0, 0, 100, 50), 800, 600, 0.25);
    EXPECT_DOUBLE_EQ(camera.GetZoom(), 800.0 / 125.0);
}

TEST(CameraTest, FocusOnNothingResets)
{
    Camera camera;
    camera.SetPosition(Vec2(5, 5));
    camera.SetZoom(3.0);
    camera.FocusOnBounds(std::nullopt, 800, 600);
    EXPECT_EQ(camera.GetPosition(), Vec2(0, 0));
    EXPECT_DOUBLE_EQ(camera.GetZoom(), Camera::kDefaultZoom);

    // A single point only recenters.
    camera.SetZoom(3.0);
    camera.FocusOnBounds(BBox(7, 8, 7, 8), 800, 600);
    EXPECT_EQ(camera.GetPosition(), Vec2(7, 8));
    EXPECT_DOUBLE_EQ(camera.GetZoom(), 3.0);
}

TEST(CameraTest, ViewChangedFlag)
{
    Camera camera;
    EXPECT_TRUE(camera.WasViewChangedThisFrame());
    camera.ClearViewChangedFlag();
    camera.SetZoom(camera.GetZoom());
    EXPECT_FALSE(camera.WasViewChangedThisFrame());
    camera.Pan(Vec2(1, 0));
    EXPECT_TRUE(camera.WasViewChangedThisFrame());
}

#pragma once

#include "utils/BBox.hpp"
#include "utils/Vec2.hpp"

// Visible window onto the layout: world-space center, device-pixel size and zoom
// (device pixels per world unit). Screen y grows downward, world y grows upward.
class Viewport
{
public:
    Viewport();
    Viewport(const Vec2& center, int width, int height, double zoom);

    void SetCenter(const Vec2& center) { m_center_ = center; }
    void SetSize(int width, int height);
    void SetZoom(double zoom) { m_zoom_ = zoom; }

    [[nodiscard]] const Vec2& GetCenter() const { return m_center_; }
    [[nodiscard]] int GetWidth() const { return m_width_; }
    [[nodiscard]] int GetHeight() const { return m_height_; }
    [[nodiscard]] double GetZoom() const { return m_zoom_; }
    [[nodiscard]] Vec2 GetScreenCenter() const;

    // False for a zero-sized surface or a non-positive zoom.
    [[nodiscard]] bool IsValid() const;

    // World-space box covered by the viewport.
    [[nodiscard]] BBox GetWorldBounds() const;

    [[nodiscard]] Vec2 ScreenToWorld(const Vec2& screen_point) const;
    [[nodiscard]] Vec2 WorldToScreen(const Vec2& world_point) const;
    [[nodiscard]] Vec2 ScreenDeltaToWorldDelta(const Vec2& screen_delta) const;
    [[nodiscard]] Vec2 WorldDeltaToScreenDelta(const Vec2& world_delta) const;

    // World box spanned by a screen-space rectangle given by two corners.
    [[nodiscard]] BBox ScreenRectToWorld(const Vec2& screen_corner_a, const Vec2& screen_corner_b) const;

private:
    Vec2 m_center_;
    int m_width_;
    int m_height_;
    double m_zoom_;
};

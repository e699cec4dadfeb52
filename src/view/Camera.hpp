#pragma once

#include <optional>

#include "utils/BBox.hpp"
#include "utils/Vec2.hpp"
#include "view/Viewport.hpp"

// Interactive pan/zoom state for one view. Produces the Viewport handed to a renderer.
class Camera
{
public:
    Camera();

    void SetPosition(const Vec2& position);
    [[nodiscard]] const Vec2& GetPosition() const;

    void SetZoom(double zoom);  // Device pixels per world unit, clamped to [kMinZoomLevel, kMaxZoomLevel]
    [[nodiscard]] double GetZoom() const;

    void Pan(const Vec2& world_delta);  // Moves the content by delta (camera moves the opposite way)
    void PanByScreenDelta(const Vec2& screen_delta, int viewport_width, int viewport_height);
    // Zooms by factor while keeping the world point under screen_point fixed.
    void ZoomAt(const Vec2& screen_point, double zoom_factor, int viewport_width, int viewport_height);

    void Reset();

    // Fits world_bounds into the viewport with padding (fraction of the extent). With no bounds
    // the camera resets; a degenerate box only recenters.
    void FocusOnBounds(const std::optional<BBox>& world_bounds, int viewport_width, int viewport_height, double padding = 0.1);

    [[nodiscard]] Viewport ToViewport(int viewport_width, int viewport_height) const;

    [[nodiscard]] bool WasViewChangedThisFrame() const { return m_view_changed_this_frame_; }
    void ClearViewChangedFlag() { m_view_changed_this_frame_ = false; }

    static constexpr double kDefaultZoom = 1.0;
    static constexpr double kMinZoomLevel = 1e-6;
    static constexpr double kMaxZoomLevel = 1e6;

private:
    Vec2 m_position_;  // World point at the center of the view
    double m_zoom_;

    bool m_view_changed_this_frame_ = true;  // True for the first frame
};

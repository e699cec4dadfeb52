#include "view/Camera.hpp"

#include <algorithm>
#include <cmath>

namespace
{
const Vec2 kDefaultPosition = {0.0, 0.0};
}

Camera::Camera() : m_position_(kDefaultPosition), m_zoom_(kDefaultZoom), m_view_changed_this_frame_(true) {}

void Camera::SetPosition(const Vec2& position)
{
    if (m_position_ != position) {
        m_position_ = position;
        m_view_changed_this_frame_ = true;
    }
}

const Vec2& Camera::GetPosition() const
{
    return m_position_;
}

void Camera::SetZoom(double zoom)
{
    if (!std::isfinite(zoom) || zoom <= 0.0) {
        return;
    }
    double const kClampedZoom = std::max(kMinZoomLevel, std::min(zoom, kMaxZoomLevel));
    if (m_zoom_ != kClampedZoom) {
        m_zoom_ = kClampedZoom;
        m_view_changed_this_frame_ = true;
    }
}

double Camera::GetZoom() const
{
    return m_zoom_;
}

void Camera::Pan(const Vec2& world_delta)
{
    if (world_delta.x_ax != 0.0 || world_delta.y_ax != 0.0) {
        m_position_ -= world_delta;
        m_view_changed_this_frame_ = true;
    }
}

void Camera::PanByScreenDelta(const Vec2& screen_delta, int viewport_width, int viewport_height)
{
    Pan(ToViewport(viewport_width, viewport_height).ScreenDeltaToWorldDelta(screen_delta));
}

void Camera::ZoomAt(const Vec2& screen_point, double zoom_factor, int viewport_width, int viewport_height)
{
    if (zoom_factor <= 0.0 || zoom_factor == 1.0) {
        return;
    }
    Vec2 const kAnchorWorld = ToViewport(viewport_width, viewport_height).ScreenToWorld(screen_point);
    SetZoom(m_zoom_ * zoom_factor);

    // Shift so the anchor maps back onto the same screen point at the new zoom
    Vec2 const kAnchorAfter = ToViewport(viewport_width, viewport_height).ScreenToWorld(screen_point);
    SetPosition(m_position_ + (kAnchorWorld - kAnchorAfter));
}

void Camera::Reset()
{
    SetPosition(kDefaultPosition);
    SetZoom(kDefaultZoom);
}

void Camera::FocusOnBounds(const std::optional<BBox>& world_bounds, int viewport_width, int viewport_height, double padding)
{
    if (!world_bounds || !world_bounds->IsValid() || viewport_width <= 0 || viewport_height <= 0) {
        Reset();
        return;
    }

    SetPosition(world_bounds->Center());

    double const kPaddedWidth = world_bounds->Width() * (1.0 + padding);
    double const kPaddedHeight = world_bounds->Height() * (1.0 + padding);
    if (kPaddedWidth <= 0.0 && kPaddedHeight <= 0.0) {
        return;
    }

    double zoom = kMaxZoomLevel;
    if (kPaddedWidth > 0.0) {
        zoom = std::min(zoom, static_cast<double>(viewport_width) / kPaddedWidth);
    }
    if (kPaddedHeight > 0.0) {
        zoom = std::min(zoom, static_cast<double>(viewport_height) / kPaddedHeight);
    }
    SetZoom(zoom);
}

Viewport Camera::ToViewport(int viewport_width, int viewport_height) const
{
    return Viewport(m_position_, viewport_width, viewport_height, m_zoom_);
}

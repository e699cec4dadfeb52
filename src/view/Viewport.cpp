#include "view/Viewport.hpp"

#include <algorithm>

Viewport::Viewport() : m_center_(0.0, 0.0), m_width_(0), m_height_(0), m_zoom_(1.0) {}

Viewport::Viewport(const Vec2& center, int width, int height, double zoom) : m_center_(center), m_width_(width), m_height_(height), m_zoom_(zoom) {}

void Viewport::SetSize(int width, int height)
{
    m_width_ = std::max(0, width);
    m_height_ = std::max(0, height);
}

Vec2 Viewport::GetScreenCenter() const
{
    return Vec2(m_width_ / 2.0, m_height_ / 2.0);
}

bool Viewport::IsValid() const
{
    return m_width_ > 0 && m_height_ > 0 && m_zoom_ > 0.0;
}

BBox Viewport::GetWorldBounds() const
{
    if (m_zoom_ <= 0.0) {
        return BBox::FromPoint(m_center_);
    }
    double const kHalfWidth = m_width_ / (2.0 * m_zoom_);
    double const kHalfHeight = m_height_ / (2.0 * m_zoom_);
    return BBox::FromCenter(m_center_, kHalfWidth, kHalfHeight);
}

Vec2 Viewport::ScreenToWorld(const Vec2& screen_point) const
{
    if (m_zoom_ <= 0.0) {
        return m_center_;
    }
    return {m_center_.x_ax + (screen_point.x_ax - m_width_ / 2.0) / m_zoom_, m_center_.y_ax - (screen_point.y_ax - m_height_ / 2.0) / m_zoom_};
}

Vec2 Viewport::WorldToScreen(const Vec2& world_point) const
{
    return {(world_point.x_ax - m_center_.x_ax) * m_zoom_ + m_width_ / 2.0, m_height_ / 2.0 - (world_point.y_ax - m_center_.y_ax) * m_zoom_};
}

Vec2 Viewport::ScreenDeltaToWorldDelta(const Vec2& screen_delta) const
{
    if (m_zoom_ <= 0.0) {
        return {0.0, 0.0};
    }
    return {screen_delta.x_ax / m_zoom_, -screen_delta.y_ax / m_zoom_};
}

Vec2 Viewport::WorldDeltaToScreenDelta(const Vec2& world_delta) const
{
    return {world_delta.x_ax * m_zoom_, -world_delta.y_ax * m_zoom_};
}

BBox Viewport::ScreenRectToWorld(const Vec2& screen_corner_a, const Vec2& screen_corner_b) const
{
    BBox bounds = BBox::FromPoint(ScreenToWorld(screen_corner_a));
    bounds.Expand(ScreenToWorld(screen_corner_b));
    return bounds;
}

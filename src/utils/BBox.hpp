#pragma once

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

#include "utils/Vec2.hpp"

// Axis-aligned bounding box. A BBox always describes a real extent (possibly degenerate,
// min == max); "no geometry" is expressed as an empty std::optional<BBox>.
struct BBox {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    BBox() = default;
    BBox(double min_x_in, double min_y_in, double max_x_in, double max_y_in) : min_x(min_x_in), min_y(min_y_in), max_x(max_x_in), max_y(max_y_in) {}

    static BBox FromPoint(const Vec2& point) { return {point.x_ax, point.y_ax, point.x_ax, point.y_ax}; }
    static BBox FromCenter(const Vec2& center, double half_width, double half_height)
    {
        return {center.x_ax - half_width, center.y_ax - half_height, center.x_ax + half_width, center.y_ax + half_height};
    }

    [[nodiscard]] double Width() const { return max_x - min_x; }
    [[nodiscard]] double Height() const { return max_y - min_y; }
    [[nodiscard]] Vec2 Center() const { return {(min_x + max_x) / 2.0, (min_y + max_y) / 2.0}; }

    [[nodiscard]] bool IsValid() const
    {
        return std::isfinite(min_x) && std::isfinite(min_y) && std::isfinite(max_x) && std::isfinite(max_y) && min_x <= max_x && min_y <= max_y;
    }

    void Expand(const Vec2& point)
    {
        min_x = std::min(min_x, point.x_ax);
        min_y = std::min(min_y, point.y_ax);
        max_x = std::max(max_x, point.x_ax);
        max_y = std::max(max_y, point.y_ax);
    }

    void Merge(const BBox& other)
    {
        min_x = std::min(min_x, other.min_x);
        min_y = std::min(min_y, other.min_y);
        max_x = std::max(max_x, other.max_x);
        max_y = std::max(max_y, other.max_y);
    }

    [[nodiscard]] BBox Grown(double margin) const { return {min_x - margin, min_y - margin, max_x + margin, max_y + margin}; }

    // Scales the box about its center.
    [[nodiscard]] BBox Scaled(double factor) const
    {
        Vec2 const center = Center();
        return FromCenter(center, Width() * factor / 2.0, Height() * factor / 2.0);
    }

    // Inclusive: touching boxes intersect.
    [[nodiscard]] bool Intersects(const BBox& other) const
    {
        return !(max_x < other.min_x || min_x > other.max_x || max_y < other.min_y || min_y > other.max_y);
    }

    [[nodiscard]] bool Contains(const Vec2& point) const
    {
        return point.x_ax >= min_x && point.x_ax <= max_x && point.y_ax >= min_y && point.y_ax <= max_y;
    }

    bool operator==(const BBox& other) const
    {
        return min_x == other.min_x && min_y == other.min_y && max_x == other.max_x && max_y == other.max_y;
    }
    bool operator!=(const BBox& other) const { return !(*this == other); }
};

namespace bbox_utils
{

// Extent of a point list; empty when there are no finite points.
inline std::optional<BBox> BoundsOfPoints(const std::vector<Vec2>& points)
{
    std::optional<BBox> bounds;
    for (const Vec2& point : points) {
        if (!point.IsFinite()) {
            continue;
        }
        if (bounds) {
            bounds->Expand(point);
        } else {
            bounds = BBox::FromPoint(point);
        }
    }
    return bounds;
}

inline void MergeInto(std::optional<BBox>& accumulator, const BBox& box)
{
    if (!box.IsValid()) {
        return;
    }
    if (accumulator) {
        accumulator->Merge(box);
    } else {
        accumulator = box;
    }
}

}  // namespace bbox_utils

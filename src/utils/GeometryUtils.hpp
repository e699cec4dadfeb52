#pragma once
#include <cmath>
#include <vector>

#include "Vec2.hpp"

namespace geometry_utils
{

const double kPi = 3.14159265358979323846;

inline double DegToRad(double degrees)
{
    return degrees * (kPi / 180.0);
}

// Shoelace area; positive for counter-clockwise winding.
inline double SignedArea(const std::vector<Vec2>& polygon)
{
    double area = 0.0;
    size_t const kCount = polygon.size();
    for (size_t i = 0; i < kCount; ++i) {
        const Vec2& current = polygon[i];
        const Vec2& next = polygon[(i + 1) % kCount];
        area += current.Cross(next);
    }
    return area * 0.5;
}

// Inclusive of the triangle edges, independent of winding.
inline bool IsPointInTriangle(const Vec2& pnt, const Vec2& tri_a, const Vec2& tri_b, const Vec2& tri_c)
{
    double const kD1 = (pnt - tri_b).Cross(tri_a - tri_b);
    double const kD2 = (pnt - tri_c).Cross(tri_b - tri_c);
    double const kD3 = (pnt - tri_a).Cross(tri_c - tri_a);
    bool const kHasNeg = (kD1 < 0) || (kD2 < 0) || (kD3 < 0);
    bool const kHasPos = (kD1 > 0) || (kD2 > 0) || (kD3 > 0);
    return !(kHasNeg && kHasPos);
}

}  // namespace geometry_utils

#include "render/gl/Triangulator.hpp"

#include <cmath>
#include <iostream>

#include "utils/GeometryUtils.hpp"

namespace
{
constexpr double kClosingVertexEpsilon = 1e-10;
constexpr double kConvexEpsilon = 1e-12;
}  // namespace

std::vector<Vec2> Triangulator::StripClosingVertex(const std::vector<Vec2>& polygon)
{
    if (polygon.size() > 3) {
        const Vec2& first = polygon.front();
        const Vec2& last = polygon.back();
        if (std::abs(first.x_ax - last.x_ax) < kClosingVertexEpsilon && std::abs(first.y_ax - last.y_ax) < kClosingVertexEpsilon) {
            return std::vector<Vec2>(polygon.begin(), polygon.end() - 1);
        }
    }
    return polygon;
}

bool Triangulator::IsValidPolygon(const std::vector<Vec2>& polygon)
{
    if (polygon.size() < 3) {
        return false;
    }
    for (const Vec2& point : polygon) {
        if (!point.IsFinite()) {
            return false;
        }
    }
    return true;
}

std::vector<uint32_t> Triangulator::Triangulate(const std::vector<Vec2>& polygon)
{
    return TriangulateOpen(StripClosingVertex(polygon));
}

std::vector<uint32_t> Triangulator::TriangulateOpen(const std::vector<Vec2>& points)
{
    if (!IsValidPolygon(points)) {
        std::cerr << "Triangulator Warning: Skipping polygon with " << points.size() << " vertices (fewer than 3 or non-finite)" << std::endl;
        m_statistics_.polygons_rejected++;
        return {};
    }

    std::vector<uint32_t> indices = EarClip(points);
    if (indices.empty()) {
        std::cerr << "Triangulator Warning: No triangles produced for polygon with " << points.size() << " vertices" << std::endl;
    }
    m_statistics_.polygons_triangulated++;
    m_statistics_.triangles_produced += indices.size() / 3;
    return indices;
}

TriangulatedGeometry Triangulator::TriangulateMultiple(const std::vector<std::vector<Vec2>>& polygons)
{
    TriangulatedGeometry geometry;
    uint32_t vertex_offset = 0;

    for (const std::vector<Vec2>& polygon : polygons) {
        std::vector<Vec2> const kPoints = StripClosingVertex(polygon);
        std::vector<uint32_t> const kIndices = TriangulateOpen(kPoints);
        if (kIndices.empty()) {
            continue;
        }
        for (const Vec2& point : kPoints) {
            geometry.vertices.push_back(static_cast<float>(point.x_ax));
            geometry.vertices.push_back(static_cast<float>(point.y_ax));
        }
        for (uint32_t index : kIndices) {
            geometry.indices.push_back(index + vertex_offset);
        }
        vertex_offset += static_cast<uint32_t>(kPoints.size());
    }
    return geometry;
}

std::vector<uint32_t> Triangulator::EarClip(const std::vector<Vec2>& points)
{
    std::vector<uint32_t> indices;
    size_t const kCount = points.size();
    if (kCount < 3) {
        return indices;
    }

    std::vector<uint32_t> work;
    work.reserve(kCount);
    for (uint32_t i = 0; i < kCount; ++i) {
        work.push_back(i);
    }

    bool const kCounterClockwise = geometry_utils::SignedArea(points) > 0.0;
    auto is_convex = [&](const Vec2& prev, const Vec2& curr, const Vec2& next) {
        double const kZ = (curr - prev).Cross(next - curr);
        return kCounterClockwise ? (kZ > kConvexEpsilon) : (kZ < -kConvexEpsilon);
    };
    auto emit = [&](uint32_t a, uint32_t b, uint32_t c) {
        // Output is always counter-clockwise.
        indices.push_back(a);
        indices.push_back(kCounterClockwise ? b : c);
        indices.push_back(kCounterClockwise ? c : b);
    };

    indices.reserve((kCount - 2) * 3);
    size_t guard = 0;
    while (work.size() > 3 && guard++ < kCount * kCount) {
        bool ear_found = false;
        for (size_t i = 0; i < work.size(); ++i) {
            size_t const kPrev = (i + work.size() - 1) % work.size();
            size_t const kNext = (i + 1) % work.size();
            const Vec2& a = points[work[kPrev]];
            const Vec2& b = points[work[i]];
            const Vec2& c = points[work[kNext]];

            if (!is_convex(a, b, c)) {
                continue;
            }

            bool contains = false;
            for (size_t j = 0; j < work.size(); ++j) {
                if (j == kPrev || j == i || j == kNext) {
                    continue;
                }
                const Vec2& p = points[work[j]];
                // Coincident vertices (touching rings) do not block an ear.
                if (p == a || p == b || p == c) {
                    continue;
                }
                if (geometry_utils::IsPointInTriangle(p, a, b, c)) {
                    contains = true;
                    break;
                }
            }
            if (contains) {
                continue;
            }

            emit(work[kPrev], work[i], work[kNext]);
            work.erase(work.begin() + static_cast<std::ptrdiff_t>(i));
            ear_found = true;
            break;
        }
        if (!ear_found) {
            break;
        }
    }
    if (work.size() == 3) {
        emit(work[0], work[1], work[2]);
    }
    return indices;
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "utils/Vec2.hpp"

struct TriangulatedGeometry {
    std::vector<float> vertices;    // x, y pairs
    std::vector<uint32_t> indices;  // Triangle list into vertices

    [[nodiscard]] size_t VertexCount() const { return vertices.size() / 2; }
    [[nodiscard]] size_t TriangleCount() const { return indices.size() / 3; }
    [[nodiscard]] bool IsEmpty() const { return indices.empty(); }
};

struct TriangulatorStatistics {
    size_t polygons_triangulated = 0;
    size_t polygons_rejected = 0;  // Too few vertices or non-finite coordinates
    size_t triangles_produced = 0;
};

// Ear-clipping triangulation of simple polygons (either winding).
class Triangulator
{
public:
    // Triangle indices over the polygon's vertices after a duplicated closing vertex is
    // stripped. Empty (and logged) for fewer than 3 usable vertices or non-finite coordinates.
    std::vector<uint32_t> Triangulate(const std::vector<Vec2>& polygon);

    // Concatenates the vertices of every accepted polygon and offsets each polygon's indices
    // by the number of vertices emitted before it.
    TriangulatedGeometry TriangulateMultiple(const std::vector<std::vector<Vec2>>& polygons);

    [[nodiscard]] const TriangulatorStatistics& GetStatistics() const { return m_statistics_; }
    void ResetStatistics() { m_statistics_ = TriangulatorStatistics(); }

    // Polygon without a trailing vertex equal (within 1e-10) to the first one.
    static std::vector<Vec2> StripClosingVertex(const std::vector<Vec2>& polygon);
    static bool IsValidPolygon(const std::vector<Vec2>& polygon);

private:
    // Triangulate() for a polygon whose closing vertex is already stripped.
    std::vector<uint32_t> TriangulateOpen(const std::vector<Vec2>& points);
    static std::vector<uint32_t> EarClip(const std::vector<Vec2>& points);

    TriangulatorStatistics m_statistics_;
};

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "render/gl/Triangulator.hpp"

namespace
{
double TriangleArea(const std::vector<Vec2>& points, uint32_t a, uint32_t b, uint32_t c)
{
    return (points[b] - points[a]).Cross(points[c] - points[a]) / 2.0;
}

double SumOfAreas(const std::vector<Vec2>& points, const std::vector<uint32_t>& indices)
{
    double total = 0.0;
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        total += TriangleArea(points, indices[i], indices[i + 1], indices[i + 2]);
    }
    return total;
}

const std::vector<Vec2> kSquare = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
}  // namespace

TEST(TriangulatorTest, SquareBecomesTwoTriangles)
{
    Triangulator triangulator;
    std::vector<uint32_t> const kIndices = triangulator.Triangulate(kSquare);
    ASSERT_EQ(kIndices.size(), 6U);
    EXPECT_DOUBLE_EQ(SumOfAreas(kSquare, kIndices), 100.0);
    for (uint32_t index : kIndices) {
        EXPECT_LT(index, 4U);
    }
}

TEST(TriangulatorTest, ClosingVertexIsStripped)
{
    std::vector<Vec2> closed = kSquare;
    closed.push_back(closed.front());

    Triangulator triangulator;
    std::vector<uint32_t> const kIndices = triangulator.Triangulate(closed);
    ASSERT_EQ(kIndices.size(), 6U);
    for (uint32_t index : kIndices) {
        EXPECT_LT(index, 4U);
    }
    EXPECT_EQ(Triangulator::StripClosingVertex(closed).size(), 4U);

    // A closed triangle keeps all three vertices when only three remain.
    std::vector<Vec2> const kThree = {{0, 0}, {1, 0}, {0, 0}};
    EXPECT_EQ(Triangulator::StripClosingVertex(kThree).size(), 3U);
}

TEST(TriangulatorTest, ConcavePolygonCoversItsArea)
{
    // L shape, area 3 * 1 + 1 * 2 = 5.
    std::vector<Vec2> const kShape = {{0, 0}, {3, 0}, {3, 1}, {1, 1}, {1, 3}, {0, 3}};
    Triangulator triangulator;
    std::vector<uint32_t> const kIndices = triangulator.Triangulate(kShape);
    ASSERT_EQ(kIndices.size(), 3U * 4U);
    EXPECT_NEAR(SumOfAreas(kShape, kIndices), 5.0, 1e-12);
}

TEST(TriangulatorTest, ClockwiseInputYieldsCounterClockwiseTriangles)
{
    std::vector<Vec2> const kClockwise = {{0, 0}, {0, 10}, {10, 10}, {10, 0}};
    Triangulator triangulator;
    std::vector<uint32_t> const kIndices = triangulator.Triangulate(kClockwise);
    ASSERT_EQ(kIndices.size(), 6U);
    for (size_t i = 0; i < kIndices.size(); i += 3) {
        EXPECT_GT(TriangleArea(kClockwise, kIndices[i], kIndices[i + 1], kIndices[i + 2]), 0.0);
    }
}

TEST(TriangulatorTest, DegenerateInputIsRejected)
{
    Triangulator triangulator;
    EXPECT_TRUE(triangulator.Triangulate({}).empty());
    EXPECT_TRUE(triangulator.Triangulate({{0, 0}, {1, 1}}).empty());

    double const kNaN = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(triangulator.Triangulate({{0, 0}, {kNaN, 1}, {1, 0}}).empty());
    EXPECT_FALSE(Triangulator::IsValidPolygon({{0, 0}, {std::numeric_limits<double>::infinity(), 1}, {1, 0}}));

    EXPECT_EQ(triangulator.GetStatistics().polygons_rejected, 3U);
    EXPECT_EQ(triangulator.GetStatistics().polygons_triangulated, 0U);
}

TEST(TriangulatorTest, MultiplePolygonsOffsetIndices)
{
    std::vector<Vec2> const kTriangle = {{20, 0}, {30, 0}, {20, 10}};
    std::vector<Vec2> closed_square = kSquare;
    closed_square.push_back(closed_square.front());

    Triangulator triangulator;
    TriangulatedGeometry const kGeometry = triangulator.TriangulateMultiple({closed_square, {{0, 0}}, kTriangle});

    EXPECT_EQ(kGeometry.VertexCount(), 7U);
    EXPECT_EQ(kGeometry.TriangleCount(), 3U);
    ASSERT_EQ(kGeometry.indices.size(), 9U);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_LT(kGeometry.indices[i], 4U);
    }
    for (size_t i = 6; i < 9; ++i) {
        EXPECT_GE(kGeometry.indices[i], 4U);
        EXPECT_LT(kGeometry.indices[i], 7U);
    }
    EXPECT_FLOAT_EQ(kGeometry.vertices[8], 20.0F);

    TriangulatorStatistics const kStats = triangulator.GetStatistics();
    EXPECT_EQ(kStats.polygons_triangulated, 2U);
    EXPECT_EQ(kStats.polygons_rejected, 1U);
    EXPECT_EQ(kStats.triangles_produced, 3U);
}

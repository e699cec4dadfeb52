#pragma once

#include <string>
#include <vector>

#include "layout/Element.hpp"
#include "layout/ElementGeometry.hpp"
#include "layout/Library.hpp"

// Small element and library builders shared by the tests.
namespace test_layouts
{
inline Element MakeBoundary(const std::vector<Vec2>& points, int layer = 1, int data_type = 0)
{
    Element element;
    element.data = BoundaryElement {{points}};
    element.layer = {layer, data_type};
    element.bounds = layout_geometry::ComputeBounds(element);
    return element;
}

inline Element MakeRect(double min_x, double min_y, double max_x, double max_y, int layer = 1, int data_type = 0)
{
    return MakeBoundary({{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}, {min_x, min_y}}, layer, data_type);
}

inline Element MakePath(const std::vector<Vec2>& points, double width, int path_type = 0, int layer = 2)
{
    PathElement path;
    path.path_type = path_type;
    path.width = width;
    path.paths.push_back(points);
    Element element;
    element.data = path;
    element.layer = {layer, 0};
    element.bounds = layout_geometry::ComputeBounds(element);
    return element;
}

inline Element MakeText(const std::string& text, const Vec2& position, int layer = 10)
{
    TextElement text_element;
    text_element.text = text;
    text_element.position = position;
    Element element;
    element.data = text_element;
    element.layer = {layer, 0};
    element.bounds = layout_geometry::ComputeBounds(element);
    return element;
}

inline Element MakeNode(const std::vector<Vec2>& points, int layer = 5)
{
    NodeElement node;
    node.points = points;
    Element element;
    element.data = node;
    element.layer = {layer, 0};
    element.bounds = layout_geometry::ComputeBounds(element);
    return element;
}

inline Element MakeSRef(const std::string& name, const std::vector<Vec2>& positions, double angle = 0.0, double magnification = 1.0, bool reflection = false)
{
    SRefElement sref;
    sref.reference_name = name;
    sref.positions = positions;
    sref.strans.angle = angle;
    sref.strans.magnification = magnification;
    sref.strans.reflection = reflection;
    Element element;
    element.data = sref;
    return element;
}

inline Element MakeARef(const std::string& name, const Vec2& origin, const Vec2& column_corner, const Vec2& row_corner, int columns, int rows)
{
    ARefElement aref;
    aref.reference_name = name;
    aref.origin = origin;
    aref.column_corner = column_corner;
    aref.row_corner = row_corner;
    aref.columns = columns;
    aref.rows = rows;
    Element element;
    element.data = aref;
    return element;
}

inline Library MakeLibrary(std::vector<Structure> structures)
{
    Library library;
    library.name = "TESTLIB";
    library.structures = std::move(structures);
    return library;
}

// First point of the first outline of a boundary element.
inline Vec2 FirstPoint(const Element& element)
{
    const auto* boundary = element.As<BoundaryElement>();
    return boundary != nullptr && !boundary->polygons.empty() && !boundary->polygons.front().empty() ? boundary->polygons.front().front() : Vec2();
}
}  // namespace test_layouts

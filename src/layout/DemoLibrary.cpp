#include "layout/DemoLibrary.hpp"

#include <algorithm>

namespace demo_library
{

namespace
{

Element MakeBoundary(int layer, const Polyline& outline)
{
    Element element;
    element.layer = {layer, 0};
    element.data = BoundaryElement {{outline}};
    return element;
}

Polyline Rect(double min_x, double min_y, double max_x, double max_y)
{
    return {{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}, {min_x, min_y}};
}

}  // namespace

Library CreateDemoLibrary(int columns, int rows)
{
    Library library;
    library.name = "DEMO";

    Structure via;
    via.name = "VIA";
    via.elements.push_back(MakeBoundary(3, Rect(-0.6, -0.6, 0.6, 0.6)));

    Structure cell;
    cell.name = "CELL";
    cell.elements.push_back(MakeBoundary(1, Rect(0.0, 0.0, 8.0, 4.0)));
    cell.elements.push_back(MakeBoundary(1, {{1.0, 4.0}, {7.0, 4.0}, {4.0, 6.5}}));
    {
        Element wire;
        wire.layer = {2, 0};
        PathElement path;
        path.path_type = 1;
        path.width = 0.5;
        path.paths.push_back({{0.5, 2.0}, {7.5, 2.0}, {7.5, -1.5}});
        wire.data = path;
        cell.elements.push_back(wire);
    }
    {
        Element pin_box;
        pin_box.layer = {4, 0};
        BoxElement box;
        box.points = Rect(8.5, 0.5, 9.5, 3.5);
        pin_box.data = box;
        cell.elements.push_back(pin_box);
    }
    {
        Element marker;
        marker.layer = {5, 0};
        NodeElement node;
        node.points = {{4.0, 1.0}};
        marker.data = node;
        cell.elements.push_back(marker);
    }
    {
        Element label;
        label.layer = {10, 0};
        TextElement text;
        text.text = "CELL";
        text.position = {4.0, 5.0};
        label.data = text;
        cell.elements.push_back(label);
    }
    {
        Element vias;
        SRefElement sref;
        sref.reference_name = via.name;
        sref.positions = {{2.0, 2.0}, {6.0, 2.0}};
        vias.data = sref;
        cell.elements.push_back(vias);
    }

    double const kPitchX = 12.0;
    double const kPitchY = 9.0;

    Structure array;
    array.name = "CELL_ARRAY";
    {
        Element grid;
        ARefElement aref;
        aref.reference_name = cell.name;
        aref.origin = {0.0, 0.0};
        aref.columns = columns;
        aref.rows = rows;
        aref.column_corner = {kPitchX * columns, 0.0};
        aref.row_corner = {0.0, kPitchY * rows};
        grid.data = aref;
        array.elements.push_back(grid);
    }

    double const kArrayWidth = kPitchX * columns;
    double const kArrayHeight = kPitchY * rows;

    Structure top;
    top.name = "TOP";
    top.elements.push_back(MakeBoundary(0, Rect(-10.0, -10.0, kArrayWidth + (kArrayHeight * 1.5) + 30.0, std::max(kArrayHeight, kArrayWidth * 1.5) + 10.0)));
    {
        Element placement;
        SRefElement sref;
        sref.reference_name = array.name;
        sref.positions = {{0.0, 0.0}};
        placement.data = sref;
        top.elements.push_back(placement);
    }
    {
        Element placement;
        SRefElement sref;
        sref.reference_name = array.name;
        sref.positions = {{kArrayWidth + (kArrayHeight * 1.5) + 20.0, 0.0}};
        sref.strans.angle = 90.0;
        sref.strans.magnification = 1.5;
        placement.data = sref;
        top.elements.push_back(placement);
    }
    {
        Element title;
        title.layer = {10, 0};
        TextElement text;
        text.text = "GDS LAYER VIEWER DEMO";
        text.position = {kArrayWidth / 2.0, kArrayHeight + 5.0};
        title.data = text;
        top.elements.push_back(title);
    }

    library.structures.push_back(std::move(top));
    library.structures.push_back(std::move(array));
    library.structures.push_back(std::move(cell));
    library.structures.push_back(std::move(via));
    return library;
}

}  // namespace demo_library

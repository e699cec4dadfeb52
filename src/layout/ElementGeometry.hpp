#pragma once

#include <optional>
#include <vector>

#include "layout/Element.hpp"
#include "layout/Transform.hpp"
#include "utils/BBox.hpp"

namespace layout_geometry
{

// Approximate text extent in world units per character / per line.
constexpr double kTextCharWidth = 0.5;
constexpr double kTextHeight = 1.0;

// World extent of a non-reference element; empty for references and for elements without points.
std::optional<BBox> ComputeBounds(const Element& element);

// Copy of element with every coordinate mapped through transform and bounds recomputed.
// Path widths and extensions scale with the transform's magnification.
Element TransformElement(const Element& element, const Transform& transform);

// Polygon-like outlines an element contributes to filled rendering (boundary polygons and the
// box outline). Paths are excluded; they are handled as stroked polylines.
std::vector<Polyline> FilledOutlines(const Element& element);

// Name of the referenced structure, or nullptr for non-reference elements.
const std::string* ReferenceName(const Element& element);

}  // namespace layout_geometry

#include "layout/ElementGeometry.hpp"

#include <type_traits>

namespace layout_geometry
{

namespace
{

std::optional<BBox> BoundsOfPolylines(const std::vector<Polyline>& polylines)
{
    std::optional<BBox> bounds;
    for (const Polyline& polyline : polylines) {
        std::optional<BBox> const kLineBounds = bbox_utils::BoundsOfPoints(polyline);
        if (kLineBounds) {
            bbox_utils::MergeInto(bounds, *kLineBounds);
        }
    }
    return bounds;
}

std::vector<Polyline> TransformPolylines(const std::vector<Polyline>& polylines, const Transform& transform)
{
    std::vector<Polyline> result;
    result.reserve(polylines.size());
    for (const Polyline& polyline : polylines) {
        result.push_back(transform.Apply(polyline));
    }
    return result;
}

}  // namespace

std::optional<BBox> ComputeBounds(const Element& element)
{
    return std::visit(
        [](const auto& data) -> std::optional<BBox> {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, BoundaryElement>) {
                return BoundsOfPolylines(data.polygons);
            } else if constexpr (std::is_same_v<T, PathElement>) {
                std::optional<BBox> bounds = BoundsOfPolylines(data.paths);
                if (bounds && data.width > 0.0) {
                    return bounds->Grown(data.width / 2.0);
                }
                return bounds;
            } else if constexpr (std::is_same_v<T, BoxElement> || std::is_same_v<T, NodeElement>) {
                return bbox_utils::BoundsOfPoints(data.points);
            } else if constexpr (std::is_same_v<T, TextElement>) {
                if (!data.position.IsFinite()) {
                    return std::nullopt;
                }
                double const kHalfWidth = static_cast<double>(data.text.size()) * kTextCharWidth / 2.0;
                return BBox::FromCenter(data.position, kHalfWidth, kTextHeight / 2.0);
            } else {
                return std::nullopt;
            }
        },
        element.data);
}

Element TransformElement(const Element& element, const Transform& transform)
{
    Element result = element;
    std::visit(
        [&transform](auto& data) {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, BoundaryElement>) {
                data.polygons = TransformPolylines(data.polygons, transform);
            } else if constexpr (std::is_same_v<T, PathElement>) {
                data.paths = TransformPolylines(data.paths, transform);
                double const kMag = transform.Magnification();
                data.width *= kMag;
                data.begin_extension *= kMag;
                data.end_extension *= kMag;
            } else if constexpr (std::is_same_v<T, BoxElement> || std::is_same_v<T, NodeElement>) {
                data.points = transform.Apply(data.points);
            } else if constexpr (std::is_same_v<T, TextElement>) {
                data.position = transform.Apply(data.position);
            } else if constexpr (std::is_same_v<T, SRefElement>) {
                data.positions = transform.Apply(data.positions);
            } else if constexpr (std::is_same_v<T, ARefElement>) {
                data.origin = transform.Apply(data.origin);
                data.column_corner = transform.Apply(data.column_corner);
                data.row_corner = transform.Apply(data.row_corner);
            }
        },
        result.data);
    result.bounds = ComputeBounds(result);
    return result;
}

std::vector<Polyline> FilledOutlines(const Element& element)
{
    if (const auto* boundary = element.As<BoundaryElement>()) {
        return boundary->polygons;
    }
    if (const auto* box = element.As<BoxElement>()) {
        if (box->points.size() >= 4) {
            return {box->points};
        }
    }
    return {};
}

const std::string* ReferenceName(const Element& element)
{
    if (const auto* sref = element.As<SRefElement>()) {
        return &sref->reference_name;
    }
    if (const auto* aref = element.As<ARefElement>()) {
        return &aref->reference_name;
    }
    return nullptr;
}

}  // namespace layout_geometry

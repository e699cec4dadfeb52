#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "utils/BBox.hpp"
#include "utils/Vec2.hpp"

using Polyline = std::vector<Vec2>;

// (layer, data type) pair; identity for grouping, styling and visibility.
struct LayerKey {
    int layer = 0;
    int data_type = 0;

    bool operator==(const LayerKey& other) const { return layer == other.layer && data_type == other.data_type; }
    bool operator!=(const LayerKey& other) const { return !(*this == other); }
    bool operator<(const LayerKey& other) const
    {
        if (layer != other.layer) {
            return layer < other.layer;
        }
        return data_type < other.data_type;
    }

    [[nodiscard]] std::string ToString() const { return std::to_string(layer) + "_" + std::to_string(data_type); }
};

// Placement transform of a reference: reflect about x, then rotate, magnify, translate.
struct Strans {
    bool reflection = false;
    bool absolute_magnification = false;  // Stored, not applied
    bool absolute_angle = false;          // Stored, not applied
    double magnification = 1.0;
    double angle = 0.0;  // Degrees, counter-clockwise
};

struct BoundaryElement {
    std::vector<Polyline> polygons;
};

struct PathElement {
    int path_type = 0;  // 0 flush, 1 round, 2 half-width extension, 4 custom extension
    double width = 0.0;
    double begin_extension = 0.0;
    double end_extension = 0.0;
    std::vector<Polyline> paths;
};

struct BoxElement {
    int box_type = 0;
    std::vector<Vec2> points;
};

struct NodeElement {
    int node_type = 0;
    std::vector<Vec2> points;
};

struct TextElement {
    std::string text;
    Vec2 position;
    int text_type = 0;
    int presentation = 0;
    std::optional<Strans> strans;
};

struct SRefElement {
    std::string reference_name;
    std::vector<Vec2> positions;
    Strans strans;
};

// Grid placement defined by origin, the corner one full column extent away, and the corner
// one full row extent away.
struct ARefElement {
    std::string reference_name;
    Vec2 origin;
    Vec2 column_corner;
    Vec2 row_corner;
    int columns = 1;
    int rows = 1;
    Strans strans;
};

using ElementData = std::variant<BoundaryElement, PathElement, BoxElement, NodeElement, TextElement, SRefElement, ARefElement>;

// Matches the alternative order of ElementData.
enum class ElementKind : uint8_t {
    kBoundary,
    kPath,
    kBox,
    kNode,
    kText,
    kSRef,
    kARef
};

const char* ElementKindName(ElementKind kind);

struct Element {
    ElementData data;
    LayerKey layer;               // Unused for references
    std::optional<BBox> bounds;  // Cached extent; unset when there is no geometry

    [[nodiscard]] ElementKind Kind() const { return static_cast<ElementKind>(data.index()); }
    [[nodiscard]] bool IsReference() const { return Kind() == ElementKind::kSRef || Kind() == ElementKind::kARef; }

    template <typename T>
    [[nodiscard]] const T* As() const
    {
        return std::get_if<T>(&data);
    }
};

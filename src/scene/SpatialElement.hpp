#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "layout/Element.hpp"
#include "utils/BBox.hpp"

// (owning structure, element index): identifies one resolved element across the index nodes
// it was inserted into.
struct IdentityKey {
    std::string structure_name;
    size_t element_index = 0;

    bool operator==(const IdentityKey& other) const { return element_index == other.element_index && structure_name == other.structure_name; }
    bool operator!=(const IdentityKey& other) const { return !(*this == other); }
    bool operator<(const IdentityKey& other) const
    {
        if (structure_name != other.structure_name) {
            return structure_name < other.structure_name;
        }
        return element_index < other.element_index;
    }

    [[nodiscard]] std::string ToString() const { return structure_name + "_" + std::to_string(element_index); }
};

struct IdentityKeyHash {
    size_t operator()(const IdentityKey& key) const
    {
        size_t const kNameHash = std::hash<std::string> {}(key.structure_name);
        return kNameHash ^ (std::hash<size_t> {}(key.element_index) + 0x9e3779b9 + (kNameHash << 6) + (kNameHash >> 2));
    }
};

// Query-index record: a resolved world-space element, its bounds and identity.
struct SpatialElement {
    Element element;
    BBox bounds;
    IdentityKey identity;           // Flattened-into structure and index in its flattened sequence
    std::string source_structure;  // Structure that declared the element
    size_t source_index = 0;

    [[nodiscard]] const LayerKey& Layer() const { return element.layer; }
};

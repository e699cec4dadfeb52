#include "layout/Library.hpp"

#include <algorithm>

const char* ElementKindName(ElementKind kind)
{
    switch (kind) {
        case ElementKind::kBoundary:
            return "boundary";
        case ElementKind::kPath:
            return "path";
        case ElementKind::kBox:
            return "box";
        case ElementKind::kNode:
            return "node";
        case ElementKind::kText:
            return "text";
        case ElementKind::kSRef:
            return "sref";
        case ElementKind::kARef:
            return "aref";
    }
    return "unknown";
}

const Structure* Library::FindStructure(const std::string& structure_name) const
{
    auto it = std::find_if(structures.begin(), structures.end(), [&](const Structure& structure) { return structure.name == structure_name; });
    return it != structures.end() ? &*it : nullptr;
}

size_t Library::GetElementCount() const
{
    size_t count = 0;
    for (const Structure& structure : structures) {
        count += structure.elements.size();
    }
    return count;
}

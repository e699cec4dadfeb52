#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "layout/Element.hpp"
#include "layout/Library.hpp"
#include "layout/Transform.hpp"
#include "utils/BBox.hpp"

// A flattened, world-space element and where it came from.
struct ResolvedElement {
    Element element;
    std::string source_structure;  // Structure that declared the element
    size_t source_index = 0;       // Index within that structure's element list
};

using ResolvedElementList = std::vector<ResolvedElement>;

// Structure names along a reference cycle, closing on the repeated name, e.g. {A, B, A}.
using ReferenceCycle = std::vector<std::string>;

struct ResolverStatistics {
    size_t cached_structures = 0;
    size_t cycles_found = 0;
    size_t missing_references = 0;
    size_t expanded_instances = 0;
};

// Expands single and grid references into flat world-space geometry.
//
// Each structure is flattened once in its own coordinate space (identity transform) and cached
// by name; callers' accumulated transforms are applied to a copy on every use, so a structure
// placed under different transforms always yields the right geometry. Traversal is iterative
// with an explicit "on path" set: a reference back onto the current path is reported as a cycle
// and that reference contributes nothing. Only results that do not depend on where the walk
// started are cached, so a structure in a cycle resolves the same whether or not it was
// reached through another root first.
//
// The cache is tied to one Library; call ClearCache() whenever the library changes.
class HierarchyResolver
{
public:
    HierarchyResolver() = default;

    // Flattens structure_name under transform. Unknown names log a warning and yield nothing.
    ResolvedElementList Resolve(const Library& library, const std::string& structure_name, const Transform& transform = Transform());

    // Flattens every top structure (see FindTopStructures) and concatenates the results.
    ResolvedElementList ResolveTopStructures(const Library& library);

    // Aggregate bounds of the resolved top structures; empty when there is no geometry.
    std::optional<BBox> ComputeLibraryBounds(const Library& library);

    void ClearCache();

    [[nodiscard]] const std::vector<ReferenceCycle>& GetCycles() const { return m_cycles_; }
    [[nodiscard]] ResolverStatistics GetStatistics() const;

    // Reports every reference cycle in the library without resolving geometry.
    static std::vector<ReferenceCycle> DetectCycles(const Library& library);

    // Structures no other structure references, in library order. Falls back to the first
    // structure when every structure is referenced.
    static std::vector<std::string> FindTopStructures(const Library& library);

    // Sorted layer keys used by non-reference elements anywhere in the library.
    static std::vector<LayerKey> ExtractLayers(const Library& library);

private:
    void BindLibrary(const Library& library);
    const Structure* LookupStructure(const std::string& structure_name) const;

    // Result assembled during one walk whose subtree had a cycle edge cut above it.
    struct PartialResult {
        ResolvedElementList elements;
        size_t cut_depth = 0;
    };
    using PartialResults = std::unordered_map<std::string, PartialResult>;

    // Flattened local geometry of the named structure, or nullptr if it does not exist.
    const ResolvedElementList* ResolveLocal(const std::string& structure_name);
    const ResolvedElementList* FindAssembled(const std::string& structure_name, const PartialResults& partial) const;
    ResolvedElementList AssembleLocal(const Structure& structure, const PartialResults& partial);
    void AppendInstance(ResolvedElementList& out, const ResolvedElementList& source, const Transform& instance);
    void ReportMissing(const std::string& parent, const std::string& reference_name);
    void ReportCycle(const std::vector<std::string>& path, const std::string& reference_name);

    const Library* m_library_ = nullptr;
    std::unordered_map<std::string, const Structure*> m_structures_by_name_;
    std::unordered_map<std::string, ResolvedElementList> m_local_cache_;
    std::vector<ReferenceCycle> m_cycles_;
    std::set<std::string> m_reported_cycles_;
    std::set<std::string> m_reported_missing_;
    size_t m_missing_references_ = 0;
    size_t m_expanded_instances_ = 0;
};

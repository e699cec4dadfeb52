#include "layout/processing/HierarchyResolver.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <iostream>
#include <unordered_set>

#include "layout/ElementGeometry.hpp"

namespace
{

std::string JoinNames(const std::vector<std::string>& names)
{
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            joined += " -> ";
        }
        joined += names[i];
    }
    return joined;
}

// Unique referenced names of a structure, in first-reference order.
std::vector<std::string> ChildNames(const Structure& structure)
{
    std::vector<std::string> children;
    for (const Element& element : structure.elements) {
        const std::string* name = layout_geometry::ReferenceName(element);
        if (name && std::find(children.begin(), children.end(), *name) == children.end()) {
            children.push_back(*name);
        }
    }
    return children;
}

}  // namespace

void HierarchyResolver::BindLibrary(const Library& library)
{
    if (m_library_ == &library && m_structures_by_name_.size() == library.structures.size()) {
        return;
    }
    ClearCache();
    m_library_ = &library;
    for (const Structure& structure : library.structures) {
        // First definition wins on duplicate names, matching Library::FindStructure
        m_structures_by_name_.emplace(structure.name, &structure);
    }
}

void HierarchyResolver::ClearCache()
{
    m_library_ = nullptr;
    m_structures_by_name_.clear();
    m_local_cache_.clear();
    m_cycles_.clear();
    m_reported_cycles_.clear();
    m_reported_missing_.clear();
    m_missing_references_ = 0;
    m_expanded_instances_ = 0;
}

const Structure* HierarchyResolver::LookupStructure(const std::string& structure_name) const
{
    auto it = m_structures_by_name_.find(structure_name);
    return it != m_structures_by_name_.end() ? it->second : nullptr;
}

ResolvedElementList HierarchyResolver::Resolve(const Library& library, const std::string& structure_name, const Transform& transform)
{
    BindLibrary(library);

    const ResolvedElementList* local = ResolveLocal(structure_name);
    if (!local) {
        std::cerr << "HierarchyResolver Warning: Structure '" << structure_name << "' not found in library '" << library.name << "'" << std::endl;
        return {};
    }

    if (transform.IsIdentity()) {
        return *local;
    }
    ResolvedElementList result;
    result.reserve(local->size());
    AppendInstance(result, *local, transform);
    return result;
}

ResolvedElementList HierarchyResolver::ResolveTopStructures(const Library& library)
{
    ResolvedElementList result;
    for (const std::string& top_name : FindTopStructures(library)) {
        ResolvedElementList part = Resolve(library, top_name);
        result.insert(result.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return result;
}

std::optional<BBox> HierarchyResolver::ComputeLibraryBounds(const Library& library)
{
    std::optional<BBox> bounds;
    for (const ResolvedElement& resolved : ResolveTopStructures(library)) {
        if (resolved.element.bounds) {
            bbox_utils::MergeInto(bounds, *resolved.element.bounds);
        }
    }
    return bounds;
}

const ResolvedElementList* HierarchyResolver::ResolveLocal(const std::string& structure_name)
{
    auto cached = m_local_cache_.find(structure_name);
    if (cached != m_local_cache_.end()) {
        return &cached->second;
    }

    const Structure* root = LookupStructure(structure_name);
    if (!root) {
        return nullptr;
    }

    // Post-order walk: a structure is assembled once every structure it references has been
    // assembled, cut by a cycle, or found missing.
    //
    // cut_depth is the shallowest path depth a cycle edge below a frame pointed back to. A
    // structure whose subtree was cut above its own depth has a result that depends on this
    // walk's path, so it is kept in `partial` only while the cut target is on the path and
    // never enters m_local_cache_. The root (depth 0) is always complete.
    struct Frame {
        const Structure* structure;
        size_t next_element;
        size_t cut_depth;
    };
    std::vector<Frame> stack;
    std::vector<std::string> path;
    std::unordered_set<std::string> on_path;
    PartialResults partial;

    stack.push_back({root, 0, SIZE_MAX});
    path.push_back(root->name);
    on_path.insert(root->name);

    while (!stack.empty()) {
        Frame& frame = stack.back();
        const Structure* child = nullptr;

        while (frame.next_element < frame.structure->elements.size()) {
            const Element& element = frame.structure->elements[frame.next_element++];
            const std::string* reference_name = layout_geometry::ReferenceName(element);
            if (!reference_name || m_local_cache_.count(*reference_name) != 0) {
                continue;
            }
            auto assembled = partial.find(*reference_name);
            if (assembled != partial.end()) {
                frame.cut_depth = std::min(frame.cut_depth, assembled->second.cut_depth);
                continue;
            }
            if (on_path.count(*reference_name) != 0) {
                auto const kTarget = std::find(path.begin(), path.end(), *reference_name);
                frame.cut_depth = std::min(frame.cut_depth, static_cast<size_t>(kTarget - path.begin()));
                ReportCycle(path, *reference_name);
                continue;
            }
            child = LookupStructure(*reference_name);
            if (child) {
                break;
            }
        }

        if (child) {
            stack.push_back({child, 0, SIZE_MAX});
            path.push_back(child->name);
            on_path.insert(child->name);
            continue;
        }

        size_t const kDepth = stack.size() - 1;
        Frame const kDone = frame;
        ResolvedElementList local = AssembleLocal(*kDone.structure, partial);

        // Partial results cut against this structure are stale once it leaves the path.
        for (auto it = partial.begin(); it != partial.end();) {
            it = it->second.cut_depth >= kDepth ? partial.erase(it) : std::next(it);
        }
        if (kDone.cut_depth < kDepth) {
            partial[kDone.structure->name] = {std::move(local), kDone.cut_depth};
        } else {
            m_local_cache_[kDone.structure->name] = std::move(local);
        }

        on_path.erase(kDone.structure->name);
        path.pop_back();
        stack.pop_back();
        if (!stack.empty()) {
            stack.back().cut_depth = std::min(stack.back().cut_depth, kDone.cut_depth);
        }
    }

    return &m_local_cache_.at(structure_name);
}

const ResolvedElementList* HierarchyResolver::FindAssembled(const std::string& structure_name, const PartialResults& partial) const
{
    auto cached = m_local_cache_.find(structure_name);
    if (cached != m_local_cache_.end()) {
        return &cached->second;
    }
    auto assembled = partial.find(structure_name);
    return assembled != partial.end() ? &assembled->second.elements : nullptr;
}

ResolvedElementList HierarchyResolver::AssembleLocal(const Structure& structure, const PartialResults& partial)
{
    ResolvedElementList local;

    for (size_t index = 0; index < structure.elements.size(); ++index) {
        const Element& element = structure.elements[index];

        if (const auto* sref = element.As<SRefElement>()) {
            if (!LookupStructure(sref->reference_name)) {
                ReportMissing(structure.name, sref->reference_name);
                continue;
            }
            const ResolvedElementList* child = FindAssembled(sref->reference_name, partial);
            if (!child) {
                continue;  // Reference closes a cycle
            }
            for (const Vec2& position : sref->positions) {
                AppendInstance(local, *child, Transform::FromStrans(sref->strans, position));
            }
            continue;
        }

        if (const auto* aref = element.As<ARefElement>()) {
            if (!LookupStructure(aref->reference_name)) {
                ReportMissing(structure.name, aref->reference_name);
                continue;
            }
            const ResolvedElementList* child = FindAssembled(aref->reference_name, partial);
            if (!child) {
                continue;
            }
            if (aref->columns <= 0 || aref->rows <= 0) {
                std::cerr << "HierarchyResolver Warning: Grid reference to '" << aref->reference_name << "' in '" << structure.name << "' has "
                          << aref->columns << "x" << aref->rows << " instances, skipping" << std::endl;
                continue;
            }
            Vec2 const kColSpacing = (aref->column_corner - aref->origin) / static_cast<double>(aref->columns);
            Vec2 const kRowSpacing = (aref->row_corner - aref->origin) / static_cast<double>(aref->rows);
            for (int row = 0; row < aref->rows; ++row) {
                for (int col = 0; col < aref->columns; ++col) {
                    Vec2 const kInstanceOrigin = aref->origin + (kColSpacing * static_cast<double>(col)) + (kRowSpacing * static_cast<double>(row));
                    AppendInstance(local, *child, Transform::FromStrans(aref->strans, kInstanceOrigin));
                }
            }
            continue;
        }

        ResolvedElement resolved {element, structure.name, index};
        resolved.element.bounds = layout_geometry::ComputeBounds(element);
        local.push_back(std::move(resolved));
    }

    return local;
}

void HierarchyResolver::AppendInstance(ResolvedElementList& out, const ResolvedElementList& source, const Transform& instance)
{
    m_expanded_instances_++;
    for (const ResolvedElement& resolved : source) {
        out.push_back({layout_geometry::TransformElement(resolved.element, instance), resolved.source_structure, resolved.source_index});
    }
}

void HierarchyResolver::ReportMissing(const std::string& parent, const std::string& reference_name)
{
    m_missing_references_++;
    if (m_reported_missing_.insert(parent + "/" + reference_name).second) {
        std::cerr << "HierarchyResolver Warning: Structure '" << reference_name << "' referenced from '" << parent << "' not found, skipping" << std::endl;
    }
}

void HierarchyResolver::ReportCycle(const std::vector<std::string>& path, const std::string& reference_name)
{
    auto start = std::find(path.begin(), path.end(), reference_name);
    ReferenceCycle cycle(start, path.end());
    cycle.push_back(reference_name);

    std::string const kKey = JoinNames(cycle);
    if (m_reported_cycles_.insert(kKey).second) {
        std::cerr << "HierarchyResolver Warning: Circular reference detected: " << kKey << std::endl;
        m_cycles_.push_back(std::move(cycle));
    }
}

ResolverStatistics HierarchyResolver::GetStatistics() const
{
    ResolverStatistics stats;
    stats.cached_structures = m_local_cache_.size();
    stats.cycles_found = m_cycles_.size();
    stats.missing_references = m_missing_references_;
    stats.expanded_instances = m_expanded_instances_;
    return stats;
}

std::vector<ReferenceCycle> HierarchyResolver::DetectCycles(const Library& library)
{
    std::unordered_map<std::string, const Structure*> by_name;
    for (const Structure& structure : library.structures) {
        by_name.emplace(structure.name, &structure);
    }

    std::vector<ReferenceCycle> cycles;
    std::unordered_set<std::string> visited;

    struct Frame {
        const Structure* structure;
        std::vector<std::string> children;
        size_t next_child;
    };

    for (const Structure& start : library.structures) {
        if (visited.count(start.name) != 0) {
            continue;
        }

        std::vector<Frame> stack;
        std::vector<std::string> path;
        std::unordered_set<std::string> on_path;

        stack.push_back({&start, ChildNames(start), 0});
        path.push_back(start.name);
        on_path.insert(start.name);
        visited.insert(start.name);

        while (!stack.empty()) {
            Frame& frame = stack.back();
            if (frame.next_child >= frame.children.size()) {
                on_path.erase(frame.structure->name);
                path.pop_back();
                stack.pop_back();
                continue;
            }

            std::string const kChildName = frame.children[frame.next_child++];
            if (on_path.count(kChildName) != 0) {
                auto begin = std::find(path.begin(), path.end(), kChildName);
                ReferenceCycle cycle(begin, path.end());
                cycle.push_back(kChildName);
                cycles.push_back(std::move(cycle));
                continue;
            }
            if (visited.count(kChildName) != 0) {
                continue;
            }
            auto child = by_name.find(kChildName);
            if (child == by_name.end()) {
                continue;
            }
            visited.insert(kChildName);
            stack.push_back({child->second, ChildNames(*child->second), 0});
            path.push_back(kChildName);
            on_path.insert(kChildName);
        }
    }

    for (const ReferenceCycle& cycle : cycles) {
        std::cerr << "HierarchyResolver Warning: Circular reference detected: " << JoinNames(cycle) << std::endl;
    }
    return cycles;
}

std::vector<std::string> HierarchyResolver::FindTopStructures(const Library& library)
{
    std::unordered_set<std::string> referenced;
    for (const Structure& structure : library.structures) {
        for (const std::string& child : ChildNames(structure)) {
            referenced.insert(child);
        }
    }

    std::vector<std::string> tops;
    for (const Structure& structure : library.structures) {
        if (referenced.count(structure.name) == 0) {
            tops.push_back(structure.name);
        }
    }
    if (tops.empty() && !library.structures.empty()) {
        tops.push_back(library.structures.front().name);
    }
    return tops;
}

std::vector<LayerKey> HierarchyResolver::ExtractLayers(const Library& library)
{
    std::set<LayerKey> layers;
    for (const Structure& structure : library.structures) {
        for (const Element& element : structure.elements) {
            if (!element.IsReference()) {
                layers.insert(element.layer);
            }
        }
    }
    return {layers.begin(), layers.end()};
}

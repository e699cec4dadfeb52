#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "layout/Library.hpp"
#include "layout/processing/HierarchyResolver.hpp"
#include "scene/SpatialElement.hpp"
#include "utils/BBox.hpp"
#include "utils/SpatialIndex.hpp"
#include "view/Viewport.hpp"

struct LayerGroup {
    LayerKey key;
    bool visible = true;
    std::vector<size_t> members;  // Indices into SceneGraph::GetElements()
};

struct SceneStatistics {
    size_t total_elements = 0;
    size_t total_structures = 0;
    size_t total_layers = 0;
    size_t skipped_elements = 0;  // Resolved elements without usable bounds
    spatial_index::QuadTreeStatistics index;
    BBox bounds;
    double build_time_ms = 0.0;
};

struct CullingReport {
    size_t total_elements = 0;
    size_t visible_elements = 0;
    size_t culled_elements = 0;
    double culling_ratio = 0.0;  // culled / total
};

// Flattened, spatially indexed view of a library, grouped by layer.
//
// The quadtree may hold an element in several nodes; every query result is deduplicated by
// IdentityKey (first occurrence kept) and excludes hidden layers. Returned pointers stay valid
// until the next BuildFromLibrary() or Clear().
class SceneGraph
{
public:
    explicit SceneGraph(size_t index_capacity = spatial_index::kDefaultNodeCapacity, int index_max_depth = spatial_index::kDefaultMaxDepth, double bounds_padding = 1.1);
    ~SceneGraph();

    SceneGraph(const SceneGraph&) = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;

    void SetIndexParameters(size_t capacity, int max_depth, double bounds_padding);

    // Resolves start_structure (or every top structure when unset) and rebuilds the index and
    // layer groups. Layer visibility survives rebuilds. Returns the number of indexed elements.
    size_t BuildFromLibrary(const Library& library, const std::optional<std::string>& start_structure = std::nullopt);
    void Clear();

    [[nodiscard]] std::vector<const SpatialElement*> QueryViewport(const Viewport& viewport) const;
    [[nodiscard]] std::vector<const SpatialElement*> QueryRegion(const BBox& region) const;
    [[nodiscard]] std::vector<const SpatialElement*> QueryPoint(const Vec2& point) const;

    // Returns false when the scene has no such layer.
    bool SetLayerVisible(const LayerKey& key, bool visible);
    [[nodiscard]] bool IsLayerVisible(const LayerKey& key) const;

    // Aggregate bounds; a zero box at the origin when the scene has no geometry.
    [[nodiscard]] BBox GetBounds() const;
    [[nodiscard]] const std::optional<BBox>& GetContentBounds() const { return m_bounds_; }

    [[nodiscard]] const std::vector<SpatialElement>& GetElements() const { return m_elements_; }
    [[nodiscard]] size_t GetElementCount() const { return m_elements_.size(); }
    [[nodiscard]] bool IsEmpty() const { return m_elements_.empty(); }
    [[nodiscard]] std::vector<const SpatialElement*> GetLayerElements(const LayerKey& key) const;
    [[nodiscard]] const std::map<LayerKey, LayerGroup>& GetLayerGroups() const { return m_layer_groups_; }
    [[nodiscard]] std::vector<LayerKey> GetLayerKeys() const;

    [[nodiscard]] SceneStatistics GetStatistics() const;
    [[nodiscard]] CullingReport TestCullingEfficiency(const Viewport& viewport) const;
    [[nodiscard]] const std::vector<ReferenceCycle>& GetCycles() const { return m_resolver_.GetCycles(); }

    // Increments on every build or clear.
    [[nodiscard]] uint64_t GetGeneration() const { return m_generation_; }

    void RebuildSpatialIndex(size_t capacity, int max_depth);

private:
    void AppendResolved(ResolvedElementList&& resolved, const std::string& root_name);
    void BuildIndex();
    [[nodiscard]] std::vector<const SpatialElement*> Deduplicate(const std::vector<size_t>& raw) const;

    HierarchyResolver m_resolver_;
    std::vector<SpatialElement> m_elements_;
    std::map<LayerKey, LayerGroup> m_layer_groups_;
    std::map<LayerKey, bool> m_layer_visibility_;
    std::unique_ptr<spatial_index::QuadTree<size_t>> m_index_;
    std::optional<BBox> m_bounds_;

    size_t m_index_capacity_;
    int m_index_max_depth_;
    double m_bounds_padding_;

    size_t m_structure_count_ = 0;
    size_t m_skipped_elements_ = 0;
    double m_build_time_ms_ = 0.0;
    uint64_t m_generation_ = 0;
};

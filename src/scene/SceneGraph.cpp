#include "scene/SceneGraph.hpp"

#include <chrono>
#include <iostream>
#include <unordered_set>

SceneGraph::SceneGraph(size_t index_capacity, int index_max_depth, double bounds_padding)
    : m_index_capacity_(index_capacity), m_index_max_depth_(index_max_depth), m_bounds_padding_(bounds_padding)
{
}

SceneGraph::~SceneGraph() = default;

void SceneGraph::SetIndexParameters(size_t capacity, int max_depth, double bounds_padding)
{
    m_index_capacity_ = capacity;
    m_index_max_depth_ = max_depth;
    m_bounds_padding_ = bounds_padding < 1.0 ? 1.0 : bounds_padding;
}

size_t SceneGraph::BuildFromLibrary(const Library& library, const std::optional<std::string>& start_structure)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    m_elements_.clear();
    m_layer_groups_.clear();
    m_index_.reset();
    m_bounds_.reset();
    m_skipped_elements_ = 0;
    m_structure_count_ = library.structures.size();
    m_generation_++;

    // The resolver cache is only valid for the library it was filled from
    m_resolver_.ClearCache();

    if (start_structure) {
        AppendResolved(m_resolver_.Resolve(library, *start_structure), *start_structure);
    } else {
        for (const std::string& top_name : HierarchyResolver::FindTopStructures(library)) {
            AppendResolved(m_resolver_.Resolve(library, top_name), top_name);
        }
    }

    for (size_t i = 0; i < m_elements_.size(); ++i) {
        const LayerKey& key = m_elements_[i].Layer();
        auto [it, inserted] = m_layer_groups_.try_emplace(key);
        if (inserted) {
            it->second.key = key;
            auto visibility = m_layer_visibility_.find(key);
            it->second.visible = visibility == m_layer_visibility_.end() || visibility->second;
        }
        it->second.members.push_back(i);
    }

    BuildIndex();

    auto end_time = std::chrono::high_resolution_clock::now();
    m_build_time_ms_ = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    std::cout << "SceneGraph: Built " << m_elements_.size() << " elements in " << m_layer_groups_.size() << " layers from " << m_structure_count_
              << " structures (" << m_build_time_ms_ << " ms)" << std::endl;
    if (m_skipped_elements_ > 0) {
        std::cerr << "SceneGraph Warning: Skipped " << m_skipped_elements_ << " elements without valid bounds" << std::endl;
    }
    return m_elements_.size();
}

void SceneGraph::AppendResolved(ResolvedElementList&& resolved, const std::string& root_name)
{
    m_elements_.reserve(m_elements_.size() + resolved.size());
    for (size_t index = 0; index < resolved.size(); ++index) {
        ResolvedElement& item = resolved[index];
        if (item.element.IsReference()) {
            continue;
        }
        if (!item.element.bounds || !item.element.bounds->IsValid()) {
            m_skipped_elements_++;
            continue;
        }

        SpatialElement spatial;
        spatial.bounds = *item.element.bounds;
        spatial.identity = {root_name, index};
        spatial.source_structure = std::move(item.source_structure);
        spatial.source_index = item.source_index;
        spatial.element = std::move(item.element);

        bbox_utils::MergeInto(m_bounds_, spatial.bounds);
        m_elements_.push_back(std::move(spatial));
    }
}

void SceneGraph::BuildIndex()
{
    BBox region = m_bounds_ ? m_bounds_->Scaled(m_bounds_padding_) : BBox();
    if (region.Width() <= 0.0 || region.Height() <= 0.0) {
        region = region.Grown(1.0);
    }

    m_index_ = std::make_unique<spatial_index::QuadTree<size_t>>(region, m_index_capacity_, m_index_max_depth_);

    size_t rejected = 0;
    for (size_t i = 0; i < m_elements_.size(); ++i) {
        if (!m_index_->Insert(m_elements_[i].bounds, i)) {
            rejected++;
        }
    }
    if (rejected > 0) {
        std::cerr << "SceneGraph Warning: " << rejected << " elements fell outside the index region" << std::endl;
    }
}

void SceneGraph::RebuildSpatialIndex(size_t capacity, int max_depth)
{
    m_index_capacity_ = capacity;
    m_index_max_depth_ = max_depth;
    BuildIndex();
}

void SceneGraph::Clear()
{
    m_elements_.clear();
    m_layer_groups_.clear();
    m_layer_visibility_.clear();
    m_index_.reset();
    m_bounds_.reset();
    m_resolver_.ClearCache();
    m_structure_count_ = 0;
    m_skipped_elements_ = 0;
    m_build_time_ms_ = 0.0;
    m_generation_++;
}

std::vector<const SpatialElement*> SceneGraph::Deduplicate(const std::vector<size_t>& raw) const
{
    std::vector<const SpatialElement*> results;
    results.reserve(raw.size());
    std::unordered_set<IdentityKey, IdentityKeyHash> seen;
    seen.reserve(raw.size());

    for (size_t index : raw) {
        const SpatialElement& element = m_elements_[index];
        if (!IsLayerVisible(element.Layer())) {
            continue;
        }
        if (seen.insert(element.identity).second) {
            results.push_back(&element);
        }
    }
    return results;
}

std::vector<const SpatialElement*> SceneGraph::QueryRegion(const BBox& region) const
{
    if (!m_index_) {
        return {};
    }
    std::vector<size_t> raw;
    m_index_->Query(region, raw);
    return Deduplicate(raw);
}

std::vector<const SpatialElement*> SceneGraph::QueryViewport(const Viewport& viewport) const
{
    return QueryRegion(viewport.GetWorldBounds());
}

std::vector<const SpatialElement*> SceneGraph::QueryPoint(const Vec2& point) const
{
    if (!m_index_) {
        return {};
    }
    return Deduplicate(m_index_->QueryPoint(point));
}

bool SceneGraph::SetLayerVisible(const LayerKey& key, bool visible)
{
    auto it = m_layer_groups_.find(key);
    if (it == m_layer_groups_.end()) {
        std::cerr << "SceneGraph Warning: No layer " << key.ToString() << " in scene" << std::endl;
        return false;
    }
    it->second.visible = visible;
    m_layer_visibility_[key] = visible;
    return true;
}

bool SceneGraph::IsLayerVisible(const LayerKey& key) const
{
    auto it = m_layer_groups_.find(key);
    return it == m_layer_groups_.end() || it->second.visible;
}

BBox SceneGraph::GetBounds() const
{
    return m_bounds_ ? *m_bounds_ : BBox();
}

std::vector<const SpatialElement*> SceneGraph::GetLayerElements(const LayerKey& key) const
{
    std::vector<const SpatialElement*> members;
    auto it = m_layer_groups_.find(key);
    if (it == m_layer_groups_.end()) {
        return members;
    }
    members.reserve(it->second.members.size());
    for (size_t index : it->second.members) {
        members.push_back(&m_elements_[index]);
    }
    return members;
}

std::vector<LayerKey> SceneGraph::GetLayerKeys() const
{
    std::vector<LayerKey> keys;
    keys.reserve(m_layer_groups_.size());
    for (const auto& pair : m_layer_groups_) {
        keys.push_back(pair.first);
    }
    return keys;
}

SceneStatistics SceneGraph::GetStatistics() const
{
    SceneStatistics stats;
    stats.total_elements = m_elements_.size();
    stats.total_structures = m_structure_count_;
    stats.total_layers = m_layer_groups_.size();
    stats.skipped_elements = m_skipped_elements_;
    if (m_index_) {
        stats.index = m_index_->GetStatistics();
    }
    stats.bounds = GetBounds();
    stats.build_time_ms = m_build_time_ms_;
    return stats;
}

CullingReport SceneGraph::TestCullingEfficiency(const Viewport& viewport) const
{
    CullingReport report;
    report.total_elements = m_elements_.size();
    report.visible_elements = QueryViewport(viewport).size();
    report.culled_elements = report.total_elements - report.visible_elements;
    if (report.total_elements > 0) {
        report.culling_ratio = static_cast<double>(report.culled_elements) / static_cast<double>(report.total_elements);
    }
    std::cout << "SceneGraph: Culling " << report.culled_elements << "/" << report.total_elements << " elements (" << (report.culling_ratio * 100.0) << "%)"
              << std::endl;
    return report;
}

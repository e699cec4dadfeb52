#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#include "layout/Element.hpp"
#include "render/gl/BufferPool.hpp"
#include "render/gl/GpuDevice.hpp"
#include "render/gl/Triangulator.hpp"
#include "scene/SpatialElement.hpp"

class SceneGraph;

// Cached GPU geometry for every member element of one layer, drawn with a single call.
// The cache is keyed by a membership and content signature, so view changes never rebuild it.
class LayerBatch
{
public:
    explicit LayerBatch(const LayerKey& key);

    // Re-triangulates members and uploads the result. Acquires a buffer pair from pool on first use.
    bool Update(const std::vector<const SpatialElement*>& members, uint64_t signature, Triangulator& triangulator, BufferPool& pool, GpuDevice& device);
    // Returns false when there is nothing to draw.
    bool Draw(GpuDevice& device, int position_attrib) const;
    // Returns the buffer pair to pool.
    void Release(BufferPool& pool);

    void MarkDirty() { m_dirty_ = true; }
    [[nodiscard]] bool IsDirty() const { return m_dirty_; }

    [[nodiscard]] const LayerKey& GetKey() const { return m_key_; }
    [[nodiscard]] uint64_t GetSignature() const { return m_signature_; }
    [[nodiscard]] size_t GetVertexCount() const { return m_vertex_count_; }
    [[nodiscard]] size_t GetIndexCount() const { return m_index_count_; }
    [[nodiscard]] size_t GetTriangleCount() const { return m_index_count_ / 3; }
    [[nodiscard]] bool HasBuffers() const { return m_buffers_.IsValid(); }

    // Fillable polygons of an element: boundary polygons, box outlines (4+ points) and one
    // quad per path segment. Zero-width paths, nodes and text contribute nothing.
    static std::vector<std::vector<Vec2>> ExtractPolygons(const Element& element);
    // Order-sensitive hash of identity keys, bounds and element geometry.
    static uint64_t ComputeSignature(const std::vector<const SpatialElement*>& members);

private:
    LayerKey m_key_;
    GpuBufferPair m_buffers_;
    size_t m_vertex_count_ = 0;
    size_t m_index_count_ = 0;
    uint64_t m_signature_ = 0;
    bool m_dirty_ = true;
};

struct LayerBatchStatistics {
    size_t batch_count = 0;
    size_t total_vertices = 0;
    size_t total_triangles = 0;
    size_t dirty_batches = 0;
    size_t rebuild_count = 0;        // Batch updates since creation
    size_t triangulation_calls = 0;  // Polygons handed to the triangulator since creation
};

// One LayerBatch per layer key of the scene. Sync() compares layer signatures after a
// scene change; only changed layers become dirty, and dirty batches rebuild lazily when drawn.
class LayerBatchManager
{
public:
    LayerBatchManager(GpuDevice& device, BufferPool& pool);
    ~LayerBatchManager();

    LayerBatchManager(const LayerBatchManager&) = delete;
    LayerBatchManager& operator=(const LayerBatchManager&) = delete;

    void Sync(const SceneGraph& scene_graph);
    // Batch for key, rebuilt first if dirty; nullptr when the scene has no such layer.
    LayerBatch* Prepare(const LayerKey& key, const SceneGraph& scene_graph);

    void MarkAllDirty();
    void Clear();

    [[nodiscard]] size_t GetBatchCount() const { return m_batches_.size(); }
    [[nodiscard]] const LayerBatch* FindBatch(const LayerKey& key) const;
    [[nodiscard]] LayerBatchStatistics GetStatistics() const;

private:
    GpuDevice& m_device_;
    BufferPool& m_pool_;
    Triangulator m_triangulator_;
    std::map<LayerKey, std::unique_ptr<LayerBatch>> m_batches_;
    std::map<LayerKey, uint64_t> m_pending_signatures_;
    size_t m_rebuild_count_ = 0;
};

#include "render/gl/LayerBatch.hpp"

#include <cmath>
#include <iostream>

#include "layout/ElementGeometry.hpp"
#include "scene/SceneGraph.hpp"

namespace
{
// FNV-1a over raw bytes.
constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void HashBytes(uint64_t& hash, const void* data, size_t size)
{
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= kFnvPrime;
    }
}

void HashDouble(uint64_t& hash, double value)
{
    HashBytes(hash, &value, sizeof(value));
}

void HashInt(uint64_t& hash, int value)
{
    HashBytes(hash, &value, sizeof(value));
}

void HashPoints(uint64_t& hash, const std::vector<Vec2>& points)
{
    size_t const kCount = points.size();
    HashBytes(hash, &kCount, sizeof(kCount));
    for (const Vec2& point : points) {
        HashDouble(hash, point.x_ax);
        HashDouble(hash, point.y_ax);
    }
}

void HashPolylines(uint64_t& hash, const std::vector<Polyline>& polylines)
{
    size_t const kCount = polylines.size();
    HashBytes(hash, &kCount, sizeof(kCount));
    for (const Polyline& polyline : polylines) {
        HashPoints(hash, polyline);
    }
}

// Everything that affects the triangles an element contributes.
void HashElementContent(uint64_t& hash, const Element& element)
{
    auto const kKind = static_cast<uint8_t>(element.Kind());
    HashBytes(hash, &kKind, sizeof(kKind));
    HashInt(hash, element.layer.layer);
    HashInt(hash, element.layer.data_type);

    switch (element.Kind()) {
        case ElementKind::kBoundary:
            HashPolylines(hash, element.As<BoundaryElement>()->polygons);
            break;
        case ElementKind::kPath: {
            const PathElement& path = *element.As<PathElement>();
            HashInt(hash, path.path_type);
            HashDouble(hash, path.width);
            HashDouble(hash, path.begin_extension);
            HashDouble(hash, path.end_extension);
            HashPolylines(hash, path.paths);
            break;
        }
        case ElementKind::kBox:
            HashPoints(hash, element.As<BoxElement>()->points);
            break;
        case ElementKind::kNode:
            HashPoints(hash, element.As<NodeElement>()->points);
            break;
        case ElementKind::kText: {
            const TextElement& text = *element.As<TextElement>();
            HashDouble(hash, text.position.x_ax);
            HashDouble(hash, text.position.y_ax);
            HashBytes(hash, text.text.data(), text.text.size());
            break;
        }
        default:
            break;
    }
}

// Extension applied before the first and after the last vertex of a path.
std::pair<double, double> PathExtensions(const PathElement& path)
{
    switch (path.path_type) {
        case 2:
            return {path.width / 2.0, path.width / 2.0};
        case 4:
            return {path.begin_extension, path.end_extension};
        default:
            return {0.0, 0.0};
    }
}

void AppendPathQuads(const PathElement& path, std::vector<std::vector<Vec2>>& polygons)
{
    if (path.width <= 0.0) {
        return;
    }
    double const kHalfWidth = path.width / 2.0;
    auto const [kBeginExtension, kEndExtension] = PathExtensions(path);

    for (const Polyline& polyline : path.paths) {
        if (polyline.size() < 2) {
            continue;
        }
        size_t const kLastSegment = polyline.size() - 2;
        for (size_t i = 0; i + 1 < polyline.size(); ++i) {
            Vec2 start = polyline[i];
            Vec2 end = polyline[i + 1];
            Vec2 const kDelta = end - start;
            double const kLength = kDelta.Length();
            if (kLength <= 0.0) {
                continue;
            }
            Vec2 const kDir = kDelta / kLength;
            if (i == 0) {
                start = start - kDir * kBeginExtension;
            }
            if (i == kLastSegment) {
                end = end + kDir * kEndExtension;
            }
            Vec2 const kOffset = kDir.Perpendicular() * kHalfWidth;
            polygons.push_back({start - kOffset, end - kOffset, end + kOffset, start + kOffset});
        }
    }
}
}  // namespace

LayerBatch::LayerBatch(const LayerKey& key) : m_key_(key) {}

std::vector<std::vector<Vec2>> LayerBatch::ExtractPolygons(const Element& element)
{
    std::vector<std::vector<Vec2>> polygons;
    switch (element.Kind()) {
        case ElementKind::kBoundary:
        case ElementKind::kBox:
            polygons = layout_geometry::FilledOutlines(element);
            break;
        case ElementKind::kPath:
            AppendPathQuads(*element.As<PathElement>(), polygons);
            break;
        default:
            break;
    }
    return polygons;
}

uint64_t LayerBatch::ComputeSignature(const std::vector<const SpatialElement*>& members)
{
    uint64_t hash = kFnvOffset;
    size_t const kCount = members.size();
    HashBytes(hash, &kCount, sizeof(kCount));
    for (const SpatialElement* member : members) {
        size_t const kIdentityHash = IdentityKeyHash {}(member->identity);
        HashBytes(hash, &kIdentityHash, sizeof(kIdentityHash));
        HashDouble(hash, member->bounds.min_x);
        HashDouble(hash, member->bounds.min_y);
        HashDouble(hash, member->bounds.max_x);
        HashDouble(hash, member->bounds.max_y);
        HashElementContent(hash, member->element);
    }
    return hash;
}

bool LayerBatch::Update(const std::vector<const SpatialElement*>& members, uint64_t signature, Triangulator& triangulator, BufferPool& pool, GpuDevice& device)
{
    std::vector<std::vector<Vec2>> polygons;
    for (const SpatialElement* member : members) {
        std::vector<std::vector<Vec2>> element_polygons = ExtractPolygons(member->element);
        for (std::vector<Vec2>& polygon : element_polygons) {
            polygons.push_back(std::move(polygon));
        }
    }

    TriangulatedGeometry const kGeometry = triangulator.TriangulateMultiple(polygons);
    m_signature_ = signature;
    m_dirty_ = false;

    if (kGeometry.IsEmpty()) {
        m_vertex_count_ = 0;
        m_index_count_ = 0;
        return true;
    }

    if (!m_buffers_.IsValid()) {
        m_buffers_ = pool.Acquire();
        if (!m_buffers_.IsValid()) {
            m_vertex_count_ = 0;
            m_index_count_ = 0;
            return false;
        }
    }
    if (!device.UploadGeometry(m_buffers_, kGeometry.vertices, kGeometry.indices)) {
        std::cerr << "LayerBatch::Update Error: Upload failed for layer " << m_key_.ToString() << std::endl;
        m_vertex_count_ = 0;
        m_index_count_ = 0;
        return false;
    }
    m_vertex_count_ = kGeometry.VertexCount();
    m_index_count_ = kGeometry.indices.size();
    return true;
}

bool LayerBatch::Draw(GpuDevice& device, int position_attrib) const
{
    if (m_index_count_ == 0 || !m_buffers_.IsValid()) {
        return false;
    }
    device.DrawTriangles(m_buffers_, position_attrib, m_index_count_);
    return true;
}

void LayerBatch::Release(BufferPool& pool)
{
    if (m_buffers_.IsValid()) {
        pool.Release(m_buffers_);
        m_buffers_ = GpuBufferPair();
    }
    m_vertex_count_ = 0;
    m_index_count_ = 0;
    m_dirty_ = true;
}

LayerBatchManager::LayerBatchManager(GpuDevice& device, BufferPool& pool) : m_device_(device), m_pool_(pool) {}

LayerBatchManager::~LayerBatchManager()
{
    Clear();
}

void LayerBatchManager::Sync(const SceneGraph& scene_graph)
{
    const std::map<LayerKey, LayerGroup>& groups = scene_graph.GetLayerGroups();

    for (auto it = m_batches_.begin(); it != m_batches_.end();) {
        if (groups.find(it->first) == groups.end()) {
            it->second->Release(m_pool_);
            m_pending_signatures_.erase(it->first);
            it = m_batches_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& [key, group] : groups) {
        uint64_t const kSignature = LayerBatch::ComputeSignature(scene_graph.GetLayerElements(key));
        m_pending_signatures_[key] = kSignature;

        auto it = m_batches_.find(key);
        if (it == m_batches_.end()) {
            m_batches_.emplace(key, std::make_unique<LayerBatch>(key));
        } else if (it->second->GetSignature() != kSignature) {
            it->second->MarkDirty();
        }
    }
}

LayerBatch* LayerBatchManager::Prepare(const LayerKey& key, const SceneGraph& scene_graph)
{
    auto it = m_batches_.find(key);
    if (it == m_batches_.end()) {
        return nullptr;
    }
    LayerBatch& batch = *it->second;
    if (batch.IsDirty()) {
        std::vector<const SpatialElement*> const kMembers = scene_graph.GetLayerElements(key);
        auto signature_it = m_pending_signatures_.find(key);
        uint64_t const kSignature = signature_it != m_pending_signatures_.end() ? signature_it->second : LayerBatch::ComputeSignature(kMembers);
        batch.Update(kMembers, kSignature, m_triangulator_, m_pool_, m_device_);
        m_rebuild_count_++;
    }
    return &batch;
}

void LayerBatchManager::MarkAllDirty()
{
    for (auto& [key, batch] : m_batches_) {
        batch->MarkDirty();
    }
}

void LayerBatchManager::Clear()
{
    for (auto& [key, batch] : m_batches_) {
        batch->Release(m_pool_);
    }
    m_batches_.clear();
    m_pending_signatures_.clear();
}

const LayerBatch* LayerBatchManager::FindBatch(const LayerKey& key) const
{
    auto it = m_batches_.find(key);
    return it != m_batches_.end() ? it->second.get() : nullptr;
}

LayerBatchStatistics LayerBatchManager::GetStatistics() const
{
    LayerBatchStatistics stats;
    stats.batch_count = m_batches_.size();
    for (const auto& [key, batch] : m_batches_) {
        stats.total_vertices += batch->GetVertexCount();
        stats.total_triangles += batch->GetTriangleCount();
        if (batch->IsDirty()) {
            stats.dirty_batches++;
        }
    }
    stats.rebuild_count = m_rebuild_count_;
    stats.triangulation_calls = m_triangulator_.GetStatistics().polygons_triangulated + m_triangulator_.GetStatistics().polygons_rejected;
    return stats;
}

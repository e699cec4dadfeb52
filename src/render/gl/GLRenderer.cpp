#include "render/gl/GLRenderer.hpp"

#include <iostream>

#include "render/gl/OpenGLDevice.hpp"
#include "utils/ColorUtils.hpp"

GLRenderer::GLRenderer(const RenderSettings& settings, std::unique_ptr<GpuDevice> device)
    : BaseRenderer(settings), m_device_(device ? std::move(device) : std::make_unique<OpenGLDevice>()), m_batching_enabled_(settings.m_batching_enabled)
{
}

GLRenderer::~GLRenderer()
{
    Dispose();
}

std::array<float, 9> GLRenderer::ComputeClipMatrix(const Viewport& viewport)
{
    double const kScaleX = (2.0 * viewport.GetZoom()) / viewport.GetWidth();
    double const kScaleY = (2.0 * viewport.GetZoom()) / viewport.GetHeight();
    const Vec2& center = viewport.GetCenter();
    return {static_cast<float>(kScaleX), 0.0F, 0.0F, 0.0F, static_cast<float>(kScaleY), 0.0F, static_cast<float>(-center.x_ax * kScaleX), static_cast<float>(-center.y_ax * kScaleY), 1.0F};
}

bool GLRenderer::InitializeBackend(int width, int height)
{
    if (!m_device_->IsAvailable()) {
        std::cerr << "GLRenderer::Initialize Error: GPU device unavailable (no OpenGL 3.3 context)" << std::endl;
        return false;
    }

    m_program_ = std::make_unique<ShaderProgram>(*m_device_, layout_shaders::kFillVertexShader, layout_shaders::kFillFragmentShader);
    if (!m_program_->Compile()) {
        std::cerr << "GLRenderer::Initialize Error: Failed to compile shaders" << std::endl;
        m_program_.reset();
        return false;
    }

    m_buffer_pool_ = std::make_unique<BufferPool>(*m_device_);
    m_batch_manager_ = std::make_unique<LayerBatchManager>(*m_device_, *m_buffer_pool_);
    m_synced_generation_ = UINT64_MAX;

    m_device_->EnableAlphaBlending();
    m_device_->SetViewport(width, height);
    std::cout << "GLRenderer: Initialized on " << m_device_->GetDescription() << std::endl;
    return true;
}

void GLRenderer::DisposeBackend()
{
    // Batches return their buffers to the pool before the pool destroys them.
    m_batch_manager_.reset();
    m_unbatched_geometry_.clear();
    if (m_buffer_pool_) {
        m_buffer_pool_->Dispose();
        m_buffer_pool_.reset();
    }
    if (m_program_) {
        m_program_->Dispose();
        m_program_.reset();
    }
    m_synced_generation_ = UINT64_MAX;
}

void GLRenderer::OnSceneChanged()
{
    m_unbatched_geometry_.clear();
    if (m_batch_manager_) {
        SyncBatches();
    }
}

void GLRenderer::SyncBatches()
{
    m_batch_manager_->Sync(GetSceneGraph());
    m_synced_generation_ = GetSceneGraph().GetGeneration();
}

void GLRenderer::OnSurfaceResized(int width, int height)
{
    m_device_->SetViewport(width, height);
}

void GLRenderer::SetBatchingEnabled(bool enabled)
{
    if (m_batching_enabled_ == enabled) {
        return;
    }
    m_batching_enabled_ = enabled;
    if (m_batch_manager_) {
        if (enabled) {
            SyncBatches();
        } else {
            m_batch_manager_->Clear();
        }
        m_unbatched_geometry_.clear();
    }
    std::cout << "GLRenderer: Batching " << (enabled ? "enabled" : "disabled") << std::endl;
}

void GLRenderer::InvalidateBatches()
{
    if (m_batch_manager_) {
        m_batch_manager_->MarkAllDirty();
    }
    m_unbatched_geometry_.clear();
}

GLBatchStatistics GLRenderer::GetBatchStatistics() const
{
    GLBatchStatistics stats;
    stats.batching_enabled = m_batching_enabled_;
    if (m_batch_manager_) {
        stats.batches = m_batch_manager_->GetStatistics();
    }
    if (m_buffer_pool_) {
        stats.buffers = m_buffer_pool_->GetStatistics();
    }
    stats.unbatched_cached_elements = m_unbatched_geometry_.size();
    stats.unbatched_polygons_rejected = m_unbatched_triangulator_.GetStatistics().polygons_rejected;
    return stats;
}

void GLRenderer::DrawFrame(const FrameContext& frame, FrameCounters& counters)
{
    if (!m_program_ || !m_program_->IsCompiled() || !m_buffer_pool_ || !m_batch_manager_) {
        return;
    }

    m_device_->SetViewport(frame.viewport.GetWidth(), frame.viewport.GetHeight());
    m_device_->Clear(color_utils::ToNormalizedRgba(GetSettings().m_background_color));
    if (frame.layers.empty()) {
        return;
    }

    if (m_synced_generation_ != GetSceneGraph().GetGeneration()) {
        m_unbatched_geometry_.clear();
        if (m_batching_enabled_) {
            SyncBatches();
        } else {
            m_synced_generation_ = GetSceneGraph().GetGeneration();
        }
    }

    m_program_->Use();
    m_program_->SetUniformMatrix3("u_viewMatrix", ComputeClipMatrix(frame.viewport));
    int const kPositionAttrib = m_program_->GetAttributeLocation("a_position");
    if (kPositionAttrib < 0) {
        return;
    }

    for (const LayerDrawList& layer : frame.layers) {
        if (!layer.style.fill_enabled) {
            continue;
        }
        m_program_->SetUniformVec4("u_color", color_utils::ToNormalizedRgba(layer.style.color));
        m_program_->SetUniformFloat("u_opacity", layer.style.opacity);

        if (m_batching_enabled_) {
            DrawLayerBatched(layer, kPositionAttrib, counters);
        } else {
            DrawLayerUnbatched(layer, kPositionAttrib, counters);
        }
    }
}

void GLRenderer::DrawLayerBatched(const LayerDrawList& layer, int position_attrib, FrameCounters& counters)
{
    LayerBatch* batch = m_batch_manager_->Prepare(layer.key, GetSceneGraph());
    if (batch == nullptr) {
        return;
    }
    if (batch->Draw(*m_device_, position_attrib)) {
        counters.draw_calls++;
        counters.triangles += batch->GetTriangleCount();
    }
}

void GLRenderer::DrawLayerUnbatched(const LayerDrawList& layer, int position_attrib, FrameCounters& counters)
{
    for (const SpatialElement* spatial_element : layer.elements) {
        const TriangulatedGeometry& geometry = GetUnbatchedGeometry(*spatial_element);
        if (geometry.IsEmpty()) {
            continue;
        }

        GpuBufferPair const kBuffers = m_buffer_pool_->Acquire();
        if (!kBuffers.IsValid()) {
            return;
        }
        if (m_device_->UploadGeometry(kBuffers, geometry.vertices, geometry.indices)) {
            m_device_->DrawTriangles(kBuffers, position_attrib, geometry.indices.size());
            counters.draw_calls++;
            counters.triangles += geometry.TriangleCount();
        }
        m_buffer_pool_->Release(kBuffers);
    }
}

const TriangulatedGeometry& GLRenderer::GetUnbatchedGeometry(const SpatialElement& spatial_element)
{
    auto it = m_unbatched_geometry_.find(spatial_element.identity);
    if (it == m_unbatched_geometry_.end()) {
        std::vector<std::vector<Vec2>> const kPolygons = LayerBatch::ExtractPolygons(spatial_element.element);
        TriangulatedGeometry geometry;
        if (!kPolygons.empty()) {
            geometry = m_unbatched_triangulator_.TriangulateMultiple(kPolygons);
        }
        it = m_unbatched_geometry_.emplace(spatial_element.identity, std::move(geometry)).first;
    }
    return it->second;
}

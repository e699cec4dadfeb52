#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <unordered_map>

#include "render/BaseRenderer.hpp"
#include "render/gl/BufferPool.hpp"
#include "render/gl/GpuDevice.hpp"
#include "render/gl/LayerBatch.hpp"
#include "render/gl/ShaderProgram.hpp"
#include "render/gl/Triangulator.hpp"
#include "scene/SpatialElement.hpp"

struct GLBatchStatistics {
    LayerBatchStatistics batches;
    BufferPoolStatistics buffers;
    size_t unbatched_cached_elements = 0;
    size_t unbatched_polygons_rejected = 0;
    bool batching_enabled = true;
};

// Backend B: triangulated layer geometry cached in GPU buffers. With batching enabled every
// visible layer costs one draw call regardless of its element count.
class GLRenderer : public BaseRenderer
{
public:
    // device defaults to OpenGLDevice, which needs a current GL 3.3 context at Initialize().
    explicit GLRenderer(const RenderSettings& settings = RenderSettings(), std::unique_ptr<GpuDevice> device = nullptr);
    ~GLRenderer() override;

    [[nodiscard]] RendererBackend GetBackend() const override { return RendererBackend::kOpenGL; }

    // Disabling drops every batch; elements are then triangulated and drawn one by one.
    void SetBatchingEnabled(bool enabled);
    [[nodiscard]] bool IsBatchingEnabled() const { return m_batching_enabled_; }
    // Forces every batch to rebuild on its next draw.
    void InvalidateBatches();
    [[nodiscard]] GLBatchStatistics GetBatchStatistics() const;

    // World -> clip space, column-major: scale (2*zoom/w, 2*zoom/h) about the viewport center.
    static std::array<float, 9> ComputeClipMatrix(const Viewport& viewport);

protected:
    bool InitializeBackend(int width, int height) override;
    void DisposeBackend() override;
    void DrawFrame(const FrameContext& frame, FrameCounters& counters) override;
    void OnSceneChanged() override;
    void OnSurfaceResized(int width, int height) override;

private:
    void DrawLayerBatched(const LayerDrawList& layer, int position_attrib, FrameCounters& counters);
    void DrawLayerUnbatched(const LayerDrawList& layer, int position_attrib, FrameCounters& counters);
    void SyncBatches();
    const TriangulatedGeometry& GetUnbatchedGeometry(const SpatialElement& spatial_element);

    std::unique_ptr<GpuDevice> m_device_;
    std::unique_ptr<ShaderProgram> m_program_;
    std::unique_ptr<BufferPool> m_buffer_pool_;
    std::unique_ptr<LayerBatchManager> m_batch_manager_;
    Triangulator m_unbatched_triangulator_;
    // Per-element triangles for the unbatched path, valid for one scene generation. Rejected
    // polygons are triangulated (and reported) once per element.
    std::unordered_map<IdentityKey, TriangulatedGeometry, IdentityKeyHash> m_unbatched_geometry_;

    bool m_batching_enabled_;
    uint64_t m_synced_generation_ = UINT64_MAX;
};

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <vector>

#include "layout/Transform.hpp"
#include "render/LayoutRenderer.hpp"
#include "scene/SceneGraph.hpp"

// Visible elements of one layer for one frame, in query order.
struct LayerDrawList {
    LayerKey key;
    LayerStyle style;
    std::vector<const SpatialElement*> elements;
};

struct FrameContext {
    Viewport viewport;
    Transform view_transform;  // World -> device pixels, y flipped
    std::vector<LayerDrawList> layers;  // Ascending layer key order
    size_t visible_elements = 0;
};

// Per-frame counters a backend fills in while drawing.
struct FrameCounters {
    size_t draw_calls = 0;
    size_t triangles = 0;
};

// Shared renderer logic: scene binding, culling and layer grouping, styles, statistics and
// coordinate conversion. Backends implement the Initialize/Dispose/DrawFrame hooks.
class BaseRenderer : public LayoutRenderer
{
public:
    explicit BaseRenderer(const RenderSettings& settings);
    ~BaseRenderer() override;

    BaseRenderer(const BaseRenderer&) = delete;
    BaseRenderer& operator=(const BaseRenderer&) = delete;

    bool Initialize(int width, int height) override;
    [[nodiscard]] bool IsReady() const override { return m_ready_; }
    void Dispose() override;

    void SetLibrary(std::shared_ptr<const Library> library) override;
    void UpdateSceneGraph() override;
    void AttachScene(std::shared_ptr<const Library> library, std::shared_ptr<SceneGraph> scene_graph) override;
    void ClearScene() override;

    void Render(const Viewport& viewport) override;
    void OnViewportResized(int width, int height) override;

    void SetLayerVisible(const LayerKey& key, bool visible) override;
    [[nodiscard]] bool IsLayerVisible(const LayerKey& key) const override;
    void SetLayerStyle(const LayerKey& key, const LayerStyle& style) override;
    [[nodiscard]] LayerStyle GetLayerStyle(const LayerKey& key) const override;
    [[nodiscard]] std::vector<LayerKey> GetLayerKeys() const;

    [[nodiscard]] std::vector<const SpatialElement*> Pick(const Vec2& world_point) const override;
    [[nodiscard]] std::vector<const SpatialElement*> GetElementsInRegion(const BBox& world_region) const override;
    // Screen rectangle (two corners, device pixels) against the current viewport.
    [[nodiscard]] std::vector<const SpatialElement*> GetElementsInScreenRegion(const Vec2& screen_corner_a, const Vec2& screen_corner_b) const;

    [[nodiscard]] RenderStatistics GetStatistics() const override { return m_statistics_; }
    void ResetStatistics();

    [[nodiscard]] Vec2 ScreenToWorld(const Vec2& screen_point) const override;
    [[nodiscard]] Vec2 WorldToScreen(const Vec2& world_point) const override;
    [[nodiscard]] BBox GetVisibleWorldBounds(const Viewport& viewport) const;
    [[nodiscard]] const Viewport& GetCurrentViewport() const { return m_viewport_; }

    [[nodiscard]] const SceneGraph& GetSceneGraph() const override { return *m_scene_graph_; }
    [[nodiscard]] std::shared_ptr<SceneGraph> GetSharedSceneGraph() const override { return m_scene_graph_; }
    [[nodiscard]] std::shared_ptr<const Library> GetLibrary() const override { return m_library_; }

    void SetDebugOverlay(bool enabled) { m_settings_.m_debug_overlay = enabled; }
    [[nodiscard]] bool IsDebugOverlayEnabled() const { return m_settings_.m_debug_overlay; }
    [[nodiscard]] const RenderSettings& GetSettings() const { return m_settings_; }

    // World -> device pixel transform: translate(w/2, h/2) * scale(zoom, -zoom) * translate(-center).
    static Transform ComputeViewTransform(const Viewport& viewport);

protected:
    virtual bool InitializeBackend(int width, int height) = 0;
    virtual void DisposeBackend() = 0;
    virtual void DrawFrame(const FrameContext& frame, FrameCounters& counters) = 0;
    // Called after the scene graph was rebuilt, attached or cleared.
    virtual void OnSceneChanged() {}
    virtual void OnSurfaceResized(int /*width*/, int /*height*/) {}

    [[nodiscard]] SceneGraph& MutableSceneGraph() { return *m_scene_graph_; }

private:
    void InitializeLayerStyles();
    [[nodiscard]] LayerStyle MakeDefaultStyle(const LayerKey& key) const;
    [[nodiscard]] std::vector<LayerDrawList> GroupByLayer(const std::vector<const SpatialElement*>& visible) const;
    void UpdateStatistics(double frame_time_ms, size_t elements_rendered, const FrameCounters& counters);

    RenderSettings m_settings_;
    bool m_ready_ = false;

    std::shared_ptr<const Library> m_library_;
    std::shared_ptr<SceneGraph> m_scene_graph_;
    std::map<LayerKey, LayerStyle> m_layer_styles_;

    Viewport m_viewport_;

    RenderStatistics m_statistics_;
    size_t m_frames_since_fps_update_ = 0;
    std::chrono::high_resolution_clock::time_point m_fps_window_start_;
    bool m_warned_not_ready_ = false;
};

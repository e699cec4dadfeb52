#pragma once

#include <map>
#include <memory>
#include <string>

#include <blend2d.h>

#include "render/BaseRenderer.hpp"
#include "render/RenderContext.hpp"

// Backend A: rasterizes every visible element directly into an off-screen Blend2D image.
// Draw calls scale with the number of visible elements.
class Blend2DRenderer : public BaseRenderer
{
public:
    explicit Blend2DRenderer(const RenderSettings& settings = RenderSettings());
    ~Blend2DRenderer() override;

    [[nodiscard]] RendererBackend GetBackend() const override { return RendererBackend::kBlend2D; }

    // Result of the last Render() call.
    [[nodiscard]] const BLImage& GetImage() const { return m_render_context_.GetTargetImage(); }

protected:
    bool InitializeBackend(int width, int height) override;
    void DisposeBackend() override;
    void DrawFrame(const FrameContext& frame, FrameCounters& counters) override;
    void OnSurfaceResized(int width, int height) override;

private:
    void DrawElement(BLContext& bl_ctx, const Element& element, const LayerStyle& style, double zoom, FrameCounters& counters);
    void DrawFilledOutlines(BLContext& bl_ctx, const std::vector<Polyline>& outlines, const LayerStyle& style, double zoom, FrameCounters& counters);
    void DrawPath(BLContext& bl_ctx, const PathElement& path, const LayerStyle& style, double zoom, FrameCounters& counters);
    void DrawNode(BLContext& bl_ctx, const NodeElement& node, const LayerStyle& style, double zoom, FrameCounters& counters);
    void DrawText(BLContext& bl_ctx, const TextElement& text, const LayerStyle& style, double zoom, FrameCounters& counters);
    void DrawDebugOverlay(BLContext& bl_ctx, const FrameContext& frame, const FrameCounters& counters);

    // nullptr when no font face could be loaded.
    BLFont* GetCachedFont(float size);

    static BLPath BuildPolylinePath(const Polyline& points, bool closed);
    static BLStrokeCap StrokeCapForPathType(int path_type);

    RenderContext m_render_context_;

    std::map<float, BLFont> m_font_cache_;
    BLFontFace m_font_face_;
    bool m_font_lookup_done_ = false;
};

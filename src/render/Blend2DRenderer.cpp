#include "render/Blend2DRenderer.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <iostream>
#include <vector>

#include <glm/mat3x3.hpp>

#include "layout/ElementGeometry.hpp"
#include "utils/ColorUtils.hpp"

namespace
{
constexpr double kNodeRadiusPixels = 2.0;
constexpr float kDebugFontSize = 13.0F;

BLMatrix2D ToBLMatrix(const Transform& transform)
{
    const glm::dmat3& m = transform.Matrix();
    return BLMatrix2D(m[0][0], m[0][1], m[1][0], m[1][1], m[2][0], m[2][1]);
}
}  // namespace

Blend2DRenderer::Blend2DRenderer(const RenderSettings& settings) : BaseRenderer(settings) {}

Blend2DRenderer::~Blend2DRenderer()
{
    Dispose();
}

bool Blend2DRenderer::InitializeBackend(int width, int height)
{
    if (!m_render_context_.Initialize(width, height)) {
        std::cerr << "Blend2DRenderer::Initialize Error: Failed to create render context" << std::endl;
        return false;
    }
    m_render_context_.SetClearColor(GetSettings().m_background_color);
    m_render_context_.OptimizeForStatic();
    return true;
}

void Blend2DRenderer::DisposeBackend()
{
    m_font_cache_.clear();
    m_font_face_.reset();
    m_font_lookup_done_ = false;
    m_render_context_.Shutdown();
}

void Blend2DRenderer::OnSurfaceResized(int width, int height)
{
    if (m_render_context_.ResizeImage(width, height)) {
        m_render_context_.OptimizeForStatic();
    }
}

void Blend2DRenderer::DrawFrame(const FrameContext& frame, FrameCounters& counters)
{
    if (!m_render_context_.IsInitialized()) {
        return;
    }
    BLContext& bl_ctx = m_render_context_.GetBlend2DContext();
    m_render_context_.BeginFrame();

    double const kZoom = frame.viewport.GetZoom();
    bl_ctx.save();
    bl_ctx.applyTransform(ToBLMatrix(frame.view_transform));
    for (const LayerDrawList& layer : frame.layers) {
        for (const SpatialElement* spatial_element : layer.elements) {
            DrawElement(bl_ctx, spatial_element->element, layer.style, kZoom, counters);
        }
    }
    bl_ctx.restore();

    if (IsDebugOverlayEnabled()) {
        DrawDebugOverlay(bl_ctx, frame, counters);
    }
    m_render_context_.EndFrame();
}

void Blend2DRenderer::DrawElement(BLContext& bl_ctx, const Element& element, const LayerStyle& style, double zoom, FrameCounters& counters)
{
    switch (element.Kind()) {
        case ElementKind::kBoundary:
        case ElementKind::kBox:
            DrawFilledOutlines(bl_ctx, layout_geometry::FilledOutlines(element), style, zoom, counters);
            break;
        case ElementKind::kPath:
            DrawPath(bl_ctx, *element.As<PathElement>(), style, zoom, counters);
            break;
        case ElementKind::kNode:
            DrawNode(bl_ctx, *element.As<NodeElement>(), style, zoom, counters);
            break;
        case ElementKind::kText:
            DrawText(bl_ctx, *element.As<TextElement>(), style, zoom, counters);
            break;
        case ElementKind::kSRef:
        case ElementKind::kARef:
            // References never reach the renderer; the scene graph stores flattened geometry only.
            break;
    }
}

BLPath Blend2DRenderer::BuildPolylinePath(const Polyline& points, bool closed)
{
    BLPath path;
    if (points.empty()) {
        return path;
    }
    path.moveTo(points.front().x_ax, points.front().y_ax);
    for (size_t i = 1; i < points.size(); ++i) {
        path.lineTo(points[i].x_ax, points[i].y_ax);
    }
    if (closed) {
        path.close();
    }
    return path;
}

BLStrokeCap Blend2DRenderer::StrokeCapForPathType(int path_type)
{
    switch (path_type) {
        case 1:
            return BL_STROKE_CAP_ROUND;
        case 2:
        case 4:
            return BL_STROKE_CAP_SQUARE;
        default:
            return BL_STROKE_CAP_BUTT;
    }
}

void Blend2DRenderer::DrawFilledOutlines(BLContext& bl_ctx, const std::vector<Polyline>& outlines, const LayerStyle& style, double zoom, FrameCounters& counters)
{
    for (const Polyline& outline : outlines) {
        if (outline.size() < 3) {
            continue;
        }
        BLPath path = BuildPolylinePath(outline, true);

        if (style.fill_enabled) {
            bl_ctx.setFillStyle(color_utils::WithOpacity(style.color, style.opacity));
            bl_ctx.fillPath(path);
            counters.draw_calls++;
        }
        if (style.stroke_enabled) {
            bl_ctx.setStrokeStyle(style.color);
            bl_ctx.setStrokeWidth(style.line_width / zoom);
            bl_ctx.setStrokeStartCap(BL_STROKE_CAP_BUTT);
            bl_ctx.setStrokeEndCap(BL_STROKE_CAP_BUTT);
            bl_ctx.setStrokeJoin(BL_STROKE_JOIN_MITER_CLIP);
            bl_ctx.strokePath(path);
            counters.draw_calls++;
        }
    }
}

void Blend2DRenderer::DrawPath(BLContext& bl_ctx, const PathElement& path, const LayerStyle& style, double zoom, FrameCounters& counters)
{
    // Zero-width paths are drawn as hairlines.
    double const kStrokeWidth = path.width > 0.0 ? path.width : style.line_width / zoom;
    BLStrokeCap const kCap = StrokeCapForPathType(path.path_type);

    bl_ctx.setStrokeStyle(color_utils::WithOpacity(style.color, style.opacity));
    bl_ctx.setStrokeWidth(kStrokeWidth);
    bl_ctx.setStrokeStartCap(kCap);
    bl_ctx.setStrokeEndCap(kCap);
    bl_ctx.setStrokeJoin(BL_STROKE_JOIN_ROUND);

    for (const Polyline& polyline : path.paths) {
        if (polyline.size() < 2) {
            continue;
        }
        bl_ctx.strokePath(BuildPolylinePath(polyline, false));
        counters.draw_calls++;
    }
}

void Blend2DRenderer::DrawNode(BLContext& bl_ctx, const NodeElement& node, const LayerStyle& style, double zoom, FrameCounters& counters)
{
    bl_ctx.setFillStyle(style.color);
    double const kRadius = kNodeRadiusPixels / zoom;
    for (const Vec2& point : node.points) {
        bl_ctx.fillCircle(point.x_ax, point.y_ax, kRadius);
        counters.draw_calls++;
    }
}

void Blend2DRenderer::DrawText(BLContext& bl_ctx, const TextElement& text, const LayerStyle& style, double zoom, FrameCounters& counters)
{
    if (text.text.empty()) {
        return;
    }

    bl_ctx.setFillStyle(style.color);

    // World text height is kTextHeight units; the font is sized in world units and drawn in a
    // y-flipped frame at the anchor so glyphs stay upright.
    float const kFontSize = static_cast<float>(layout_geometry::kTextHeight);
    BLFont* font = GetCachedFont(kFontSize);
    if (font == nullptr) {
        bl_ctx.fillCircle(text.position.x_ax, text.position.y_ax, kNodeRadiusPixels / zoom);
        counters.draw_calls++;
        return;
    }

    double const kHalfWidth = 0.5 * layout_geometry::kTextCharWidth * static_cast<double>(text.text.size());
    double const kHalfHeight = 0.5 * layout_geometry::kTextHeight;

    bl_ctx.save();
    bl_ctx.translate(text.position.x_ax, text.position.y_ax);
    bl_ctx.scale(1.0, -1.0);
    bl_ctx.fillUtf8Text(BLPoint(-kHalfWidth, kHalfHeight), *font, text.text.c_str());
    bl_ctx.restore();
    counters.draw_calls++;
}

void Blend2DRenderer::DrawDebugOverlay(BLContext& bl_ctx, const FrameContext& frame, const FrameCounters& counters)
{
    BLFont* font = GetCachedFont(kDebugFontSize);
    if (font == nullptr) {
        return;
    }

    RenderStatistics const kStats = GetStatistics();
    char line[128];
    std::snprintf(line, sizeof(line), "%.2f ms  %.1f fps  %zu visible / %zu total  %zu draws  zoom %.4g", kStats.frame_time_ms, kStats.fps, frame.visible_elements, GetSceneGraph().GetElementCount(), counters.draw_calls, frame.viewport.GetZoom());

    bl_ctx.save();
    bl_ctx.setFillStyle(BLRgba32(0xB0000000u));
    bl_ctx.fillRect(BLRect(4.0, 4.0, 8.0 + 0.6 * kDebugFontSize * static_cast<double>(std::char_traits<char>::length(line)), kDebugFontSize + 8.0));
    bl_ctx.setFillStyle(BLRgba32(0xFFFFFFFFu));
    bl_ctx.fillUtf8Text(BLPoint(8.0, 6.0 + kDebugFontSize), *font, line);
    bl_ctx.restore();
}

BLFont* Blend2DRenderer::GetCachedFont(float size)
{
    auto it = m_font_cache_.find(size);
    if (it != m_font_cache_.end()) {
        return &it->second;
    }

    if (!m_font_lookup_done_) {
        m_font_lookup_done_ = true;

        std::vector<std::string> candidates;
        if (!GetSettings().m_font_path.empty()) {
            candidates.push_back(GetSettings().m_font_path);
        }
        const std::vector<std::string> kFallbackFonts = {
            "DejaVuSans.ttf",
            "LiberationSans-Regular.ttf",
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
            "/System/Library/Fonts/Supplemental/Arial.ttf",
            "C:/Windows/Fonts/arial.ttf"};
        candidates.insert(candidates.end(), kFallbackFonts.begin(), kFallbackFonts.end());

        for (const std::string& font_path : candidates) {
            if (m_font_face_.createFromFile(font_path.c_str()) == BL_SUCCESS) {
                std::cout << "Blend2DRenderer: Loaded font " << font_path << std::endl;
                break;
            }
        }
        if (!m_font_face_.isValid()) {
            std::cerr << "Blend2DRenderer Warning: No fonts could be loaded, text is drawn as anchor markers" << std::endl;
        }
    }

    if (!m_font_face_.isValid()) {
        return nullptr;
    }

    BLFont font;
    if (font.createFromFace(m_font_face_, size) != BL_SUCCESS) {
        return nullptr;
    }
    auto [inserted_it, success] = m_font_cache_.emplace(size, std::move(font));
    return &inserted_it->second;
}

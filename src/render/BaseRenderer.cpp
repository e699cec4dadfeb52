#include "render/BaseRenderer.hpp"

#include <algorithm>
#include <iostream>

#include "utils/ColorUtils.hpp"

BaseRenderer::BaseRenderer(const RenderSettings& settings)
    : m_settings_(settings),
      m_scene_graph_(std::make_shared<SceneGraph>(static_cast<size_t>(settings.m_quadtree_capacity), settings.m_quadtree_max_depth, settings.m_bounds_padding)),
      m_fps_window_start_(std::chrono::high_resolution_clock::now())
{
}

BaseRenderer::~BaseRenderer() = default;

bool BaseRenderer::Initialize(int width, int height)
{
    if (m_ready_) {
        return true;
    }
    if (width <= 0 || height <= 0) {
        std::cerr << "BaseRenderer::Initialize Error: Invalid surface size " << width << "x" << height << std::endl;
        return false;
    }
    m_viewport_.SetSize(width, height);
    m_ready_ = InitializeBackend(width, height);
    if (!m_ready_) {
        std::cerr << "BaseRenderer::Initialize Error: " << BackendName(GetBackend()) << " backend failed to initialize" << std::endl;
        return false;
    }
    m_warned_not_ready_ = false;
    ResetStatistics();
    std::cout << "BaseRenderer: " << BackendName(GetBackend()) << " backend ready (" << width << "x" << height << ")" << std::endl;
    return true;
}

void BaseRenderer::Dispose()
{
    if (!m_ready_) {
        return;
    }
    DisposeBackend();
    m_ready_ = false;
}

void BaseRenderer::SetLibrary(std::shared_ptr<const Library> library)
{
    m_library_ = std::move(library);
}

void BaseRenderer::UpdateSceneGraph()
{
    if (!m_library_) {
        std::cerr << "BaseRenderer::UpdateSceneGraph Warning: No library set" << std::endl;
        return;
    }
    m_scene_graph_->BuildFromLibrary(*m_library_);
    InitializeLayerStyles();
    OnSceneChanged();
}

void BaseRenderer::AttachScene(std::shared_ptr<const Library> library, std::shared_ptr<SceneGraph> scene_graph)
{
    if (!scene_graph) {
        std::cerr << "BaseRenderer::AttachScene Error: Null scene graph" << std::endl;
        return;
    }
    m_library_ = std::move(library);
    m_scene_graph_ = std::move(scene_graph);
    InitializeLayerStyles();
    OnSceneChanged();
}

void BaseRenderer::ClearScene()
{
    m_library_.reset();
    m_scene_graph_->Clear();
    OnSceneChanged();
}

Transform BaseRenderer::ComputeViewTransform(const Viewport& viewport)
{
    return Transform::Translation(viewport.GetScreenCenter()) * Transform::Scale(viewport.GetZoom(), -viewport.GetZoom()) * Transform::Translation(-viewport.GetCenter());
}

void BaseRenderer::Render(const Viewport& viewport)
{
    if (!m_ready_) {
        if (!m_warned_not_ready_) {
            std::cerr << "BaseRenderer::Render Warning: Renderer not initialized" << std::endl;
            m_warned_not_ready_ = true;
        }
        return;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    if (viewport.GetWidth() != m_viewport_.GetWidth() || viewport.GetHeight() != m_viewport_.GetHeight()) {
        OnViewportResized(viewport.GetWidth(), viewport.GetHeight());
    }
    m_viewport_ = viewport;

    FrameCounters counters;
    size_t elements_rendered = 0;
    try {
        FrameContext frame;
        frame.viewport = viewport;
        frame.view_transform = ComputeViewTransform(viewport);
        std::vector<const SpatialElement*> const kVisible = viewport.IsValid() ? m_scene_graph_->QueryViewport(viewport) : std::vector<const SpatialElement*> {};
        frame.layers = GroupByLayer(kVisible);
        frame.visible_elements = kVisible.size();
        elements_rendered = kVisible.size();

        DrawFrame(frame, counters);
    } catch (const std::exception& e) {
        std::cerr << "BaseRenderer::Render Error: " << e.what() << std::endl;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    UpdateStatistics(std::chrono::duration<double, std::milli>(end_time - start_time).count(), elements_rendered, counters);
}

void BaseRenderer::OnViewportResized(int width, int height)
{
    if (width <= 0 || height <= 0) {
        return;
    }
    m_viewport_.SetSize(width, height);
    if (m_ready_) {
        OnSurfaceResized(width, height);
    }
}

std::vector<LayerDrawList> BaseRenderer::GroupByLayer(const std::vector<const SpatialElement*>& visible) const
{
    std::map<LayerKey, LayerDrawList> grouped;
    for (const SpatialElement* element : visible) {
        auto [it, inserted] = grouped.try_emplace(element->Layer());
        if (inserted) {
            it->second.key = element->Layer();
            it->second.style = GetLayerStyle(element->Layer());
        }
        it->second.elements.push_back(element);
    }

    std::vector<LayerDrawList> layers;
    layers.reserve(grouped.size());
    for (auto& pair : grouped) {
        layers.push_back(std::move(pair.second));
    }
    return layers;
}

void BaseRenderer::SetLayerVisible(const LayerKey& key, bool visible)
{
    m_scene_graph_->SetLayerVisible(key, visible);
}

bool BaseRenderer::IsLayerVisible(const LayerKey& key) const
{
    return m_scene_graph_->IsLayerVisible(key);
}

void BaseRenderer::SetLayerStyle(const LayerKey& key, const LayerStyle& style)
{
    m_layer_styles_[key] = style;
}

LayerStyle BaseRenderer::GetLayerStyle(const LayerKey& key) const
{
    auto it = m_layer_styles_.find(key);
    if (it != m_layer_styles_.end()) {
        return it->second;
    }
    return MakeDefaultStyle(key);
}

std::vector<LayerKey> BaseRenderer::GetLayerKeys() const
{
    return m_scene_graph_->GetLayerKeys();
}

LayerStyle BaseRenderer::MakeDefaultStyle(const LayerKey& key) const
{
    std::vector<LayerKey> const kKeys = m_scene_graph_->GetLayerKeys();
    auto position = std::lower_bound(kKeys.begin(), kKeys.end(), key);
    int const kOrdinal = static_cast<int>(position - kKeys.begin());
    int const kTotal = std::max(1, static_cast<int>(kKeys.size()));

    LayerStyle style;
    style.color = color_utils::GenerateLayerColor(kOrdinal, kTotal, color_utils::kLayerPaletteBaseColor, m_settings_.m_palette_hue_step);
    style.opacity = m_settings_.m_default_opacity;
    style.line_width = m_settings_.m_line_width;
    return style;
}

void BaseRenderer::InitializeLayerStyles()
{
    for (const LayerKey& key : m_scene_graph_->GetLayerKeys()) {
        if (m_layer_styles_.find(key) == m_layer_styles_.end()) {
            m_layer_styles_[key] = MakeDefaultStyle(key);
        }
    }
}

std::vector<const SpatialElement*> BaseRenderer::Pick(const Vec2& world_point) const
{
    return m_scene_graph_->QueryPoint(world_point);
}

std::vector<const SpatialElement*> BaseRenderer::GetElementsInRegion(const BBox& world_region) const
{
    return m_scene_graph_->QueryRegion(world_region);
}

std::vector<const SpatialElement*> BaseRenderer::GetElementsInScreenRegion(const Vec2& screen_corner_a, const Vec2& screen_corner_b) const
{
    return m_scene_graph_->QueryRegion(m_viewport_.ScreenRectToWorld(screen_corner_a, screen_corner_b));
}

Vec2 BaseRenderer::ScreenToWorld(const Vec2& screen_point) const
{
    return m_viewport_.ScreenToWorld(screen_point);
}

Vec2 BaseRenderer::WorldToScreen(const Vec2& world_point) const
{
    return m_viewport_.WorldToScreen(world_point);
}

BBox BaseRenderer::GetVisibleWorldBounds(const Viewport& viewport) const
{
    return viewport.GetWorldBounds();
}

void BaseRenderer::ResetStatistics()
{
    m_statistics_ = RenderStatistics();
    m_frames_since_fps_update_ = 0;
    m_fps_window_start_ = std::chrono::high_resolution_clock::now();
}

void BaseRenderer::UpdateStatistics(double frame_time_ms, size_t elements_rendered, const FrameCounters& counters)
{
    m_statistics_.frame_time_ms = frame_time_ms;
    m_statistics_.elements_rendered = elements_rendered;
    m_statistics_.total_elements = m_scene_graph_->GetElementCount();
    m_statistics_.elements_culled = m_statistics_.total_elements >= elements_rendered ? m_statistics_.total_elements - elements_rendered : 0;
    m_statistics_.draw_calls = counters.draw_calls;
    m_statistics_.triangles = counters.triangles;
    m_statistics_.frame_count++;

    m_frames_since_fps_update_++;
    auto now = std::chrono::high_resolution_clock::now();
    double const kElapsedMs = std::chrono::duration<double, std::milli>(now - m_fps_window_start_).count();
    if (kElapsedMs >= 1000.0) {
        m_statistics_.fps = static_cast<double>(m_frames_since_fps_update_) * 1000.0 / kElapsedMs;
        m_frames_since_fps_update_ = 0;
        m_fps_window_start_ = now;
    }
}

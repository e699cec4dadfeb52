#pragma once

#include <memory>
#include <vector>

#include "layout/Element.hpp"
#include "layout/Library.hpp"
#include "render/LayerStyle.hpp"
#include "render/RenderSettings.hpp"
#include "render/RenderStatistics.hpp"
#include "scene/SpatialElement.hpp"
#include "utils/BBox.hpp"
#include "utils/Vec2.hpp"
#include "view/Viewport.hpp"

class SceneGraph;

// Backend-independent rendering contract for a layout library.
class LayoutRenderer
{
public:
    virtual ~LayoutRenderer() = default;

    // Creates backend resources for a width x height surface (device pixels).
    virtual bool Initialize(int width, int height) = 0;
    [[nodiscard]] virtual bool IsReady() const = 0;
    // Releases every backend resource. Safe to call more than once.
    virtual void Dispose() = 0;
    [[nodiscard]] virtual RendererBackend GetBackend() const = 0;

    virtual void SetLibrary(std::shared_ptr<const Library> library) = 0;
    // Rebuilds the scene graph from the current library.
    virtual void UpdateSceneGraph() = 0;
    // Shares an already built scene (e.g. from a previous backend) without rebuilding it.
    virtual void AttachScene(std::shared_ptr<const Library> library, std::shared_ptr<SceneGraph> scene_graph) = 0;
    virtual void ClearScene() = 0;

    virtual void Render(const Viewport& viewport) = 0;
    virtual void OnViewportResized(int width, int height) = 0;

    virtual void SetLayerVisible(const LayerKey& key, bool visible) = 0;
    [[nodiscard]] virtual bool IsLayerVisible(const LayerKey& key) const = 0;
    virtual void SetLayerStyle(const LayerKey& key, const LayerStyle& style) = 0;
    [[nodiscard]] virtual LayerStyle GetLayerStyle(const LayerKey& key) const = 0;

    [[nodiscard]] virtual std::vector<const SpatialElement*> Pick(const Vec2& world_point) const = 0;
    [[nodiscard]] virtual std::vector<const SpatialElement*> GetElementsInRegion(const BBox& world_region) const = 0;

    [[nodiscard]] virtual RenderStatistics GetStatistics() const = 0;

    [[nodiscard]] virtual Vec2 ScreenToWorld(const Vec2& screen_point) const = 0;
    [[nodiscard]] virtual Vec2 WorldToScreen(const Vec2& world_point) const = 0;

    [[nodiscard]] virtual const SceneGraph& GetSceneGraph() const = 0;
    [[nodiscard]] virtual std::shared_ptr<SceneGraph> GetSharedSceneGraph() const = 0;
    [[nodiscard]] virtual std::shared_ptr<const Library> GetLibrary() const = 0;
};

#pragma once

#include <memory>

#include "render/BaseRenderer.hpp"
#include "render/RenderSettings.hpp"
#include "render/gl/GpuDevice.hpp"

// Creates and initializes a renderer for the requested backend. kAuto prefers the GPU backend
// when a usable device exists; any GPU initialization failure falls back to Blend2D.
class RendererFactory
{
public:
    // gpu_device overrides the OpenGL device for the GPU backend. Returns nullptr only when
    // the Blend2D fallback fails as well.
    static std::unique_ptr<BaseRenderer> Create(RendererBackend backend, const RenderSettings& settings, int width, int height, std::unique_ptr<GpuDevice> gpu_device = nullptr);

    [[nodiscard]] static bool IsBackendAvailable(RendererBackend backend);
    // Concrete backend kAuto would pick right now.
    [[nodiscard]] static RendererBackend DetectBestBackend();

private:
    static std::unique_ptr<BaseRenderer> CreateBlend2D(const RenderSettings& settings, int width, int height);
};

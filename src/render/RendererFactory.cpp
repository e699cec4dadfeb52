#include "render/RendererFactory.hpp"

#include <iostream>

#include "render/Blend2DRenderer.hpp"
#include "render/gl/GLRenderer.hpp"
#include "render/gl/OpenGLDevice.hpp"

bool RendererFactory::IsBackendAvailable(RendererBackend backend)
{
    switch (backend) {
        case RendererBackend::kOpenGL:
            return OpenGLDevice::HasUsableContext();
        case RendererBackend::kBlend2D:
        case RendererBackend::kAuto:
            return true;
    }
    return false;
}

RendererBackend RendererFactory::DetectBestBackend()
{
    return IsBackendAvailable(RendererBackend::kOpenGL) ? RendererBackend::kOpenGL : RendererBackend::kBlend2D;
}

std::unique_ptr<BaseRenderer> RendererFactory::CreateBlend2D(const RenderSettings& settings, int width, int height)
{
    auto renderer = std::make_unique<Blend2DRenderer>(settings);
    if (!renderer->Initialize(width, height)) {
        std::cerr << "RendererFactory::Create Error: Blend2D renderer failed to initialize" << std::endl;
        return nullptr;
    }
    return renderer;
}

std::unique_ptr<BaseRenderer> RendererFactory::Create(RendererBackend backend, const RenderSettings& settings, int width, int height, std::unique_ptr<GpuDevice> gpu_device)
{
    RendererBackend selected = backend;
    if (selected == RendererBackend::kAuto) {
        bool const kDeviceReady = gpu_device ? gpu_device->IsAvailable() : IsBackendAvailable(RendererBackend::kOpenGL);
        selected = kDeviceReady ? RendererBackend::kOpenGL : RendererBackend::kBlend2D;
    }

    if (selected == RendererBackend::kOpenGL) {
        auto renderer = std::make_unique<GLRenderer>(settings, std::move(gpu_device));
        if (renderer->Initialize(width, height)) {
            std::cout << "RendererFactory: Created " << BackendName(RendererBackend::kOpenGL) << " renderer" << std::endl;
            return renderer;
        }
        std::cerr << "RendererFactory::Create Warning: " << BackendName(RendererBackend::kOpenGL) << " renderer unavailable, falling back to " << BackendName(RendererBackend::kBlend2D) << std::endl;
    }

    std::unique_ptr<BaseRenderer> renderer = CreateBlend2D(settings, width, height);
    if (renderer) {
        std::cout << "RendererFactory: Created " << BackendName(RendererBackend::kBlend2D) << " renderer" << std::endl;
    }
    return renderer;
}

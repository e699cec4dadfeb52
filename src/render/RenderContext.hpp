#pragma once

#include <blend2d.h>

// Off-screen Blend2D raster target: a PRGB32 image with a context bound to it.
class RenderContext
{
public:
    RenderContext();
    ~RenderContext();

    RenderContext(const RenderContext&) = delete;
    RenderContext& operator=(const RenderContext&) = delete;
    RenderContext(RenderContext&&) = delete;
    RenderContext& operator=(RenderContext&&) = delete;

    // thread_count <= 0 picks a count from the surface size.
    bool Initialize(int width, int height, int thread_count = 0);
    void Shutdown();
    [[nodiscard]] bool IsInitialized() const { return !m_target_image_.empty(); }

    // Resets the context state and fills the image with the clear color.
    void BeginFrame();
    // Waits for outstanding (possibly asynchronous) rendering to finish.
    void EndFrame();

    BLContext& GetBlend2DContext() { return m_bl_context_; }
    [[nodiscard]] const BLImage& GetTargetImage() const { return m_target_image_; }

    [[nodiscard]] int GetImageWidth() const { return m_image_width_; }
    [[nodiscard]] int GetImageHeight() const { return m_image_height_; }
    [[nodiscard]] bool IsMultithreaded() const { return m_thread_count_ > 1; }

    bool ResizeImage(int new_width, int new_height);

    void SetClearColor(const BLRgba32& color) { m_clear_color_ = color; }
    [[nodiscard]] BLRgba32 GetClearColor() const { return m_clear_color_; }

    // Tighter curve flattening for still frames.
    void OptimizeForStatic();

private:
    BLResult BeginContext();

    BLImage m_target_image_;
    BLContext m_bl_context_;

    int m_image_width_ = 0;
    int m_image_height_ = 0;
    int m_thread_count_ = 1;
    BLRgba32 m_clear_color_ = BLRgba32(0xFFFFFFFFu);
};

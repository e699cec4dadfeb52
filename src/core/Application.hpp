#pragma once

#include <memory>
#include <string>

#include <SDL3/SDL.h>

#include "render/BaseRenderer.hpp"
#include "render/RenderSettings.hpp"
#include "view/Camera.hpp"

class Config;
struct Library;

// Interactive viewer: one SDL window, one active renderer, one shared scene.
// Frames are drawn only after input, resize or layer changes.
class Application
{
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Empty config_path: the per-user preference directory.
    bool Initialize(const std::string& config_path = "");
    int Run();
    void Shutdown();

    [[nodiscard]] bool IsRunning() const { return m_is_running_; }
    void Quit() { m_is_running_ = false; }

private:
    void LoadConfig(const std::string& config_path);
    void SaveConfig();
    bool CreateMainWindow();
    void SetLayoutLibrary(std::shared_ptr<const Library> library);

    // Tears down the previous renderer and presentation surface, then builds new ones.
    bool ActivateBackend(RendererBackend backend);
    bool CreateGLContext();
    void DestroyGLContext();
    bool CreateSDLRenderer();
    void DestroySDLRenderer();

    void ProcessEvent(const SDL_Event& event);
    void HandleKeyDown(SDL_Keycode key);
    void ToggleLayerByOrdinal(size_t ordinal);
    void SwitchBackend();
    void FitView();

    void RenderFrame();
    void PresentBlend2DImage();

    std::unique_ptr<Config> m_config_;
    std::string m_config_path_;
    RenderSettings m_render_settings_;
    std::string m_app_name_;
    int m_window_width_;
    int m_window_height_;

    SDL_Window* m_window_ = nullptr;
    SDL_GLContext m_gl_context_ = nullptr;
    SDL_Renderer* m_sdl_renderer_ = nullptr;
    SDL_Texture* m_present_texture_ = nullptr;

    std::unique_ptr<BaseRenderer> m_renderer_;
    std::shared_ptr<const Library> m_library_;
    Camera m_camera_;

    bool m_is_running_ = false;
    bool m_needs_redraw_ = true;
    bool m_is_panning_ = false;
    bool m_sdl_initialized_ = false;
};

#include "core/Application.hpp"

#include <filesystem>
#include <iostream>
#include <utility>
#include <vector>

#include "core/Config.hpp"
#include "layout/DemoLibrary.hpp"
#include "layout/Library.hpp"
#include "render/Blend2DRenderer.hpp"
#include "render/RendererFactory.hpp"

namespace
{
constexpr double kWheelZoomFactor = 1.2;

std::string GetAppConfigFilePath()
{
    const char* const kConfigFilename = "GdsLayerViewer_settings.ini";
    char* pref_path_c = SDL_GetPrefPath("GdsLayerViewer", "GdsLayerViewer");
    if (pref_path_c == nullptr) {
        std::cerr << "Warning: SDL_GetPrefPath failed. Using current directory for config." << std::endl;
        return std::filesystem::current_path().append(kConfigFilename).string();
    }
    std::filesystem::path path_obj(pref_path_c);
    SDL_free(pref_path_c);
    path_obj /= kConfigFilename;
    return path_obj.string();
}
}  // namespace

Application::Application() : m_app_name_("GDS Layer Viewer"), m_window_width_(1280), m_window_height_(720) {}

Application::~Application()
{
    Shutdown();
}

void Application::LoadConfig(const std::string& config_path)
{
    m_config_ = std::make_unique<Config>();
    m_config_path_ = config_path.empty() ? GetAppConfigFilePath() : config_path;
    if (m_config_->LoadFromFile(m_config_path_)) {
        std::cout << "Successfully loaded config from " << m_config_path_ << std::endl;
    } else {
        std::cout << "Config file " << m_config_path_ << " not found or failed to load. Using defaults." << std::endl;
    }

    m_app_name_ = m_config_->GetString("application.name", m_app_name_);
    m_window_width_ = m_config_->GetInt("window.width", m_window_width_);
    m_window_height_ = m_config_->GetInt("window.height", m_window_height_);
    m_render_settings_.LoadSettingsFromConfig(*m_config_);
}

void Application::SaveConfig()
{
    if (!m_config_ || m_config_path_.empty()) {
        return;
    }
    if (m_window_ != nullptr) {
        SDL_GetWindowSize(m_window_, &m_window_width_, &m_window_height_);
    }
    m_config_->SetInt("window.width", m_window_width_);
    m_config_->SetInt("window.height", m_window_height_);
    m_render_settings_.SaveSettingsToConfig(*m_config_);
    if (!m_config_->SaveToFile(m_config_path_)) {
        std::cerr << "Application Warning: Failed to save config to " << m_config_path_ << std::endl;
    }
}

bool Application::CreateMainWindow()
{
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        std::cerr << "Error: SDL_Init(): " << SDL_GetError() << std::endl;
        return false;
    }
    m_sdl_initialized_ = true;

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_WindowFlags const kWindowFlags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_OPENGL | SDL_WINDOW_HIDDEN;
    m_window_ = SDL_CreateWindow(m_app_name_.c_str(), m_window_width_, m_window_height_, kWindowFlags);
    if (m_window_ == nullptr) {
        std::cerr << "Error: SDL_CreateWindow(): " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_SetWindowPosition(m_window_, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
    SDL_ShowWindow(m_window_);
    SDL_GetWindowSizeInPixels(m_window_, &m_window_width_, &m_window_height_);
    return true;
}

bool Application::Initialize(const std::string& config_path)
{
    LoadConfig(config_path);
    if (!CreateMainWindow()) {
        return false;
    }
    if (!ActivateBackend(m_render_settings_.m_backend)) {
        std::cerr << "Application::Initialize Error: No renderer could be created" << std::endl;
        return false;
    }

    SetLayoutLibrary(std::make_shared<const Library>(demo_library::CreateDemoLibrary()));

    m_is_running_ = true;
    std::cout << "Application: Controls: drag to pan, wheel to zoom, 1-9 toggle layers, B switch backend, F fit, D debug overlay, Esc quit" << std::endl;
    return true;
}

void Application::SetLayoutLibrary(std::shared_ptr<const Library> library)
{
    m_library_ = std::move(library);
    std::cout << "Application: Library '" << m_library_->name << "' with " << m_library_->structures.size() << " structures, " << m_library_->GetElementCount()
              << " elements" << std::endl;
    m_renderer_->SetLibrary(m_library_);
    m_renderer_->UpdateSceneGraph();

    const SceneGraph& scene = m_renderer_->GetSceneGraph();
    for (const ReferenceCycle& cycle : scene.GetCycles()) {
        std::string joined;
        for (const std::string& name : cycle) {
            joined += joined.empty() ? name : " -> " + name;
        }
        std::cerr << "Application Warning: Reference cycle " << joined << std::endl;
    }
    FitView();
}

bool Application::CreateGLContext()
{
    m_gl_context_ = SDL_GL_CreateContext(m_window_);
    if (m_gl_context_ == nullptr) {
        std::cerr << "Application Warning: SDL_GL_CreateContext(): " << SDL_GetError() << std::endl;
        return false;
    }
    if (!SDL_GL_MakeCurrent(m_window_, m_gl_context_)) {
        std::cerr << "Application Warning: SDL_GL_MakeCurrent(): " << SDL_GetError() << std::endl;
        DestroyGLContext();
        return false;
    }
    SDL_GL_SetSwapInterval(1);
    return true;
}

void Application::DestroyGLContext()
{
    if (m_gl_context_ != nullptr) {
        SDL_GL_MakeCurrent(m_window_, nullptr);
        SDL_GL_DestroyContext(m_gl_context_);
        m_gl_context_ = nullptr;
    }
}

bool Application::CreateSDLRenderer()
{
    m_sdl_renderer_ = SDL_CreateRenderer(m_window_, nullptr);
    if (m_sdl_renderer_ == nullptr) {
        std::cerr << "Error: SDL_CreateRenderer(): " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_SetRenderVSync(m_sdl_renderer_, 1);
    return true;
}

void Application::DestroySDLRenderer()
{
    if (m_present_texture_ != nullptr) {
        SDL_DestroyTexture(m_present_texture_);
        m_present_texture_ = nullptr;
    }
    if (m_sdl_renderer_ != nullptr) {
        SDL_DestroyRenderer(m_sdl_renderer_);
        m_sdl_renderer_ = nullptr;
    }
}

bool Application::ActivateBackend(RendererBackend backend)
{
    std::shared_ptr<SceneGraph> scene;
    std::vector<std::pair<LayerKey, LayerStyle>> styles;
    if (m_renderer_) {
        scene = m_renderer_->GetSharedSceneGraph();
        for (const LayerKey& key : m_renderer_->GetLayerKeys()) {
            styles.emplace_back(key, m_renderer_->GetLayerStyle(key));
        }
        // GPU resources must be released while their context is still current.
        m_renderer_->Dispose();
        m_renderer_.reset();
    }
    DestroySDLRenderer();
    DestroyGLContext();

    SDL_GetWindowSizeInPixels(m_window_, &m_window_width_, &m_window_height_);

    RendererBackend requested = backend;
    if (requested != RendererBackend::kBlend2D && !CreateGLContext()) {
        requested = RendererBackend::kBlend2D;
    }
    m_renderer_ = RendererFactory::Create(requested, m_render_settings_, m_window_width_, m_window_height_);
    if (!m_renderer_) {
        return false;
    }

    if (m_renderer_->GetBackend() == RendererBackend::kBlend2D) {
        DestroyGLContext();
        if (!CreateSDLRenderer()) {
            return false;
        }
    }

    if (scene) {
        m_renderer_->AttachScene(m_library_, scene);
        for (const auto& [key, style] : styles) {
            m_renderer_->SetLayerStyle(key, style);
        }
    }
    m_renderer_->SetDebugOverlay(m_render_settings_.m_debug_overlay);
    SDL_SetWindowTitle(m_window_, (m_app_name_ + " [" + BackendName(m_renderer_->GetBackend()) + "]").c_str());
    m_needs_redraw_ = true;
    return true;
}

void Application::SwitchBackend()
{
    RendererBackend const kNext = m_renderer_->GetBackend() == RendererBackend::kOpenGL ? RendererBackend::kBlend2D : RendererBackend::kOpenGL;
    std::cout << "Application: Switching to " << BackendName(kNext) << " backend" << std::endl;
    if (!ActivateBackend(kNext)) {
        std::cerr << "Application::SwitchBackend Error: Backend switch failed" << std::endl;
        Quit();
        return;
    }
    m_render_settings_.m_backend = m_renderer_->GetBackend();
}

void Application::FitView()
{
    m_camera_.FocusOnBounds(m_renderer_->GetSceneGraph().GetContentBounds(), m_window_width_, m_window_height_);
    m_needs_redraw_ = true;
}

void Application::ToggleLayerByOrdinal(size_t ordinal)
{
    std::vector<LayerKey> const kKeys = m_renderer_->GetLayerKeys();
    if (ordinal >= kKeys.size()) {
        return;
    }
    const LayerKey& key = kKeys[ordinal];
    bool const kVisible = !m_renderer_->IsLayerVisible(key);
    m_renderer_->SetLayerVisible(key, kVisible);
    std::cout << "Application: Layer " << key.ToString() << (kVisible ? " shown" : " hidden") << std::endl;
    m_needs_redraw_ = true;
}

void Application::HandleKeyDown(SDL_Keycode key)
{
    if (key >= SDLK_1 && key <= SDLK_9) {
        ToggleLayerByOrdinal(static_cast<size_t>(key - SDLK_1));
        return;
    }
    switch (key) {
        case SDLK_ESCAPE:
            Quit();
            break;
        case SDLK_B:
            SwitchBackend();
            break;
        case SDLK_F:
            FitView();
            break;
        case SDLK_D:
            m_render_settings_.m_debug_overlay = !m_render_settings_.m_debug_overlay;
            m_renderer_->SetDebugOverlay(m_render_settings_.m_debug_overlay);
            m_needs_redraw_ = true;
            break;
        default:
            break;
    }
}

void Application::ProcessEvent(const SDL_Event& event)
{
    switch (event.type) {
        case SDL_EVENT_QUIT:
        case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
            Quit();
            break;
        case SDL_EVENT_KEY_DOWN:
            HandleKeyDown(event.key.key);
            break;
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
            if (event.button.button == SDL_BUTTON_LEFT) {
                m_is_panning_ = true;
            }
            break;
        case SDL_EVENT_MOUSE_BUTTON_UP:
            if (event.button.button == SDL_BUTTON_LEFT) {
                m_is_panning_ = false;
            }
            break;
        case SDL_EVENT_MOUSE_MOTION:
            if (m_is_panning_) {
                float const kDensity = SDL_GetWindowPixelDensity(m_window_);
                m_camera_.PanByScreenDelta(Vec2(event.motion.xrel * kDensity, event.motion.yrel * kDensity), m_window_width_, m_window_height_);
                m_needs_redraw_ = true;
            }
            break;
        case SDL_EVENT_MOUSE_WHEEL: {
            if (event.wheel.y == 0.0F) {
                break;
            }
            float mouse_x = 0.0F;
            float mouse_y = 0.0F;
            SDL_GetMouseState(&mouse_x, &mouse_y);
            float const kDensity = SDL_GetWindowPixelDensity(m_window_);
            double const kFactor = event.wheel.y > 0.0F ? kWheelZoomFactor : 1.0 / kWheelZoomFactor;
            m_camera_.ZoomAt(Vec2(mouse_x * kDensity, mouse_y * kDensity), kFactor, m_window_width_, m_window_height_);
            m_needs_redraw_ = true;
            break;
        }
        case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
            SDL_GetWindowSizeInPixels(m_window_, &m_window_width_, &m_window_height_);
            m_renderer_->OnViewportResized(m_window_width_, m_window_height_);
            m_needs_redraw_ = true;
            break;
        case SDL_EVENT_WINDOW_EXPOSED:
            m_needs_redraw_ = true;
            break;
        default:
            break;
    }
}

int Application::Run()
{
    while (m_is_running_) {
        SDL_Event event;
        if (!SDL_WaitEvent(&event)) {
            std::cerr << "Application::Run Error: SDL_WaitEvent(): " << SDL_GetError() << std::endl;
            return 1;
        }
        ProcessEvent(event);
        while (m_is_running_ && SDL_PollEvent(&event)) {
            ProcessEvent(event);
        }

        if (m_is_running_ && (m_needs_redraw_ || m_camera_.WasViewChangedThisFrame())) {
            RenderFrame();
        }
    }
    return 0;
}

void Application::RenderFrame()
{
    if (m_window_width_ <= 0 || m_window_height_ <= 0) {
        return;
    }
    m_renderer_->Render(m_camera_.ToViewport(m_window_width_, m_window_height_));
    m_camera_.ClearViewChangedFlag();
    m_needs_redraw_ = false;

    if (m_renderer_->GetBackend() == RendererBackend::kOpenGL) {
        SDL_GL_SwapWindow(m_window_);
    } else {
        PresentBlend2DImage();
    }
}

void Application::PresentBlend2DImage()
{
    auto* blend2d_renderer = dynamic_cast<Blend2DRenderer*>(m_renderer_.get());
    if (blend2d_renderer == nullptr || m_sdl_renderer_ == nullptr) {
        return;
    }
    const BLImage& bl_image = blend2d_renderer->GetImage();
    if (bl_image.empty()) {
        return;
    }

    BLImageData bl_image_data;
    bl_image.getData(&bl_image_data);
    if (bl_image_data.pixelData == nullptr) {
        return;
    }

    int const kImageWidth = bl_image.width();
    int const kImageHeight = bl_image.height();
    float texture_width = 0.0F;
    float texture_height = 0.0F;
    if (m_present_texture_ == nullptr || !SDL_GetTextureSize(m_present_texture_, &texture_width, &texture_height) || static_cast<int>(texture_width) != kImageWidth || static_cast<int>(texture_height) != kImageHeight) {
        if (m_present_texture_ != nullptr) {
            SDL_DestroyTexture(m_present_texture_);
        }
        // ARGB8888 matches Blend2D's BL_FORMAT_PRGB32 layout.
        m_present_texture_ = SDL_CreateTexture(m_sdl_renderer_, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING, kImageWidth, kImageHeight);
        if (m_present_texture_ == nullptr) {
            std::cerr << "Application Error: Failed to create texture: " << SDL_GetError() << std::endl;
            return;
        }
    }

    if (!SDL_UpdateTexture(m_present_texture_, nullptr, bl_image_data.pixelData, static_cast<int>(bl_image_data.stride))) {
        std::cerr << "Application Error: Failed to update texture: " << SDL_GetError() << std::endl;
        return;
    }
    SDL_RenderClear(m_sdl_renderer_);
    SDL_RenderTexture(m_sdl_renderer_, m_present_texture_, nullptr, nullptr);
    SDL_RenderPresent(m_sdl_renderer_);
}

void Application::Shutdown()
{
    if (!m_sdl_initialized_) {
        return;
    }
    SaveConfig();

    if (m_renderer_) {
        m_renderer_->Dispose();
        m_renderer_.reset();
    }
    DestroySDLRenderer();
    DestroyGLContext();
    if (m_window_ != nullptr) {
        SDL_DestroyWindow(m_window_);
        m_window_ = nullptr;
    }
    SDL_Quit();
    m_sdl_initialized_ = false;
    m_is_running_ = false;
}

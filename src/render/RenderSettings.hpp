#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <blend2d.h>

class Config;

enum class RendererBackend : uint8_t {
    kAuto,
    kBlend2D,
    kOpenGL
};

const char* BackendName(RendererBackend backend);
// Accepts "auto", "blend2d" and "opengl" (case-insensitive).
std::optional<RendererBackend> ParseBackend(const std::string& name);

class RenderSettings
{
public:
    RenderSettings();

    void LoadSettingsFromConfig(const Config& config);
    void SaveSettingsToConfig(Config& config) const;

    RendererBackend m_backend = RendererBackend::kAuto;
    bool m_batching_enabled = true;  // GPU backend: one draw per layer instead of per element
    bool m_debug_overlay = false;

    float m_default_opacity = 0.7F;
    float m_line_width = 1.0F;        // Outline width in pixels
    float m_palette_hue_step = 30.0F;  // Degrees between consecutive default layer colors
    BLRgba32 m_background_color = BLRgba32(0xFFFFFFFFu);
    std::string m_font_path;  // Empty: try the built-in fallback list

    int m_quadtree_capacity = 8;
    int m_quadtree_max_depth = 10;
    float m_bounds_padding = 1.1F;  // Scene bounds scale factor for the quadtree root region
};

#include "render/RenderSettings.hpp"

#include <iostream>

#include "core/Config.hpp"
#include "utils/StringUtils.hpp"

const char* BackendName(RendererBackend backend)
{
    switch (backend) {
        case RendererBackend::kAuto:
            return "auto";
        case RendererBackend::kBlend2D:
            return "blend2d";
        case RendererBackend::kOpenGL:
            return "opengl";
    }
    return "auto";
}

std::optional<RendererBackend> ParseBackend(const std::string& name)
{
    std::string const kLower = string_utils::ToLower(string_utils::Trim(name));
    if (kLower == "auto") {
        return RendererBackend::kAuto;
    }
    if (kLower == "blend2d") {
        return RendererBackend::kBlend2D;
    }
    if (kLower == "opengl" || kLower == "gl") {
        return RendererBackend::kOpenGL;
    }
    return std::nullopt;
}

RenderSettings::RenderSettings() = default;

void RenderSettings::LoadSettingsFromConfig(const Config& config)
{
    std::string const kBackendName = config.GetString("renderer.backend", BackendName(m_backend));
    std::optional<RendererBackend> const kBackend = ParseBackend(kBackendName);
    if (kBackend) {
        m_backend = *kBackend;
    } else {
        std::cerr << "RenderSettings Warning: Unknown renderer.backend '" << kBackendName << "', keeping " << BackendName(m_backend) << std::endl;
    }

    m_batching_enabled = config.GetBool("renderer.batching", m_batching_enabled);
    m_debug_overlay = config.GetBool("renderer.debug_overlay", m_debug_overlay);
    m_default_opacity = config.GetFloat("renderer.default_opacity", m_default_opacity);
    m_line_width = config.GetFloat("renderer.line_width", m_line_width);
    m_palette_hue_step = config.GetFloat("renderer.palette_hue_step", m_palette_hue_step);
    m_background_color = BLRgba32(static_cast<uint32_t>(config.GetInt("renderer.background_color", static_cast<int>(m_background_color.value))));
    m_font_path = config.GetString("renderer.font_path", m_font_path);

    m_quadtree_capacity = config.GetInt("scene.quadtree_capacity", m_quadtree_capacity);
    m_quadtree_max_depth = config.GetInt("scene.quadtree_max_depth", m_quadtree_max_depth);
    m_bounds_padding = config.GetFloat("scene.bounds_padding", m_bounds_padding);

    if (m_quadtree_capacity < 1) {
        m_quadtree_capacity = 1;
    }
    if (m_quadtree_max_depth < 0) {
        m_quadtree_max_depth = 0;
    }
    if (m_bounds_padding < 1.0F) {
        m_bounds_padding = 1.0F;
    }
}

void RenderSettings::SaveSettingsToConfig(Config& config) const
{
    config.SetString("renderer.backend", BackendName(m_backend));
    config.SetBool("renderer.batching", m_batching_enabled);
    config.SetBool("renderer.debug_overlay", m_debug_overlay);
    config.SetFloat("renderer.default_opacity", m_default_opacity);
    config.SetFloat("renderer.line_width", m_line_width);
    config.SetFloat("renderer.palette_hue_step", m_palette_hue_step);
    config.SetInt("renderer.background_color", static_cast<int>(m_background_color.value));
    config.SetString("renderer.font_path", m_font_path);
    config.SetInt("scene.quadtree_capacity", m_quadtree_capacity);
    config.SetInt("scene.quadtree_max_depth", m_quadtree_max_depth);
    config.SetFloat("scene.bounds_padding", m_bounds_padding);
}

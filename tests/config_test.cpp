#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "core/Config.hpp"
#include "render/RenderSettings.hpp"

namespace
{
std::string TempPath(const std::string& name)
{
    return ::testing::TempDir() + name;
}
}  // namespace

TEST(ConfigTest, DefaultsAndTypedAccess)
{
    Config config;
    EXPECT_EQ(config.GetInt("window.width"), 1280);
    EXPECT_EQ(config.GetString("missing", "fallback"), "fallback");

    config.SetInt("answer", 42);
    EXPECT_FLOAT_EQ(config.GetFloat("answer"), 42.0F);
    EXPECT_EQ(config.GetString("answer"), "42");
    EXPECT_TRUE(config.GetBool("answer"));

    config.SetString("word", "hello");
    EXPECT_EQ(config.GetInt("word", 7), 7);
    EXPECT_FALSE(config.GetBool("word", false));
}

TEST(ConfigTest, LoadInfersValueTypes)
{
    std::string const kPath = TempPath("config_infer.ini");
    {
        std::ofstream out(kPath);
        out << "# comment\n"
            << "; also a comment\n"
            << "flag = TRUE\n"
            << "count=12\n"
            << "ratio=0.25\n"
            << "name = some thing\n"
            << "not a setting\n"
            << "=orphan\n";
    }

    Config config;
    ASSERT_TRUE(config.LoadFromFile(kPath));
    EXPECT_TRUE(config.GetBool("flag"));
    EXPECT_EQ(config.GetInt("count"), 12);
    EXPECT_FLOAT_EQ(config.GetFloat("ratio"), 0.25F);
    EXPECT_EQ(config.GetString("name"), "some thing");
    EXPECT_FALSE(config.HasKey("not a setting"));
    EXPECT_FALSE(config.HasKey(""));
    std::remove(kPath.c_str());
}

TEST(ConfigTest, MissingFileKeepsExistingValues)
{
    Config config;
    config.SetInt("window.width", 333);
    EXPECT_FALSE(config.LoadFromFile(TempPath("does_not_exist_42.ini")));
    EXPECT_EQ(config.GetInt("window.width"), 333);
}

TEST(ConfigTest, SaveThenLoadPreservesValues)
{
    std::string const kPath = TempPath("config_roundtrip.ini");
    Config saved;
    saved.SetBool("a.flag", false);
    saved.SetInt("a.count", -5);
    saved.SetFloat("a.ratio", 1.5F);
    saved.SetString("a.text", "layout.gds");
    ASSERT_TRUE(saved.SaveToFile(kPath));

    Config loaded;
    ASSERT_TRUE(loaded.LoadFromFile(kPath));
    EXPECT_FALSE(loaded.GetBool("a.flag", true));
    EXPECT_EQ(loaded.GetInt("a.count"), -5);
    EXPECT_FLOAT_EQ(loaded.GetFloat("a.ratio"), 1.5F);
    EXPECT_EQ(loaded.GetString("a.text"), "layout.gds");
    EXPECT_EQ(loaded.GetKeys(), saved.GetKeys());
    std::remove(kPath.c_str());
}

TEST(RenderSettingsTest, ParseBackendNames)
{
    EXPECT_EQ(ParseBackend("auto"), RendererBackend::kAuto);
    EXPECT_EQ(ParseBackend(" Blend2D "), RendererBackend::kBlend2D);
    EXPECT_EQ(ParseBackend("OpenGL"), RendererBackend::kOpenGL);
    EXPECT_FALSE(ParseBackend("vulkan").has_value());
    EXPECT_STREQ(BackendName(RendererBackend::kOpenGL), "opengl");
}

TEST(RenderSettingsTest, SettingsSurviveConfigFile)
{
    RenderSettings settings;
    settings.m_backend = RendererBackend::kBlend2D;
    settings.m_batching_enabled = false;
    settings.m_default_opacity = 0.5F;
    settings.m_background_color = BLRgba32(0xFF202020u);
    settings.m_quadtree_capacity = 16;

    std::string const kPath = TempPath("render_settings.ini");
    Config out_config;
    settings.SaveSettingsToConfig(out_config);
    ASSERT_TRUE(out_config.SaveToFile(kPath));

    Config in_config;
    ASSERT_TRUE(in_config.LoadFromFile(kPath));
    RenderSettings loaded;
    loaded.LoadSettingsFromConfig(in_config);
    EXPECT_EQ(loaded.m_backend, RendererBackend::kBlend2D);
    EXPECT_FALSE(loaded.m_batching_enabled);
    EXPECT_FLOAT_EQ(loaded.m_default_opacity, 0.5F);
    EXPECT_EQ(loaded.m_background_color.value, 0xFF202020u);
    EXPECT_EQ(loaded.m_quadtree_capacity, 16);
    std::remove(kPath.c_str());
}

TEST(RenderSettingsTest, InvalidValuesAreClampedOrIgnored)
{
    Config config;
    config.SetString("renderer.backend", "metal");
    config.SetInt("scene.quadtree_capacity", 0);
    config.SetInt("scene.quadtree_max_depth", -4);
    config.SetFloat("scene.bounds_padding", 0.5F);

    RenderSettings settings;
    settings.m_backend = RendererBackend::kOpenGL;
    settings.LoadSettingsFromConfig(config);
    EXPECT_EQ(settings.m_backend, RendererBackend::kOpenGL);
    EXPECT_EQ(settings.m_quadtree_capacity, 1);
    EXPECT_EQ(settings.m_quadtree_max_depth, 0);
    EXPECT_FLOAT_EQ(settings.m_bounds_padding, 1.0F);
}

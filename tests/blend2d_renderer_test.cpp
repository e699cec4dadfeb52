#include <gtest/gtest.h>

#include <memory>

#include "TestLayouts.hpp"
#include "render/Blend2DRenderer.hpp"

using namespace test_layouts;

namespace
{
constexpr int kWidth = 200;
constexpr int kHeight = 100;

std::shared_ptr<const Library> MakeMixedLibrary()
{
    return std::make_shared<const Library>(MakeLibrary({
        Structure {"CELL", {MakeRect(0, 0, 10, 10), MakePath({{0, 12}, {10, 12}, {10, 20}}, 1.0, 1), MakeText("VDD", {5, 5}), MakeNode({{2, 2}, {8, 8}})}},
        Structure {"TOP", {MakeARef("CELL", {0, 0}, {100, 0}, {0, 50}, 5, 2)}},
    }));
}

uint32_t PixelAt(const BLImage& image, int x, int y)
{
    BLImageData data;
    image.getData(&data);
    const auto* row = static_cast<const uint8_t*>(data.pixelData) + (static_cast<intptr_t>(y) * data.stride);
    return reinterpret_cast<const uint32_t*>(row)[x];
}

class Blend2DRendererTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        RenderSettings settings;
        settings.m_background_color = BLRgba32(0xFFFFFFFFu);
        m_renderer_ = std::make_unique<Blend2DRenderer>(settings);
        ASSERT_TRUE(m_renderer_->Initialize(kWidth, kHeight));
        m_renderer_->SetLibrary(MakeMixedLibrary());
        m_renderer_->UpdateSceneGraph();
    }

    std::unique_ptr<Blend2DRenderer> m_renderer_;
};
}  // namespace

TEST_F(Blend2DRendererTest, RendersIntoImageOfSurfaceSize)
{
    m_renderer_->Render(Viewport(Vec2(50, 50), kWidth, kHeight, 2.0));
    EXPECT_EQ(m_renderer_->GetImage().width(), kWidth);
    EXPECT_EQ(m_renderer_->GetImage().height(), kHeight);
}

TEST_F(Blend2DRendererTest, DrawCallsScaleWithVisibleElements)
{
    // Everything in view: 10 cells of 4 elements.
    m_renderer_->Render(Viewport(Vec2(50, 40), kWidth, kHeight, 0.8));
    RenderStatistics const kAll = m_renderer_->GetStatistics();
    EXPECT_EQ(kAll.total_elements, 40U);
    EXPECT_EQ(kAll.elements_rendered, 40U);
    EXPECT_EQ(kAll.elements_culled, 0U);
    EXPECT_GE(kAll.draw_calls, kAll.elements_rendered);

    // Only the first cell.
    m_renderer_->Render(Viewport(Vec2(5, 10), kWidth, kHeight, 8.0));
    RenderStatistics const kOne = m_renderer_->GetStatistics();
    EXPECT_EQ(kOne.elements_rendered, 4U);
    EXPECT_EQ(kOne.elements_culled, 36U);
    EXPECT_LT(kOne.draw_calls, kAll.draw_calls);
    EXPECT_EQ(kOne.frame_count, 2U);
}

TEST_F(Blend2DRendererTest, FilledBoundaryChangesPixels)
{
    // Cell 0's square covers world [0, 10]^2; at zoom 5 its center (5, 5) lands at the surface center.
    m_renderer_->Render(Viewport(Vec2(5, 5), kWidth, kHeight, 5.0));
    EXPECT_NE(PixelAt(m_renderer_->GetImage(), kWidth / 2 + 10, kHeight / 2 + 10), 0xFFFFFFFFu);

    // Nothing there: background only.
    m_renderer_->Render(Viewport(Vec2(-500, -500), kWidth, kHeight, 5.0));
    EXPECT_EQ(PixelAt(m_renderer_->GetImage(), kWidth / 2, kHeight / 2), 0xFFFFFFFFu);
    EXPECT_EQ(m_renderer_->GetStatistics().draw_calls, 0U);
}

TEST_F(Blend2DRendererTest, HiddenLayerIsSkipped)
{
    m_renderer_->SetLayerVisible({1, 0}, false);
    m_renderer_->Render(Viewport(Vec2(50, 40), kWidth, kHeight, 0.8));
    EXPECT_EQ(m_renderer_->GetStatistics().elements_rendered, 30U);
    EXPECT_FALSE(m_renderer_->IsLayerVisible({1, 0}));
}

TEST_F(Blend2DRendererTest, StylesDefaultPerLayerAndCanBeOverridden)
{
    LayerStyle const kRectStyle = m_renderer_->GetLayerStyle({1, 0});
    LayerStyle const kPathStyle = m_renderer_->GetLayerStyle({2, 0});
    EXPECT_NE(kRectStyle.color.value, kPathStyle.color.value);
    EXPECT_FLOAT_EQ(kRectStyle.opacity, 0.7F);

    LayerStyle custom = kRectStyle;
    custom.color = BLRgba32(0xFF00FF00u);
    custom.fill_enabled = false;
    m_renderer_->SetLayerStyle({1, 0}, custom);
    EXPECT_EQ(m_renderer_->GetLayerStyle({1, 0}), custom);

    // Styles survive a scene rebuild.
    m_renderer_->UpdateSceneGraph();
    EXPECT_EQ(m_renderer_->GetLayerStyle({1, 0}), custom);
}

TEST_F(Blend2DRendererTest, PickAndRegionQueries)
{
    m_renderer_->Render(Viewport(Vec2(5, 5), kWidth, kHeight, 5.0));
    EXPECT_FALSE(m_renderer_->Pick(Vec2(5, 5)).empty());
    EXPECT_TRUE(m_renderer_->Pick(Vec2(15, 40)).empty());
    EXPECT_EQ(m_renderer_->GetElementsInRegion(BBox(-1, -1, 11, 21)).size(), 4U);

    // Screen center maps back onto the viewport center.
    Vec2 const kWorld = m_renderer_->ScreenToWorld(Vec2(kWidth / 2.0, kHeight / 2.0));
    EXPECT_DOUBLE_EQ(kWorld.x_ax, 5.0);
    EXPECT_DOUBLE_EQ(kWorld.y_ax, 5.0);
    EXPECT_FALSE(m_renderer_->GetElementsInScreenRegion(Vec2(90, 40), Vec2(110, 60)).empty());
}

TEST_F(Blend2DRendererTest, DebugOverlayDoesNotBreakFrame)
{
    m_renderer_->SetDebugOverlay(true);
    m_renderer_->Render(Viewport(Vec2(50, 40), kWidth, kHeight, 0.8));
    EXPECT_TRUE(m_renderer_->IsDebugOverlayEnabled());
    EXPECT_EQ(m_renderer_->GetStatistics().elements_rendered, 40U);
}

TEST_F(Blend2DRendererTest, ViewTransformFlipsY)
{
    Transform const kView = BaseRenderer::ComputeViewTransform(Viewport(Vec2(10, 10), kWidth, kHeight, 2.0));
    Vec2 const kCenter = kView.Apply(Vec2(10, 10));
    EXPECT_DOUBLE_EQ(kCenter.x_ax, 100.0);
    EXPECT_DOUBLE_EQ(kCenter.y_ax, 50.0);
    Vec2 const kAbove = kView.Apply(Vec2(10, 15));
    EXPECT_DOUBLE_EQ(kAbove.y_ax, 40.0);
}

TEST(Blend2DRendererStandaloneTest, RenderBeforeInitializeIsIgnored)
{
    Blend2DRenderer renderer;
    renderer.Render(Viewport(Vec2(), 100, 100, 1.0));
    EXPECT_FALSE(renderer.IsReady());
    EXPECT_EQ(renderer.GetStatistics().frame_count, 0U);
}

TEST(Blend2DRendererStandaloneTest, ClearSceneEmptiesFrames)
{
    Blend2DRenderer renderer;
    ASSERT_TRUE(renderer.Initialize(64, 64));
    renderer.SetLibrary(MakeMixedLibrary());
    renderer.UpdateSceneGraph();
    renderer.ClearScene();
    renderer.Render(Viewport(Vec2(), 64, 64, 1.0));
    EXPECT_EQ(renderer.GetStatistics().total_elements, 0U);
    EXPECT_EQ(renderer.GetStatistics().draw_calls, 0U);
    EXPECT_EQ(renderer.GetLibrary(), nullptr);
}

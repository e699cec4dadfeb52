#include <gtest/gtest.h>

#include "FakeGpuDevice.hpp"
#include "render/RendererFactory.hpp"

TEST(RendererFactoryTest, ExplicitBlend2D)
{
    std::unique_ptr<BaseRenderer> renderer = RendererFactory::Create(RendererBackend::kBlend2D, RenderSettings(), 320, 240);
    ASSERT_NE(renderer, nullptr);
    EXPECT_EQ(renderer->GetBackend(), RendererBackend::kBlend2D);
    EXPECT_TRUE(renderer->IsReady());
}

TEST(RendererFactoryTest, AutoPicksGpuWhenDeviceIsAvailable)
{
    FakeGpuDevice::State state;
    std::unique_ptr<BaseRenderer> renderer = RendererFactory::Create(RendererBackend::kAuto, RenderSettings(), 320, 240, std::make_unique<FakeGpuDevice>(state));
    ASSERT_NE(renderer, nullptr);
    EXPECT_EQ(renderer->GetBackend(), RendererBackend::kOpenGL);
}

TEST(RendererFactoryTest, AutoFallsBackWhenDeviceIsUnavailable)
{
    FakeGpuDevice::State state;
    state.available = false;
    std::unique_ptr<BaseRenderer> renderer = RendererFactory::Create(RendererBackend::kAuto, RenderSettings(), 320, 240, std::make_unique<FakeGpuDevice>(state));
    ASSERT_NE(renderer, nullptr);
    EXPECT_EQ(renderer->GetBackend(), RendererBackend::kBlend2D);
}

TEST(RendererFactoryTest, RequestedGpuFallsBackOnInitializeFailure)
{
    FakeGpuDevice::State state;
    state.fail_compile = true;
    std::unique_ptr<BaseRenderer> renderer = RendererFactory::Create(RendererBackend::kOpenGL, RenderSettings(), 320, 240, std::make_unique<FakeGpuDevice>(state));
    ASSERT_NE(renderer, nullptr);
    EXPECT_EQ(renderer->GetBackend(), RendererBackend::kBlend2D);
    EXPECT_TRUE(renderer->IsReady());
}

TEST(RendererFactoryTest, Blend2DIsAlwaysAvailable)
{
    EXPECT_TRUE(RendererFactory::IsBackendAvailable(RendererBackend::kBlend2D));
    // No GL context is current in the test process.
    EXPECT_FALSE(RendererFactory::IsBackendAvailable(RendererBackend::kOpenGL));
    EXPECT_EQ(RendererFactory::DetectBestBackend(), RendererBackend::kBlend2D);
}

TEST(RendererFactoryTest, InvalidSizeFails)
{
    EXPECT_EQ(RendererFactory::Create(RendererBackend::kBlend2D, RenderSettings(), 0, 240), nullptr);
}

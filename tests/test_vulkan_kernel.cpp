/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "fractal/gpu/vulkan/vulkan_context.hpp"
#include "fractal/gpu/vulkan/vulkan_image.hpp"
#include "fractal/gpu/vulkan/vulkan_kernel_pipeline.hpp"
#include "fractal/gpu/vulkan/vulkan_kernel_test.hpp"
#include "fractal/kernel/image.hpp"
#include "fractal/render/texture_renderer.hpp"

using namespace fractal;

class VulkanKernelTestFixture : public ::testing::Test
{
protected:
  void SetUp() override
  {
    if (!vulkan_available())
      GTEST_SKIP() << "no Vulkan compute device";
  }
};

TEST(VulkanDeviceSelection, NameMatchWins)
{
  std::vector<ComputeDeviceInfo> devices = {{"llvmpipe", false, 0},
                                            {"AMD Radeon RX 7900", true, 1},
                                            {"NVIDIA GeForce RTX 4070", true, 2}};

  EXPECT_EQ(pick_compute_device(devices, "NVIDIA"), 2);
  EXPECT_EQ(pick_compute_device(devices, "llvm"), 0);
}

TEST(VulkanDeviceSelection, AutoPrefersDiscrete)
{
  std::vector<ComputeDeviceInfo> devices = {{"Intel UHD", false, 0},
                                            {"AMD Radeon RX 7900", true, 1}};

  EXPECT_EQ(pick_compute_device(devices, "Auto"), 1);
  EXPECT_EQ(pick_compute_device(devices, ""), 1);

  // unmatched names fall back to the automatic choice
  EXPECT_EQ(pick_compute_device(devices, "Apple"), 1);
}

TEST(VulkanDeviceSelection, SkipsDevicesWithoutCompute)
{
  std::vector<ComputeDeviceInfo> devices = {{"NVIDIA display", true, -1},
                                            {"Intel UHD", false, 2}};

  EXPECT_EQ(pick_compute_device(devices, "NVIDIA"), 1);
  EXPECT_EQ(pick_compute_device(devices, "Auto"), 1);

  devices.pop_back();
  EXPECT_EQ(pick_compute_device(devices, "Auto"), -1);
  EXPECT_EQ(pick_compute_device({}, "Auto"), -1);
}

TEST_F(VulkanKernelTestFixture, ContextSubmitsEmptyWork)
{
  auto &ctx = VulkanContext::instance();

  EXPECT_FALSE(ctx.device_name().empty());
  EXPECT_NE(ctx.device(), VK_NULL_HANDLE);

  bool recorded = false;
  EXPECT_NO_THROW(ctx.submit_and_wait([&recorded](VkCommandBuffer) { recorded = true; }));
  EXPECT_TRUE(recorded);
}

TEST_F(VulkanKernelTestFixture, MatchesCpuReference)
{
  EXPECT_TRUE(VulkanKernelTest::run_gradient_test(256, 256, "julia"));
  EXPECT_TRUE(VulkanKernelTest::run_gradient_test(1280, 720, "julia"));
}

TEST_F(VulkanKernelTestFixture, BoundaryValues64)
{
  Image       image(64, 64, {0, 0, 0, 0});
  VulkanImage target(64, 64);

  target.upload(image);
  VulkanKernelPipeline::instance().dispatch("julia", target, dispatch_shape_for(64, 64));
  target.download(image);

  EXPECT_EQ(image.texel(0, 0), (Rgba8{0, 0, 255, 255}));

  Rgba8 last = image.texel(63, 63);
  EXPECT_LE(std::abs(int(last[0]) - 251), 1);
  EXPECT_LE(std::abs(int(last[1]) - 251), 1);
  EXPECT_EQ(last[2], 255);
  EXPECT_EQ(last[3], 255);
}

TEST_F(VulkanKernelTestFixture, PipelineIsCachedByName)
{
  auto &pipeline = VulkanKernelPipeline::instance();

  VulkanImage target(8, 8);
  pipeline.dispatch("julia", target, DispatchShape{1, 1, 1});
  size_t count = pipeline.cached_pipeline_count();

  pipeline.dispatch("julia", target, DispatchShape{1, 1, 1});
  EXPECT_EQ(pipeline.cached_pipeline_count(), count);
}

TEST_F(VulkanKernelTestFixture, RejectsBadInput)
{
  VulkanImage target(8, 8);
  Image       wrong(16, 16);

  EXPECT_THROW(target.upload(wrong), std::invalid_argument);
  EXPECT_THROW(VulkanKernelPipeline::instance().dispatch("no_such_kernel",
                                                         target,
                                                         DispatchShape{1, 1, 1}),
               std::runtime_error);
  EXPECT_THROW(VulkanKernelPipeline::instance().dispatch("julia",
                                                         target,
                                                         DispatchShape{1, 1, 2}),
               std::invalid_argument);
}

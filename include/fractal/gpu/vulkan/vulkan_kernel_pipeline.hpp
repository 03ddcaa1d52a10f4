/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#ifdef FRACTAL_HAS_VULKAN

#include <cstdint>
#include <string>
#include <unordered_map>

#include <vulkan/vulkan.h>

#include "fractal/kernel/texture_kernel.hpp"

namespace fractal
{

class VulkanImage;

// Texture kernels taking a single storage image at binding 0 and nothing
// else. Pipelines are built on first use and cached by kernel name.
class VulkanKernelPipeline
{
public:
  static VulkanKernelPipeline &instance();

  bool is_ready() const;

  // Dispatch a texture kernel.
  //   kernel_name : base name of the .spv file (e.g. "julia" loads julia.spv)
  //   target      : storage image bound at binding 0
  //   shape       : tile counts, each tile kTileSize x kTileSize invocations
  void dispatch(const std::string   &kernel_name,
                VulkanImage         &target,
                const DispatchShape &shape);

  size_t cached_pipeline_count() const { return cache_.size(); }

  VulkanKernelPipeline(const VulkanKernelPipeline &) = delete;
  VulkanKernelPipeline &operator=(const VulkanKernelPipeline &) = delete;

  ~VulkanKernelPipeline();

private:
  VulkanKernelPipeline();

  struct PipelineEntry
  {
    VkShaderModule        shader_module   = VK_NULL_HANDLE;
    VkDescriptorSetLayout desc_layout     = VK_NULL_HANDLE;
    VkPipelineLayout      pipeline_layout = VK_NULL_HANDLE;
    VkPipeline            pipeline        = VK_NULL_HANDLE;
  };

  PipelineEntry &get_or_create(const std::string &kernel_name);
  void           destroy_entry(VkDevice device, PipelineEntry &entry) const;

  std::unordered_map<std::string, PipelineEntry> cache_;
  bool                                           ready_ = false;
};

} // namespace fractal

#endif // FRACTAL_HAS_VULKAN

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#ifdef FRACTAL_HAS_VULKAN

#include <array>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "fractal/gpu/vulkan/shader_paths.hpp"
#include "fractal/gpu/vulkan/vulkan_context.hpp"
#include "fractal/gpu/vulkan/vulkan_image.hpp"
#include "fractal/gpu/vulkan/vulkan_kernel_pipeline.hpp"
#include "fractal/logger.hpp"

namespace fractal
{

// --- File helpers ---

static std::vector<char> read_spirv(const std::string &path)
{
  std::ifstream file(path, std::ios::ate | std::ios::binary);
  if (!file.is_open())
    throw std::runtime_error("Failed to open SPIR-V file: " + path);

  size_t file_size = static_cast<size_t>(file.tellg());
  if (file_size == 0 || file_size % sizeof(uint32_t) != 0)
    throw std::runtime_error("Invalid SPIR-V file size (" + std::to_string(file_size) +
                             " bytes): " + path);

  std::vector<char> buffer(file_size);
  file.seekg(0);
  file.read(buffer.data(), static_cast<std::streamsize>(file_size));
  return buffer;
}

static VkShaderModule create_shader_mod(VkDevice device, const std::vector<char> &code)
{
  VkShaderModuleCreateInfo ci{};
  ci.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
  ci.codeSize = code.size();
  ci.pCode = reinterpret_cast<const uint32_t *>(code.data());

  VkShaderModule mod;
  check_vk_result(vkCreateShaderModule(device, &ci, nullptr, &mod),
                  "Failed to create shader module");
  return mod;
}

// --- Singleton ---

VulkanKernelPipeline &VulkanKernelPipeline::instance()
{
  static VulkanKernelPipeline inst;
  return inst;
}

VulkanKernelPipeline::VulkanKernelPipeline()
{
  auto &ctx = VulkanContext::instance();
  this->ready_ = ctx.is_ready();
  if (this->ready_)
    Logger::log()->info("VulkanKernelPipeline ready (lazy pipeline creation)");
  else
    Logger::log()->warn("VulkanKernelPipeline: VulkanContext not ready");
}

VulkanKernelPipeline::~VulkanKernelPipeline()
{
  auto &ctx = VulkanContext::instance();
  if (!ctx.is_ready())
    return;

  for (auto &[name, entry] : this->cache_)
    this->destroy_entry(ctx.device(), entry);

  Logger::log()->trace("VulkanKernelPipeline destroyed ({} cached pipelines)",
                       this->cache_.size());
}

bool VulkanKernelPipeline::is_ready() const { return this->ready_; }

void VulkanKernelPipeline::destroy_entry(VkDevice device, PipelineEntry &entry) const
{
  if (entry.pipeline != VK_NULL_HANDLE)
    vkDestroyPipeline(device, entry.pipeline, nullptr);
  if (entry.pipeline_layout != VK_NULL_HANDLE)
    vkDestroyPipelineLayout(device, entry.pipeline_layout, nullptr);
  if (entry.desc_layout != VK_NULL_HANDLE)
    vkDestroyDescriptorSetLayout(device, entry.desc_layout, nullptr);
  if (entry.shader_module != VK_NULL_HANDLE)
    vkDestroyShaderModule(device, entry.shader_module, nullptr);

  entry = PipelineEntry{};
}

// --- Lazy pipeline creation ---

VulkanKernelPipeline::PipelineEntry &
VulkanKernelPipeline::get_or_create(const std::string &kernel_name)
{
  auto it = this->cache_.find(kernel_name);
  if (it != this->cache_.end())
    return it->second;

  VkDevice      device = VulkanContext::instance().device();
  PipelineEntry entry{};

  try
  {
    auto code = read_spirv(VULKAN_SHADER_DIR + "/" + kernel_name + ".spv");
    entry.shader_module = create_shader_mod(device, code);

    // binding 0: the output texture, read/write storage image
    VkDescriptorSetLayoutBinding binding{};
    binding.binding = 0;
    binding.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    binding.descriptorCount = 1;
    binding.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

    VkDescriptorSetLayoutCreateInfo layout_ci{};
    layout_ci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layout_ci.bindingCount = 1;
    layout_ci.pBindings = &binding;

    check_vk_result(
        vkCreateDescriptorSetLayout(device, &layout_ci, nullptr, &entry.desc_layout),
        "Failed to create descriptor set layout for kernel '" + kernel_name + "'");

    VkPipelineLayoutCreateInfo pl_ci{};
    pl_ci.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    pl_ci.setLayoutCount = 1;
    pl_ci.pSetLayouts = &entry.desc_layout;

    check_vk_result(
        vkCreatePipelineLayout(device, &pl_ci, nullptr, &entry.pipeline_layout),
        "Failed to create pipeline layout for kernel '" + kernel_name + "'");

    // workgroup extent (constant_id 0 and 1) follows kTileSize
    const std::array<uint32_t, 2> tile_extent = {kTileSize, kTileSize};

    std::array<VkSpecializationMapEntry, 2> spec_entries{};
    spec_entries[0] = {0, 0, sizeof(uint32_t)};
    spec_entries[1] = {1, sizeof(uint32_t), sizeof(uint32_t)};

    VkSpecializationInfo spec_info{};
    spec_info.mapEntryCount = static_cast<uint32_t>(spec_entries.size());
    spec_info.pMapEntries = spec_entries.data();
    spec_info.dataSize = sizeof(tile_extent);
    spec_info.pData = tile_extent.data();

    VkComputePipelineCreateInfo pipe_ci{};
    pipe_ci.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    pipe_ci.stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    pipe_ci.stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    pipe_ci.stage.module = entry.shader_module;
    pipe_ci.stage.pName = "main";
    pipe_ci.stage.pSpecializationInfo = &spec_info;
    pipe_ci.layout = entry.pipeline_layout;

    check_vk_result(vkCreateComputePipelines(device,
                                             VK_NULL_HANDLE,
                                             1,
                                             &pipe_ci,
                                             nullptr,
                                             &entry.pipeline),
                    "Failed to create compute pipeline for kernel '" + kernel_name +
                        "'");
  }
  catch (const std::exception &)
  {
    this->destroy_entry(device, entry);
    throw;
  }

  Logger::log()->info("VulkanKernelPipeline: created pipeline for '{}' ({}x{} tiles)",
                      kernel_name,
                      kTileSize,
                      kTileSize);

  auto [inserted_it, _] = this->cache_.emplace(kernel_name, entry);
  return inserted_it->second;
}

// --- Dispatch ---

void VulkanKernelPipeline::dispatch(const std::string   &kernel_name,
                                    VulkanImage         &target,
                                    const DispatchShape &shape)
{
  if (!this->ready_)
    throw std::runtime_error("VulkanKernelPipeline not ready");

  validate(shape);

  auto    &entry = this->get_or_create(kernel_name);
  auto    &ctx = VulkanContext::instance();
  VkDevice device = ctx.device();

  // descriptor pool (per-dispatch, cleaned up after)
  VkDescriptorPoolSize pool_size{};
  pool_size.type = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
  pool_size.descriptorCount = 1;

  VkDescriptorPoolCreateInfo pool_ci{};
  pool_ci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
  pool_ci.maxSets = 1;
  pool_ci.poolSizeCount = 1;
  pool_ci.pPoolSizes = &pool_size;

  VkDescriptorPool desc_pool;
  check_vk_result(vkCreateDescriptorPool(device, &pool_ci, nullptr, &desc_pool),
                  "Failed to create descriptor pool");

  try
  {
    VkDescriptorSetAllocateInfo desc_alloc{};
    desc_alloc.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    desc_alloc.descriptorPool = desc_pool;
    desc_alloc.descriptorSetCount = 1;
    desc_alloc.pSetLayouts = &entry.desc_layout;

    VkDescriptorSet desc_set;
    check_vk_result(vkAllocateDescriptorSets(device, &desc_alloc, &desc_set),
                    "Failed to allocate descriptor set");

    VkDescriptorImageInfo image_info{};
    image_info.imageView = target.view();
    image_info.imageLayout = VK_IMAGE_LAYOUT_GENERAL;
    image_info.sampler = VK_NULL_HANDLE;

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = desc_set;
    write.dstBinding = 0;
    write.descriptorCount = 1;
    write.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    write.pImageInfo = &image_info;

    vkUpdateDescriptorSets(device, 1, &write, 0, nullptr);

    ctx.submit_and_wait(
        [&](VkCommandBuffer cmd)
        {
          vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, entry.pipeline);
          vkCmdBindDescriptorSets(cmd,
                                  VK_PIPELINE_BIND_POINT_COMPUTE,
                                  entry.pipeline_layout,
                                  0,
                                  1,
                                  &desc_set,
                                  0,
                                  nullptr);
          vkCmdDispatch(cmd, shape.tiles_x, shape.tiles_y, shape.tiles_z);
        });
  }
  catch (const std::exception &)
  {
    vkDestroyDescriptorPool(device, desc_pool, nullptr);
    throw;
  }

  vkDestroyDescriptorPool(device, desc_pool, nullptr);
}

} // namespace fractal

#endif // FRACTAL_HAS_VULKAN

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#ifdef FRACTAL_HAS_VULKAN

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

#include "fractal/gpu/vulkan/vulkan_buffer.hpp"
#include "fractal/gpu/vulkan/vulkan_context.hpp"
#include "fractal/logger.hpp"

namespace fractal
{

static int32_t pick_memory_type(const VkPhysicalDeviceMemoryProperties &mem_props,
                                uint32_t                                type_bits,
                                VkMemoryPropertyFlags                   wanted)
{
  for (uint32_t i = 0; i < mem_props.memoryTypeCount; ++i)
    if ((type_bits & (1u << i)) &&
        (mem_props.memoryTypes[i].propertyFlags & wanted) == wanted)
      return static_cast<int32_t>(i);

  return -1;
}

VulkanBuffer::VulkanBuffer(VkDeviceSize          size_bytes,
                           VkBufferUsageFlags    usage,
                           VkMemoryPropertyFlags memory_properties)
    : size_(size_bytes)
{
  auto &ctx = VulkanContext::instance();

  VkBufferCreateInfo buffer_info{};
  buffer_info.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
  buffer_info.size = size_bytes;
  buffer_info.usage = usage;
  buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

  check_vk_result(vkCreateBuffer(ctx.device(), &buffer_info, nullptr, &this->buffer_),
                  "Failed to create Vulkan buffer");

  VkMemoryRequirements mem_reqs;
  vkGetBufferMemoryRequirements(ctx.device(), this->buffer_, &mem_reqs);

  VkPhysicalDeviceMemoryProperties phys_mem_props;
  vkGetPhysicalDeviceMemoryProperties(ctx.physical_device(), &phys_mem_props);

  int32_t mem_type_idx = pick_memory_type(phys_mem_props,
                                          mem_reqs.memoryTypeBits,
                                          memory_properties);

  // HOST_CACHED is not exposed everywhere, settle for HOST_COHERENT
  if (mem_type_idx < 0 && (memory_properties & VK_MEMORY_PROPERTY_HOST_CACHED_BIT))
  {
    VkMemoryPropertyFlags coherent = (memory_properties &
                                      ~VK_MEMORY_PROPERTY_HOST_CACHED_BIT) |
                                     VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;

    mem_type_idx = pick_memory_type(phys_mem_props, mem_reqs.memoryTypeBits, coherent);
    if (mem_type_idx >= 0)
      Logger::log()->debug("VulkanBuffer: HOST_CACHED unavailable, using HOST_COHERENT");
  }

  if (mem_type_idx < 0)
  {
    this->cleanup();
    throw std::runtime_error("Failed to find suitable Vulkan memory type");
  }

  // actual flags, upload/download flush or invalidate when not coherent
  this->mem_props_ = phys_mem_props.memoryTypes[mem_type_idx].propertyFlags;

  VkMemoryAllocateInfo alloc_info{};
  alloc_info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
  alloc_info.allocationSize = mem_reqs.size;
  alloc_info.memoryTypeIndex = static_cast<uint32_t>(mem_type_idx);

  try
  {
    check_vk_result(vkAllocateMemory(ctx.device(), &alloc_info, nullptr, &this->memory_),
                    "Failed to allocate Vulkan buffer memory");
    check_vk_result(vkBindBufferMemory(ctx.device(), this->buffer_, this->memory_, 0),
                    "Failed to bind Vulkan buffer memory");
  }
  catch (const std::exception &)
  {
    this->cleanup();
    throw;
  }
}

VulkanBuffer::~VulkanBuffer() { this->cleanup(); }

VulkanBuffer::VulkanBuffer(VulkanBuffer &&other) noexcept
    : buffer_(other.buffer_), memory_(other.memory_), size_(other.size_),
      mem_props_(other.mem_props_)
{
  other.buffer_ = VK_NULL_HANDLE;
  other.memory_ = VK_NULL_HANDLE;
  other.size_ = 0;
  other.mem_props_ = 0;
}

VulkanBuffer &VulkanBuffer::operator=(VulkanBuffer &&other) noexcept
{
  if (this != &other)
  {
    this->cleanup();
    this->buffer_ = other.buffer_;
    this->memory_ = other.memory_;
    this->size_ = other.size_;
    this->mem_props_ = other.mem_props_;
    other.buffer_ = VK_NULL_HANDLE;
    other.memory_ = VK_NULL_HANDLE;
    other.size_ = 0;
    other.mem_props_ = 0;
  }
  return *this;
}

void VulkanBuffer::cleanup()
{
  auto &ctx = VulkanContext::instance();

  if (this->buffer_ != VK_NULL_HANDLE)
  {
    vkDestroyBuffer(ctx.device(), this->buffer_, nullptr);
    this->buffer_ = VK_NULL_HANDLE;
  }
  if (this->memory_ != VK_NULL_HANDLE)
  {
    vkFreeMemory(ctx.device(), this->memory_, nullptr);
    this->memory_ = VK_NULL_HANDLE;
  }
  this->size_ = 0;
}

void VulkanBuffer::upload(const void *data, VkDeviceSize size)
{
  auto &ctx = VulkanContext::instance();

  if (size > this->size_)
    throw std::runtime_error("VulkanBuffer::upload: " + std::to_string(size) +
                             " bytes exceed buffer size " + std::to_string(this->size_));

  void *mapped = nullptr;
  check_vk_result(vkMapMemory(ctx.device(), this->memory_, 0, size, 0, &mapped),
                  "Failed to map Vulkan buffer memory for upload");

  std::memcpy(mapped, data, static_cast<size_t>(size));

  if (!(this->mem_props_ & VK_MEMORY_PROPERTY_HOST_COHERENT_BIT))
  {
    VkMappedMemoryRange range{};
    range.sType = VK_STRUCTURE_TYPE_MAPPED_MEMORY_RANGE;
    range.memory = this->memory_;
    range.offset = 0;
    range.size = VK_WHOLE_SIZE;
    vkFlushMappedMemoryRanges(ctx.device(), 1, &range);
  }

  vkUnmapMemory(ctx.device(), this->memory_);
}

void VulkanBuffer::download(void *data, VkDeviceSize size) const
{
  auto &ctx = VulkanContext::instance();

  if (size > this->size_)
    throw std::runtime_error("VulkanBuffer::download: " + std::to_string(size) +
                             " bytes exceed buffer size " + std::to_string(this->size_));

  void *mapped = nullptr;
  check_vk_result(vkMapMemory(ctx.device(), this->memory_, 0, size, 0, &mapped),
                  "Failed to map Vulkan buffer memory for download");

  if (!(this->mem_props_ & VK_MEMORY_PROPERTY_HOST_COHERENT_BIT))
  {
    VkMappedMemoryRange range{};
    range.sType = VK_STRUCTURE_TYPE_MAPPED_MEMORY_RANGE;
    range.memory = this->memory_;
    range.offset = 0;
    range.size = VK_WHOLE_SIZE;
    vkInvalidateMappedMemoryRanges(ctx.device(), 1, &range);
  }

  std::memcpy(data, mapped, static_cast<size_t>(size));
  vkUnmapMemory(ctx.device(), this->memory_);
}

VulkanBuffer create_staging_buffer(VkDeviceSize size_bytes)
{
  return VulkanBuffer(size_bytes,
                      VK_BUFFER_USAGE_TRANSFER_SRC_BIT |
                          VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                      VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT |
                          VK_MEMORY_PROPERTY_HOST_CACHED_BIT);
}

} // namespace fractal

#endif // FRACTAL_HAS_VULKAN

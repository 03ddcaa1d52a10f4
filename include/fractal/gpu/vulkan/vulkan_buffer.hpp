/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#ifdef FRACTAL_HAS_VULKAN

#include <vulkan/vulkan.h>

namespace fractal
{

class VulkanBuffer
{
public:
  VulkanBuffer(VkDeviceSize          size_bytes,
               VkBufferUsageFlags    usage,
               VkMemoryPropertyFlags memory_properties);

  ~VulkanBuffer();

  VulkanBuffer(VulkanBuffer &&other) noexcept;
  VulkanBuffer &operator=(VulkanBuffer &&other) noexcept;

  VulkanBuffer(const VulkanBuffer &) = delete;
  VulkanBuffer &operator=(const VulkanBuffer &) = delete;

  // Host-visible buffers only.
  void upload(const void *data, VkDeviceSize size);
  void download(void *data, VkDeviceSize size) const;

  VkBuffer     buffer() const { return buffer_; }
  VkDeviceSize size() const { return size_; }

private:
  void cleanup();

  VkBuffer              buffer_ = VK_NULL_HANDLE;
  VkDeviceMemory        memory_ = VK_NULL_HANDLE;
  VkDeviceSize          size_ = 0;
  VkMemoryPropertyFlags mem_props_ = 0;
};

// Host-visible transfer buffer used to move image contents in and out.
VulkanBuffer create_staging_buffer(VkDeviceSize size_bytes);

} // namespace fractal

#endif // FRACTAL_HAS_VULKAN

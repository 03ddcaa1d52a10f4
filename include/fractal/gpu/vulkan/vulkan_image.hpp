/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#ifdef FRACTAL_HAS_VULKAN

#include <cstdint>

#include <vulkan/vulkan.h>

namespace fractal
{

class Image;

// 2D R8G8B8A8_UNORM storage image (read/write from compute shaders). The
// image lives in VK_IMAGE_LAYOUT_GENERAL for its whole lifetime.
class VulkanImage
{
public:
  static constexpr VkFormat format = VK_FORMAT_R8G8B8A8_UNORM;

  VulkanImage(uint32_t width, uint32_t height);

  ~VulkanImage();

  VulkanImage(VulkanImage &&other) noexcept;
  VulkanImage &operator=(VulkanImage &&other) noexcept;

  VulkanImage(const VulkanImage &) = delete;
  VulkanImage &operator=(const VulkanImage &) = delete;

  // Copies host pixels in. Sizes must match.
  void upload(const Image &source);

  // Waits for prior compute writes and copies the pixels out. Sizes must
  // match.
  void download(Image &target) const;

  VkImage     image() const { return image_; }
  VkImageView view() const { return view_; }
  uint32_t    width() const { return width_; }
  uint32_t    height() const { return height_; }

  VkDeviceSize size_bytes() const
  {
    return static_cast<VkDeviceSize>(width_) * height_ * 4;
  }

private:
  void cleanup();
  void check_extent(const Image &image, const char *caller) const;

  VkImage        image_ = VK_NULL_HANDLE;
  VkDeviceMemory memory_ = VK_NULL_HANDLE;
  VkImageView    view_ = VK_NULL_HANDLE;
  uint32_t       width_ = 0;
  uint32_t       height_ = 0;
};

} // namespace fractal

#endif // FRACTAL_HAS_VULKAN

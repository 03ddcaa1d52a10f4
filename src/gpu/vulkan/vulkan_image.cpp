/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#ifdef FRACTAL_HAS_VULKAN

#include <stdexcept>
#include <string>

#include "fractal/gpu/vulkan/vulkan_buffer.hpp"
#include "fractal/gpu/vulkan/vulkan_context.hpp"
#include "fractal/gpu/vulkan/vulkan_image.hpp"
#include "fractal/kernel/image.hpp"
#include "fractal/logger.hpp"

namespace fractal
{

static VkImageSubresourceRange color_range()
{
  VkImageSubresourceRange range{};
  range.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
  range.baseMipLevel = 0;
  range.levelCount = 1;
  range.baseArrayLayer = 0;
  range.layerCount = 1;
  return range;
}

static VkBufferImageCopy full_copy_region(uint32_t width, uint32_t height)
{
  VkBufferImageCopy region{};
  region.bufferOffset = 0;
  region.bufferRowLength = 0; // tightly packed
  region.bufferImageHeight = 0;
  region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
  region.imageSubresource.mipLevel = 0;
  region.imageSubresource.baseArrayLayer = 0;
  region.imageSubresource.layerCount = 1;
  region.imageOffset = {0, 0, 0};
  region.imageExtent = {width, height, 1};
  return region;
}

static void image_barrier(VkCommandBuffer      cmd,
                          VkImage              image,
                          VkImageLayout        old_layout,
                          VkAccessFlags        src_access,
                          VkAccessFlags        dst_access,
                          VkPipelineStageFlags src_stage,
                          VkPipelineStageFlags dst_stage)
{
  VkImageMemoryBarrier barrier{};
  barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
  barrier.oldLayout = old_layout;
  barrier.newLayout = VK_IMAGE_LAYOUT_GENERAL;
  barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
  barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
  barrier.image = image;
  barrier.subresourceRange = color_range();
  barrier.srcAccessMask = src_access;
  barrier.dstAccessMask = dst_access;

  vkCmdPipelineBarrier(cmd, src_stage, dst_stage, 0, 0, nullptr, 0, nullptr, 1, &barrier);
}

VulkanImage::VulkanImage(uint32_t width, uint32_t height)
    : width_(width), height_(height)
{
  if (width == 0 || height == 0)
    throw std::invalid_argument("VulkanImage: empty extent");

  auto    &ctx = VulkanContext::instance();
  VkDevice device = ctx.device();

  VkImageCreateInfo image_info{};
  image_info.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
  image_info.imageType = VK_IMAGE_TYPE_2D;
  image_info.format = VulkanImage::format;
  image_info.extent = {width, height, 1};
  image_info.mipLevels = 1;
  image_info.arrayLayers = 1;
  image_info.samples = VK_SAMPLE_COUNT_1_BIT;
  image_info.tiling = VK_IMAGE_TILING_OPTIMAL;
  image_info.usage = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT |
                     VK_IMAGE_USAGE_TRANSFER_DST_BIT;
  image_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
  image_info.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

  check_vk_result(vkCreateImage(device, &image_info, nullptr, &this->image_),
                  "Failed to create Vulkan storage image");

  try
  {
    VkMemoryRequirements mem_reqs;
    vkGetImageMemoryRequirements(device, this->image_, &mem_reqs);

    VkMemoryAllocateInfo alloc_info{};
    alloc_info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    alloc_info.allocationSize = mem_reqs.size;
    alloc_info.memoryTypeIndex =
        ctx.find_memory_type(mem_reqs.memoryTypeBits,
                             VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);

    check_vk_result(vkAllocateMemory(device, &alloc_info, nullptr, &this->memory_),
                    "Failed to allocate Vulkan image memory");
    check_vk_result(vkBindImageMemory(device, this->image_, this->memory_, 0),
                    "Failed to bind Vulkan image memory");

    VkImageViewCreateInfo view_info{};
    view_info.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    view_info.image = this->image_;
    view_info.viewType = VK_IMAGE_VIEW_TYPE_2D;
    view_info.format = VulkanImage::format;
    view_info.subresourceRange = color_range();

    check_vk_result(vkCreateImageView(device, &view_info, nullptr, &this->view_),
                    "Failed to create Vulkan image view");

    ctx.submit_and_wait(
        [&](VkCommandBuffer cmd)
        {
          image_barrier(cmd,
                        this->image_,
                        VK_IMAGE_LAYOUT_UNDEFINED,
                        0,
                        VK_ACCESS_SHADER_READ_BIT | VK_ACCESS_SHADER_WRITE_BIT |
                            VK_ACCESS_TRANSFER_READ_BIT | VK_ACCESS_TRANSFER_WRITE_BIT,
                        VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT,
                        VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT |
                            VK_PIPELINE_STAGE_TRANSFER_BIT);
        });
  }
  catch (const std::exception &)
  {
    this->cleanup();
    throw;
  }

  Logger::log()->trace("VulkanImage created ({}x{})", width, height);
}

VulkanImage::~VulkanImage() { this->cleanup(); }

VulkanImage::VulkanImage(VulkanImage &&other) noexcept
    : image_(other.image_), memory_(other.memory_), view_(other.view_),
      width_(other.width_), height_(other.height_)
{
  other.image_ = VK_NULL_HANDLE;
  other.memory_ = VK_NULL_HANDLE;
  other.view_ = VK_NULL_HANDLE;
  other.width_ = 0;
  other.height_ = 0;
}

VulkanImage &VulkanImage::operator=(VulkanImage &&other) noexcept
{
  if (this != &other)
  {
    this->cleanup();
    this->image_ = other.image_;
    this->memory_ = other.memory_;
    this->view_ = other.view_;
    this->width_ = other.width_;
    this->height_ = other.height_;
    other.image_ = VK_NULL_HANDLE;
    other.memory_ = VK_NULL_HANDLE;
    other.view_ = VK_NULL_HANDLE;
    other.width_ = 0;
    other.height_ = 0;
  }
  return *this;
}

void VulkanImage::cleanup()
{
  auto    &ctx = VulkanContext::instance();
  VkDevice device = ctx.device();

  if (this->view_ != VK_NULL_HANDLE)
  {
    vkDestroyImageView(device, this->view_, nullptr);
    this->view_ = VK_NULL_HANDLE;
  }
  if (this->image_ != VK_NULL_HANDLE)
  {
    vkDestroyImage(device, this->image_, nullptr);
    this->image_ = VK_NULL_HANDLE;
  }
  if (this->memory_ != VK_NULL_HANDLE)
  {
    vkFreeMemory(device, this->memory_, nullptr);
    this->memory_ = VK_NULL_HANDLE;
  }
}

void VulkanImage::check_extent(const Image &image, const char *caller) const
{
  if (image.width() != this->width_ || image.height() != this->height_)
    throw std::invalid_argument(std::string(caller) + ": host image is " +
                                std::to_string(image.width()) + "x" +
                                std::to_string(image.height()) + ", device image is " +
                                std::to_string(this->width_) + "x" +
                                std::to_string(this->height_));
}

void VulkanImage::upload(const Image &source)
{
  this->check_extent(source, "VulkanImage::upload");

  VulkanBuffer staging = create_staging_buffer(this->size_bytes());
  staging.upload(source.data(), this->size_bytes());

  VulkanContext::instance().submit_and_wait(
      [&](VkCommandBuffer cmd)
      {
        // previous shader access must finish before the copy overwrites texels
        image_barrier(cmd,
                      this->image_,
                      VK_IMAGE_LAYOUT_GENERAL,
                      VK_ACCESS_SHADER_READ_BIT | VK_ACCESS_SHADER_WRITE_BIT,
                      VK_ACCESS_TRANSFER_WRITE_BIT,
                      VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT,
                      VK_PIPELINE_STAGE_TRANSFER_BIT);

        VkBufferImageCopy region = full_copy_region(this->width_, this->height_);
        vkCmdCopyBufferToImage(cmd,
                               staging.buffer(),
                               this->image_,
                               VK_IMAGE_LAYOUT_GENERAL,
                               1,
                               &region);

        image_barrier(cmd,
                      this->image_,
                      VK_IMAGE_LAYOUT_GENERAL,
                      VK_ACCESS_TRANSFER_WRITE_BIT,
                      VK_ACCESS_SHADER_READ_BIT | VK_ACCESS_SHADER_WRITE_BIT,
                      VK_PIPELINE_STAGE_TRANSFER_BIT,
                      VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT);
      });
}

void VulkanImage::download(Image &target) const
{
  this->check_extent(target, "VulkanImage::download");

  VulkanBuffer staging = create_staging_buffer(this->size_bytes());

  VulkanContext::instance().submit_and_wait(
      [&](VkCommandBuffer cmd)
      {
        image_barrier(cmd,
                      this->image_,
                      VK_IMAGE_LAYOUT_GENERAL,
                      VK_ACCESS_SHADER_WRITE_BIT,
                      VK_ACCESS_TRANSFER_READ_BIT,
                      VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT,
                      VK_PIPELINE_STAGE_TRANSFER_BIT);

        VkBufferImageCopy region = full_copy_region(this->width_, this->height_);
        vkCmdCopyImageToBuffer(cmd,
                               this->image_,
                               VK_IMAGE_LAYOUT_GENERAL,
                               staging.buffer(),
                               1,
                               &region);

        VkBufferMemoryBarrier host_barrier{};
        host_barrier.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER;
        host_barrier.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        host_barrier.dstAccessMask = VK_ACCESS_HOST_READ_BIT;
        host_barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        host_barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        host_barrier.buffer = staging.buffer();
        host_barrier.offset = 0;
        host_barrier.size = VK_WHOLE_SIZE;

        vkCmdPipelineBarrier(cmd,
                             VK_PIPELINE_STAGE_TRANSFER_BIT,
                             VK_PIPELINE_STAGE_HOST_BIT,
                             0,
                             0,
                             nullptr,
                             1,
                             &host_barrier,
                             0,
                             nullptr);
      });

  staging.download(target.data(), this->size_bytes());
}

} // namespace fractal

#endif // FRACTAL_HAS_VULKAN

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#ifdef FRACTAL_HAS_VULKAN

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <vulkan/vulkan.h>

namespace fractal
{

// What device selection needs to know about a physical device.
struct ComputeDeviceInfo
{
  std::string name;
  bool        discrete = false;
  int         compute_family = -1; // -1 when the device cannot run compute
};

// Index of the device to run texture kernels on, -1 if none can. A device
// whose name contains selection wins (unless selection is empty or "Auto"),
// then the first discrete GPU, then the first compute-capable device.
int pick_compute_device(const std::vector<ComputeDeviceInfo> &devices,
                        const std::string                    &selection);

// Process-wide Vulkan instance, device and compute queue. Construction never
// throws: on failure the context logs the reason and stays not ready.
class VulkanContext
{
public:
  static VulkanContext &instance();

  bool is_ready() const { return ready_; }

  VkDevice           device() const { return device_; }
  VkPhysicalDevice   physical_device() const { return physical_device_; }
  const std::string &device_name() const { return device_name_; }

  // Records a one-shot command buffer with record_fn, submits it to the
  // compute queue and blocks on a fence until it completes.
  void submit_and_wait(const std::function<void(VkCommandBuffer)> &record_fn);

  uint32_t find_memory_type(uint32_t              type_filter,
                            VkMemoryPropertyFlags properties) const;

  VulkanContext(const VulkanContext &) = delete;
  VulkanContext &operator=(const VulkanContext &) = delete;

  ~VulkanContext();

private:
  VulkanContext();

  void create_instance(bool with_validation);
  void create_debug_messenger();
  void open_device();
  void release();

  VkInstance               instance_ = VK_NULL_HANDLE;
  VkDebugUtilsMessengerEXT debug_messenger_ = VK_NULL_HANDLE;
  VkPhysicalDevice         physical_device_ = VK_NULL_HANDLE;
  VkDevice                 device_ = VK_NULL_HANDLE;
  VkQueue                  queue_ = VK_NULL_HANDLE;
  VkCommandPool            command_pool_ = VK_NULL_HANDLE;
  std::string              device_name_;
  bool                     ready_ = false;
};

// Throws std::runtime_error("<what>, error: <result>") unless result is
// VK_SUCCESS.
void check_vk_result(VkResult result, const std::string &what);

} // namespace fractal

#endif // FRACTAL_HAS_VULKAN

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#ifdef FRACTAL_HAS_VULKAN

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include "fractal/core/settings_manager.hpp"
#include "fractal/gpu/vulkan/vulkan_context.hpp"
#include "fractal/logger.hpp"

namespace fractal
{

static constexpr const char *kValidationLayer = "VK_LAYER_KHRONOS_validation";

void check_vk_result(VkResult result, const std::string &what)
{
  if (result != VK_SUCCESS)
    throw std::runtime_error(what + ", error: " + std::to_string(result));
}

static VKAPI_ATTR VkBool32 VKAPI_CALL
on_validation_message(VkDebugUtilsMessageSeverityFlagBitsEXT      severity,
                      VkDebugUtilsMessageTypeFlagsEXT             /*type*/,
                      const VkDebugUtilsMessengerCallbackDataEXT *data,
                      void * /*user_data*/)
{
  if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
    Logger::log()->error("[VULKAN] {}", data->pMessage);
  else
    Logger::log()->warn("[VULKAN] {}", data->pMessage);
  return VK_FALSE;
}

#ifdef DEBUG_BUILD
static bool instance_layer_present(const char *name)
{
  uint32_t count = 0;
  vkEnumerateInstanceLayerProperties(&count, nullptr);
  std::vector<VkLayerProperties> layers(count);
  vkEnumerateInstanceLayerProperties(&count, layers.data());

  return std::any_of(layers.begin(),
                     layers.end(),
                     [name](const VkLayerProperties &layer)
                     { return std::strcmp(layer.layerName, name) == 0; });
}
#endif

// Queue family for compute work, -1 if there is none. Compute-only
// families are taken over ones shared with graphics.
static int compute_family_of(VkPhysicalDevice device)
{
  uint32_t count = 0;
  vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
  std::vector<VkQueueFamilyProperties> families(count);
  vkGetPhysicalDeviceQueueFamilyProperties(device, &count, families.data());

  int shared = -1;
  for (uint32_t i = 0; i < count; ++i)
  {
    const VkQueueFlags flags = families[i].queueFlags;
    if (!(flags & VK_QUEUE_COMPUTE_BIT))
      continue;

    if (!(flags & VK_QUEUE_GRAPHICS_BIT))
      return static_cast<int>(i);

    if (shared < 0)
      shared = static_cast<int>(i);
  }
  return shared;
}

int pick_compute_device(const std::vector<ComputeDeviceInfo> &devices,
                        const std::string                    &selection)
{
  const bool by_name = !selection.empty() && selection != "Auto";

  int discrete = -1;
  int first = -1;

  for (size_t i = 0; i < devices.size(); ++i)
  {
    const ComputeDeviceInfo &info = devices[i];
    const int                index = static_cast<int>(i);

    if (info.compute_family < 0)
      continue;

    if (by_name && info.name.find(selection) != std::string::npos)
      return index;

    if (discrete < 0 && info.discrete)
      discrete = index;

    if (first < 0)
      first = index;
  }

  if (by_name)
    Logger::log()->warn("No Vulkan device matches '{}', using automatic selection",
                        selection);

  return discrete >= 0 ? discrete : first;
}

VulkanContext &VulkanContext::instance()
{
  static VulkanContext ctx;
  return ctx;
}

VulkanContext::VulkanContext()
{
  try
  {
#ifdef DEBUG_BUILD
    const bool with_validation = instance_layer_present(kValidationLayer);
    if (!with_validation)
      Logger::log()->warn("{} not installed, running without validation",
                          kValidationLayer);
#else
    const bool with_validation = false;
#endif

    this->create_instance(with_validation);
    if (with_validation)
      this->create_debug_messenger();

    this->open_device();
    this->ready_ = true;
    Logger::log()->info("VulkanContext ready on {}", this->device_name_);
  }
  catch (const std::runtime_error &e)
  {
    Logger::log()->error("VulkanContext unavailable: {}", e.what());
    this->release();
  }
}

VulkanContext::~VulkanContext()
{
  this->release();
  Logger::log()->trace("VulkanContext destroyed");
}

void VulkanContext::release()
{
  if (this->device_ != VK_NULL_HANDLE)
  {
    vkDeviceWaitIdle(this->device_);
    if (this->command_pool_ != VK_NULL_HANDLE)
      vkDestroyCommandPool(this->device_, this->command_pool_, nullptr);
    vkDestroyDevice(this->device_, nullptr);
  }

  if (this->debug_messenger_ != VK_NULL_HANDLE)
  {
    auto destroy = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(this->instance_, "vkDestroyDebugUtilsMessengerEXT"));
    if (destroy)
      destroy(this->instance_, this->debug_messenger_, nullptr);
  }

  if (this->instance_ != VK_NULL_HANDLE)
    vkDestroyInstance(this->instance_, nullptr);

  this->command_pool_ = VK_NULL_HANDLE;
  this->queue_ = VK_NULL_HANDLE;
  this->device_ = VK_NULL_HANDLE;
  this->physical_device_ = VK_NULL_HANDLE;
  this->debug_messenger_ = VK_NULL_HANDLE;
  this->instance_ = VK_NULL_HANDLE;
  this->ready_ = false;
}

void VulkanContext::create_instance(bool with_validation)
{
  VkApplicationInfo app_info{};
  app_info.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
  app_info.pApplicationName = "fractal";
  app_info.apiVersion = VK_API_VERSION_1_2;

  const char *layer = kValidationLayer;
  const char *extension = VK_EXT_DEBUG_UTILS_EXTENSION_NAME;

  VkInstanceCreateInfo create_info{};
  create_info.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
  create_info.pApplicationInfo = &app_info;

  if (with_validation)
  {
    create_info.enabledLayerCount = 1;
    create_info.ppEnabledLayerNames = &layer;
    create_info.enabledExtensionCount = 1;
    create_info.ppEnabledExtensionNames = &extension;
  }

  check_vk_result(vkCreateInstance(&create_info, nullptr, &this->instance_),
                  "Failed to create Vulkan instance");
}

void VulkanContext::create_debug_messenger()
{
  auto create = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
      vkGetInstanceProcAddr(this->instance_, "vkCreateDebugUtilsMessengerEXT"));
  if (!create)
  {
    Logger::log()->warn("vkCreateDebugUtilsMessengerEXT not found");
    return;
  }

  VkDebugUtilsMessengerCreateInfoEXT info{};
  info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
  info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
  info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                     VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
  info.pfnUserCallback = on_validation_message;

  // validation output is a diagnostic, a missing messenger is not fatal
  if (create(this->instance_, &info, nullptr, &this->debug_messenger_) != VK_SUCCESS)
  {
    this->debug_messenger_ = VK_NULL_HANDLE;
    Logger::log()->warn("Vulkan debug messenger could not be created");
  }
}

void VulkanContext::open_device()
{
  uint32_t count = 0;
  vkEnumeratePhysicalDevices(this->instance_, &count, nullptr);
  std::vector<VkPhysicalDevice> handles(count);
  vkEnumeratePhysicalDevices(this->instance_, &count, handles.data());

  std::vector<ComputeDeviceInfo> infos;
  infos.reserve(count);

  for (VkPhysicalDevice handle : handles)
  {
    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(handle, &props);

    ComputeDeviceInfo info;
    info.name = props.deviceName;
    info.discrete = props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU;
    info.compute_family = compute_family_of(handle);
    infos.push_back(info);

    Logger::log()->trace("Vulkan device: {} (discrete: {}, compute family: {})",
                         info.name,
                         info.discrete,
                         info.compute_family);
  }

  const int index = pick_compute_device(infos,
                                        SettingsManager::instance().compute.device_selection);
  if (index < 0)
    throw std::runtime_error(count == 0 ? "No Vulkan device found"
                                        : "No Vulkan device with a compute queue");

  this->physical_device_ = handles[index];
  this->device_name_ = infos[index].name;

  const uint32_t family = static_cast<uint32_t>(infos[index].compute_family);
  const float    priority = 1.f;

  VkDeviceQueueCreateInfo queue_info{};
  queue_info.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
  queue_info.queueFamilyIndex = family;
  queue_info.queueCount = 1;
  queue_info.pQueuePriorities = &priority;

  VkDeviceCreateInfo device_info{};
  device_info.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
  device_info.queueCreateInfoCount = 1;
  device_info.pQueueCreateInfos = &queue_info;

  check_vk_result(
      vkCreateDevice(this->physical_device_, &device_info, nullptr, &this->device_),
      "Failed to create Vulkan device on " + this->device_name_);

  vkGetDeviceQueue(this->device_, family, 0, &this->queue_);

  // command buffers are allocated per submission and freed right after
  VkCommandPoolCreateInfo pool_info{};
  pool_info.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
  pool_info.queueFamilyIndex = family;
  pool_info.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;

  check_vk_result(
      vkCreateCommandPool(this->device_, &pool_info, nullptr, &this->command_pool_),
      "Failed to create Vulkan command pool");
}

uint32_t VulkanContext::find_memory_type(uint32_t              type_filter,
                                         VkMemoryPropertyFlags properties) const
{
  VkPhysicalDeviceMemoryProperties mem_props;
  vkGetPhysicalDeviceMemoryProperties(this->physical_device_, &mem_props);

  for (uint32_t i = 0; i < mem_props.memoryTypeCount; ++i)
  {
    if ((type_filter & (1u << i)) &&
        (mem_props.memoryTypes[i].propertyFlags & properties) == properties)
      return i;
  }

  throw std::runtime_error("Failed to find suitable Vulkan memory type");
}

void VulkanContext::submit_and_wait(
    const std::function<void(VkCommandBuffer)> &record_fn)
{
  if (!this->ready_)
    throw std::runtime_error("VulkanContext not ready");

  VkCommandBufferAllocateInfo alloc_info{};
  alloc_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
  alloc_info.commandPool = this->command_pool_;
  alloc_info.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
  alloc_info.commandBufferCount = 1;

  VkCommandBuffer cmd;
  check_vk_result(vkAllocateCommandBuffers(this->device_, &alloc_info, &cmd),
                  "Failed to allocate command buffer");

  VkFence fence = VK_NULL_HANDLE;

  auto release = [&]()
  {
    if (fence != VK_NULL_HANDLE)
      vkDestroyFence(this->device_, fence, nullptr);
    vkFreeCommandBuffers(this->device_, this->command_pool_, 1, &cmd);
  };

  try
  {
    VkCommandBufferBeginInfo begin_info{};
    begin_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin_info.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    check_vk_result(vkBeginCommandBuffer(cmd, &begin_info),
                    "Failed to begin command buffer");

    record_fn(cmd);

    check_vk_result(vkEndCommandBuffer(cmd), "Failed to end command buffer");

    VkSubmitInfo submit_info{};
    submit_info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit_info.commandBufferCount = 1;
    submit_info.pCommandBuffers = &cmd;

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    check_vk_result(vkCreateFence(this->device_, &fence_info, nullptr, &fence),
                    "Failed to create fence");

    check_vk_result(vkQueueSubmit(this->queue_, 1, &submit_info, fence),
                    "Failed to submit command buffer");
    check_vk_result(vkWaitForFences(this->device_, 1, &fence, VK_TRUE, UINT64_MAX),
                    "Failed waiting for compute fence");
  }
  catch (const std::exception &)
  {
    release();
    throw;
  }

  release();
}

} // namespace fractal

#endif // FRACTAL_HAS_VULKAN

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <chrono>
#include <stdexcept>

#ifdef FRACTAL_HAS_OPENMP
#include <omp.h>
#endif

#include "fractal/core/settings_manager.hpp"
#include "fractal/core/terminal_logger.hpp"
#include "fractal/kernel/cpu_dispatch.hpp"
#include "fractal/logger.hpp"
#include "fractal/render/texture_renderer.hpp"

#ifdef FRACTAL_HAS_VULKAN
#include "fractal/gpu/vulkan/vulkan_context.hpp"
#include "fractal/gpu/vulkan/vulkan_image.hpp"
#include "fractal/gpu/vulkan/vulkan_kernel_pipeline.hpp"
#endif

namespace fractal
{

std::string backend_as_string(Backend backend)
{
  switch (backend)
  {
  case Backend::CPU: return "CPU";
  case Backend::VULKAN: return "VULKAN";
  }
  return "UNKNOWN";
}

bool vulkan_available()
{
#ifdef FRACTAL_HAS_VULKAN
  return VulkanContext::instance().is_ready() &&
         VulkanKernelPipeline::instance().is_ready();
#else
  return false;
#endif
}

static float elapsed_ms(std::chrono::high_resolution_clock::time_point t0)
{
  auto t1 = std::chrono::high_resolution_clock::now();
  return std::chrono::duration<float, std::milli>(t1 - t0).count();
}

static void check_image(const FractalDescriptor &descriptor, const Image &image)
{
  if (image.width() != descriptor.width || image.height() != descriptor.height)
    throw std::invalid_argument("Output image is " + std::to_string(image.width()) +
                                "x" + std::to_string(image.height()) +
                                ", fractal expects " +
                                std::to_string(descriptor.width) + "x" +
                                std::to_string(descriptor.height));
}

TextureRenderer::TextureRenderer(const SettingsManager &settings) : settings_(settings)
{
}

Backend TextureRenderer::render(const FractalDescriptor &descriptor, Image &image) const
{
  validate(descriptor);
  check_image(descriptor, image);

  const std::string   name = kernel_name(descriptor.type);
  const DispatchShape shape = dispatch_shape_for(descriptor.width, descriptor.height);

  TerminalLogger::instance().log_dispatch_started(name,
                                                  descriptor.width,
                                                  descriptor.height,
                                                  shape.tiles_x,
                                                  shape.tiles_y);

#ifdef FRACTAL_HAS_VULKAN
  if (this->settings_.compute.enable_vulkan && vulkan_available())
  {
    try
    {
      return this->render_vulkan(descriptor, image);
    }
    catch (const std::runtime_error &e)
    {
      if (!this->settings_.compute.fallback_to_cpu_on_error)
        throw;

      TerminalLogger::instance().log_fallback(name, e.what());
    }
  }
  else if (this->settings_.compute.enable_vulkan)
  {
    TerminalLogger::instance().log_fallback(name, "Vulkan backend not available");
  }
#else
  if (this->settings_.compute.enable_vulkan)
    Logger::log()->debug("TextureRenderer: built without Vulkan, using CPU");
#endif

  return this->render_cpu(descriptor, image);
}

Backend TextureRenderer::render_cpu(const FractalDescriptor &descriptor,
                                    Image                   &image) const
{
  check_image(descriptor, image);

  const std::string   name = kernel_name(descriptor.type);
  const DispatchShape shape = dispatch_shape_for(descriptor.width, descriptor.height);

  int threads = this->settings_.compute.cpu_threads;
#ifdef FRACTAL_HAS_OPENMP
  if (threads <= 0)
    threads = omp_get_max_threads();
#endif

  auto t0 = std::chrono::high_resolution_clock::now();
  dispatch_cpu(name, shape, image, threads);

  TerminalLogger::instance().log_dispatch(name,
                                          backend_as_string(Backend::CPU),
                                          elapsed_ms(t0),
                                          threads);
  return Backend::CPU;
}

#ifdef FRACTAL_HAS_VULKAN
Backend TextureRenderer::render_vulkan(const FractalDescriptor &descriptor,
                                       Image                   &image) const
{
  check_image(descriptor, image);

  const std::string   name = kernel_name(descriptor.type);
  const DispatchShape shape = dispatch_shape_for(descriptor.width, descriptor.height);

  VulkanImage target(descriptor.width, descriptor.height);

  // prior contents survive where the kernel does not write
  target.upload(image);

  auto t0 = std::chrono::high_resolution_clock::now();
  VulkanKernelPipeline::instance().dispatch(name, target, shape);
  float dispatch_ms = elapsed_ms(t0);

  target.download(image);

  TerminalLogger::instance().log_dispatch(name,
                                          backend_as_string(Backend::VULKAN),
                                          dispatch_ms);
  return Backend::VULKAN;
}
#endif

Image make_output_image(const FractalDescriptor &descriptor)
{
  return Image(descriptor.width, descriptor.height, {0, 0, 0, 255});
}

} // namespace fractal

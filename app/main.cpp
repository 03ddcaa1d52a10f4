/* Copyright (c) 2023 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "fractal/core/settings_manager.hpp"
#include "fractal/core/terminal_logger.hpp"
#include "fractal/logger.hpp"
#include "fractal/render/fractal_descriptor.hpp"
#include "fractal/render/texture_renderer.hpp"

#ifdef FRACTAL_HAS_VULKAN
#include "fractal/gpu/vulkan/vulkan_context.hpp"
#include "fractal/gpu/vulkan/vulkan_kernel_test.hpp"
#endif

#if defined(DEBUG_BUILD)
#define FRACTAL_RMODE "Debug"
#elif defined(RELEASE_BUILD)
#define FRACTAL_RMODE "Release"
#else
#define FRACTAL_RMODE "!!! UNDEFINED !!!"
#endif

int main()
{
  fractal::Logger::log()->info("Welcome to Fractal v{}.{}.{}!",
                               FRACTAL_VERSION_MAJOR,
                               FRACTAL_VERSION_MINOR,
                               FRACTAL_VERSION_PATCH);

  fractal::Logger::log()->info("Release mode: {}", std::string(FRACTAL_RMODE));

  // ----------------------------------- settings

  auto &settings = fractal::SettingsManager::instance();

  settings.settings_changed = [&settings]()
  {
    auto &terminal = fractal::TerminalLogger::instance();
    terminal.set_logging_level(settings.logging.terminal_logging_level);
    terminal.set_log_dispatch_timings(settings.logging.log_dispatch_timings);
    terminal.set_show_stutter_warnings(settings.logging.show_stutter_warnings);
    terminal.set_stutter_threshold_ms(settings.logging.stutter_threshold_ms);
  };

  settings.load();

  // ----------------------------------- render

  try
  {
    fractal::FractalDescriptor descriptor = fractal::descriptor_from_settings(settings);
    fractal::TextureRenderer   renderer(settings);
    fractal::Image             image = fractal::make_output_image(descriptor);

    fractal::Backend backend = renderer.render(descriptor, image);

    fractal::Color first = image.load(0, 0);
    fractal::Color last = image.load(image.width() - 1, image.height() - 1);

    fractal::Logger::log()->info(
        "Rendered {}x{} '{}' on {}: first texel ({:.3f}, {:.3f}, {:.3f}, {:.3f}), "
        "last texel ({:.3f}, {:.3f}, {:.3f}, {:.3f})",
        image.width(),
        image.height(),
        fractal::kernel_name(descriptor.type),
        fractal::backend_as_string(backend),
        first.r,
        first.g,
        first.b,
        first.a,
        last.r,
        last.g,
        last.b,
        last.a);

#ifdef FRACTAL_HAS_VULKAN
    if (backend == fractal::Backend::VULKAN)
      fractal::Logger::log()->info("Vulkan device: {}",
                                   fractal::VulkanContext::instance().device_name());

    if (backend == fractal::Backend::VULKAN &&
        !fractal::VulkanKernelTest::run_gradient_test(descriptor.width,
                                                      descriptor.height,
                                                      fractal::kernel_name(descriptor.type)))
    {
      fractal::Logger::log()->error("GPU output does not match the CPU reference");
      return EXIT_FAILURE;
    }
#endif
  }
  catch (const std::exception &e)
  {
    fractal::Logger::log()->critical("Rendering failed: {}", e.what());
    return EXIT_FAILURE;
  }

  fractal::Logger::log()->info("Clean shutdown");
  return EXIT_SUCCESS;
}

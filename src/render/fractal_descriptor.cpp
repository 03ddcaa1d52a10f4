/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <stdexcept>

#include "fractal/core/settings_manager.hpp"
#include "fractal/kernel/texture_kernel.hpp"
#include "fractal/logger.hpp"
#include "fractal/render/fractal_descriptor.hpp"

namespace fractal
{

std::string kernel_name(FractalType type)
{
  switch (type)
  {
  case FractalType::JULIA: return "julia";
  }
  throw std::invalid_argument("Unknown fractal type");
}

FractalType fractal_type_from_string(const std::string &name)
{
  if (name == "julia")
    return FractalType::JULIA;

  throw std::invalid_argument("Unknown fractal type: " + name);
}

void validate(const FractalDescriptor &descriptor)
{
  // throws on a resolution the tile grid cannot cover exactly
  dispatch_shape_for(descriptor.width, descriptor.height);

  if (descriptor.iterations <= 0)
    throw std::invalid_argument("Fractal iterations must be positive, got " +
                                std::to_string(descriptor.iterations));
}

FractalDescriptor descriptor_from_settings(const SettingsManager &settings)
{
  if (settings.output.width <= 0 || settings.output.height <= 0)
    throw std::invalid_argument("Output resolution must be positive, got " +
                                std::to_string(settings.output.width) + "x" +
                                std::to_string(settings.output.height));

  FractalDescriptor descriptor;
  descriptor.type = fractal_type_from_string(settings.fractal.type);
  descriptor.c_re = settings.fractal.c_re;
  descriptor.c_im = settings.fractal.c_im;
  descriptor.iterations = settings.fractal.iterations;
  descriptor.width = static_cast<uint32_t>(settings.output.width);
  descriptor.height = static_cast<uint32_t>(settings.output.height);

  validate(descriptor);

  Logger::log()->debug("fractal: {} c=({}, {}) iterations={} output={}x{}",
                       kernel_name(descriptor.type),
                       descriptor.c_re,
                       descriptor.c_im,
                       descriptor.iterations,
                       descriptor.width,
                       descriptor.height);

  return descriptor;
}

} // namespace fractal

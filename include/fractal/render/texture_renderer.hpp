/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#include <string>

#include "fractal/kernel/image.hpp"
#include "fractal/render/fractal_descriptor.hpp"

namespace fractal
{

class SettingsManager;

enum class Backend
{
  CPU,
  VULKAN,
};

std::string backend_as_string(Backend backend);

// True when Vulkan support was compiled in and a compute-capable device
// initialized.
bool vulkan_available();

// Runs texture kernels on the Vulkan backend when enabled and available,
// otherwise (or on GPU failure, when fallback is allowed) on the CPU.
class TextureRenderer
{
public:
  explicit TextureRenderer(const SettingsManager &settings);

  // Fills image with the descriptor's kernel. The image must already have
  // the descriptor resolution (std::invalid_argument otherwise). Returns the
  // backend that produced the pixels.
  Backend render(const FractalDescriptor &descriptor, Image &image) const;

  Backend render_cpu(const FractalDescriptor &descriptor, Image &image) const;

#ifdef FRACTAL_HAS_VULKAN
  Backend render_vulkan(const FractalDescriptor &descriptor, Image &image) const;
#endif

private:
  const SettingsManager &settings_;
};

// Output image at the descriptor resolution, opaque black.
Image make_output_image(const FractalDescriptor &descriptor);

} // namespace fractal

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#include <cstdint>
#include <string>

namespace fractal
{

class SettingsManager;

enum class FractalType
{
  // Julia set, parameterized by the constant c = (c_re, c_im).
  JULIA,
};

// What to render and where. The Julia constant and the iteration count are
// carried with the texture but the "julia" kernel does not consume them: it
// only derives a gradient from the pixel position.
struct FractalDescriptor
{
  FractalType type = FractalType::JULIA;
  double      c_re = -0.45;
  double      c_im = 0.55;
  int         iterations = 100;
  uint32_t    width = 1280;
  uint32_t    height = 720;
};

// Kernel entry name for both backends, also the SPIR-V file stem.
std::string kernel_name(FractalType type);

// Throws std::invalid_argument for unknown names.
FractalType fractal_type_from_string(const std::string &name);

// Throws std::invalid_argument when the resolution is not a positive
// multiple of kTileSize or iterations is not positive.
void validate(const FractalDescriptor &descriptor);

FractalDescriptor descriptor_from_settings(const SettingsManager &settings);

} // namespace fractal

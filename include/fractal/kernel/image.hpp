/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "fractal/kernel/texture_kernel.hpp"

namespace fractal
{

using Rgba8 = std::array<uint8_t, 4>;

// Host-side RGBA8 unorm image, row-major, 4 bytes per pixel. Layout matches
// VK_FORMAT_R8G8B8A8_UNORM so it can be copied to and from a VulkanImage
// without conversion.
class Image
{
public:
  Image() = default;
  Image(uint32_t width, uint32_t height, const Rgba8 &fill_value = {0, 0, 0, 255});

  uint32_t width() const { return width_; }
  uint32_t height() const { return height_; }
  Extent   extent() const { return Extent{width_, height_}; }
  size_t   size_bytes() const { return pixels_.size(); }

  bool contains(const Location &location) const;

  void fill(const Rgba8 &value);

  // Quantizes each channel (clamp to [0, 1], round c * 255). Stores outside
  // the image are discarded.
  void store(const Location &location, const Color &color);

  Rgba8 texel(uint32_t x, uint32_t y) const;
  Color load(uint32_t x, uint32_t y) const;

  uint8_t       *data() { return pixels_.data(); }
  const uint8_t *data() const { return pixels_.data(); }

  bool operator==(const Image &other) const;
  bool operator!=(const Image &other) const { return !(*this == other); }

private:
  size_t offset(uint32_t x, uint32_t y) const;

  uint32_t             width_ = 0;
  uint32_t             height_ = 0;
  std::vector<uint8_t> pixels_;
};

uint8_t to_unorm8(float value);
float   from_unorm8(uint8_t value);

} // namespace fractal

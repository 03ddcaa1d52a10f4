/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "fractal/kernel/image.hpp"

namespace fractal
{

uint8_t to_unorm8(float value)
{
  float clamped = std::clamp(value, 0.f, 1.f);
  return static_cast<uint8_t>(std::lround(clamped * 255.f));
}

float from_unorm8(uint8_t value) { return static_cast<float>(value) / 255.f; }

Image::Image(uint32_t width, uint32_t height, const Rgba8 &fill_value)
    : width_(width), height_(height),
      pixels_(static_cast<size_t>(width) * height * 4)
{
  this->fill(fill_value);
}

bool Image::contains(const Location &location) const
{
  return location.x >= 0 && location.y >= 0 &&
         static_cast<uint32_t>(location.x) < this->width_ &&
         static_cast<uint32_t>(location.y) < this->height_;
}

void Image::fill(const Rgba8 &value)
{
  for (size_t i = 0; i < this->pixels_.size(); i += 4)
    std::copy(value.begin(), value.end(), this->pixels_.begin() + i);
}

void Image::store(const Location &location, const Color &color)
{
  if (!this->contains(location))
    return;

  size_t i = this->offset(static_cast<uint32_t>(location.x),
                          static_cast<uint32_t>(location.y));
  this->pixels_[i] = to_unorm8(color.r);
  this->pixels_[i + 1] = to_unorm8(color.g);
  this->pixels_[i + 2] = to_unorm8(color.b);
  this->pixels_[i + 3] = to_unorm8(color.a);
}

Rgba8 Image::texel(uint32_t x, uint32_t y) const
{
  if (x >= this->width_ || y >= this->height_)
    throw std::out_of_range("Texel (" + std::to_string(x) + ", " + std::to_string(y) +
                            ") outside " + std::to_string(this->width_) + "x" +
                            std::to_string(this->height_) + " image");

  size_t i = this->offset(x, y);
  return {this->pixels_[i], this->pixels_[i + 1], this->pixels_[i + 2], this->pixels_[i + 3]};
}

Color Image::load(uint32_t x, uint32_t y) const
{
  Rgba8 t = this->texel(x, y);
  return Color{from_unorm8(t[0]), from_unorm8(t[1]), from_unorm8(t[2]), from_unorm8(t[3])};
}

bool Image::operator==(const Image &other) const
{
  return this->width_ == other.width_ && this->height_ == other.height_ &&
         this->pixels_ == other.pixels_;
}

size_t Image::offset(uint32_t x, uint32_t y) const
{
  return (static_cast<size_t>(y) * this->width_ + x) * 4;
}

} // namespace fractal

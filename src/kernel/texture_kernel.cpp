/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <stdexcept>
#include <string>

#include "fractal/kernel/image.hpp"
#include "fractal/kernel/texture_kernel.hpp"

namespace fractal
{

DispatchShape dispatch_shape_for(uint32_t width, uint32_t height)
{
  if (width == 0 || height == 0 || width % kTileSize != 0 || height % kTileSize != 0)
    throw std::invalid_argument("Resolution " + std::to_string(width) + "x" +
                                std::to_string(height) +
                                " is not a positive multiple of the tile size " +
                                std::to_string(kTileSize));

  return DispatchShape{width / kTileSize, height / kTileSize, 1};
}

void validate(const DispatchShape &shape)
{
  if (shape.tiles_x == 0 || shape.tiles_y == 0)
    throw std::invalid_argument("Dispatch shape must have at least one tile per axis");

  if (shape.tiles_z != 1)
    throw std::invalid_argument("Dispatch shape tiles_z must be 1, got " +
                                std::to_string(shape.tiles_z));
}

size_t invocation_count(const DispatchShape &shape)
{
  return static_cast<size_t>(shape.tiles_x) * shape.tiles_y * shape.tiles_z *
         kTileSize * kTileSize;
}

Extent dispatch_resolution(const DispatchShape &shape)
{
  return Extent{shape.tiles_x * kTileSize, shape.tiles_y * kTileSize};
}

InvocationId invocation_id(uint32_t tile_x,
                           uint32_t tile_y,
                           uint32_t local_x,
                           uint32_t local_y)
{
  return InvocationId{tile_x * kTileSize + local_x, tile_y * kTileSize + local_y, 0};
}

Location output_location(const InvocationId &id)
{
  return Location{static_cast<int32_t>(id.x), static_cast<int32_t>(id.y)};
}

NormalizedCoord normalized_coordinate(const Location &location, const Extent &resolution)
{
  return NormalizedCoord{static_cast<float>(location.x) /
                             static_cast<float>(resolution.width),
                         static_cast<float>(location.y) /
                             static_cast<float>(resolution.height)};
}

Color julia_color(const NormalizedCoord &coord)
{
  return Color{coord.u, coord.v, 1.f, 1.f};
}

void julia(const InvocationId &id, const DispatchShape &shape, Image &image)
{
  const Extent   resolution = dispatch_resolution(shape);
  const Location location = output_location(id);

  image.store(location, julia_color(normalized_coordinate(location, resolution)));
}

} // namespace fractal

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#include <cstddef>
#include <cstdint>

namespace fractal
{

class Image;

// Invocations per tile along X and Y. Must match the workgroup size the
// compute pipeline specializes shaders/julia.comp with.
constexpr uint32_t kTileSize = 8;

struct Color
{
  float r = 0.f;
  float g = 0.f;
  float b = 0.f;
  float a = 0.f;
};

// Global invocation id (gl_GlobalInvocationID).
struct InvocationId
{
  uint32_t x = 0;
  uint32_t y = 0;
  uint32_t z = 0;
};

// Number of tiles dispatched along each axis. tiles_z is always 1.
struct DispatchShape
{
  uint32_t tiles_x = 1;
  uint32_t tiles_y = 1;
  uint32_t tiles_z = 1;
};

struct Extent
{
  uint32_t width = 0;
  uint32_t height = 0;
};

struct Location
{
  int32_t x = 0;
  int32_t y = 0;
};

struct NormalizedCoord
{
  float u = 0.f;
  float v = 0.f;
};

// --- Dispatch model

// Throws std::invalid_argument unless width and height are positive
// multiples of kTileSize.
DispatchShape dispatch_shape_for(uint32_t width, uint32_t height);

// Throws std::invalid_argument for zero tile counts or tiles_z != 1.
void validate(const DispatchShape &shape);

size_t invocation_count(const DispatchShape &shape);

// Pixel extent covered by the dispatch: tiles * kTileSize on each axis.
Extent dispatch_resolution(const DispatchShape &shape);

// Global id of invocation (local_x, local_y) of tile (tile_x, tile_y).
InvocationId invocation_id(uint32_t tile_x,
                           uint32_t tile_y,
                           uint32_t local_x,
                           uint32_t local_y);

// --- Kernel steps

Location        output_location(const InvocationId &id);
NormalizedCoord normalized_coordinate(const Location &location, const Extent &resolution);
Color           julia_color(const NormalizedCoord &coord);

// One invocation of the "julia" kernel: derives its location from the
// invocation id, normalizes it against the dispatch resolution and stores
// (u, v, 1, 1). No bounds validation, no reads.
void julia(const InvocationId &id, const DispatchShape &shape, Image &image);

} // namespace fractal

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <set>
#include <stdexcept>
#include <utility>

#include <gtest/gtest.h>

#include "fractal/kernel/texture_kernel.hpp"

using namespace fractal;

static Color color_at(int32_t x, int32_t y, const DispatchShape &shape)
{
  return julia_color(normalized_coordinate(Location{x, y}, dispatch_resolution(shape)));
}

TEST(DispatchShape, FromResolution)
{
  DispatchShape shape = dispatch_shape_for(64, 48);
  EXPECT_EQ(shape.tiles_x, 8u);
  EXPECT_EQ(shape.tiles_y, 6u);
  EXPECT_EQ(shape.tiles_z, 1u);

  shape = dispatch_shape_for(1280, 720);
  EXPECT_EQ(shape.tiles_x, 160u);
  EXPECT_EQ(shape.tiles_y, 90u);
}

TEST(DispatchShape, RejectsResolutionsOffTheTileGrid)
{
  EXPECT_THROW(dispatch_shape_for(0, 8), std::invalid_argument);
  EXPECT_THROW(dispatch_shape_for(8, 0), std::invalid_argument);
  EXPECT_THROW(dispatch_shape_for(12, 8), std::invalid_argument);
  EXPECT_THROW(dispatch_shape_for(8, 7), std::invalid_argument);
}

TEST(DispatchShape, Validate)
{
  EXPECT_NO_THROW(validate(DispatchShape{1, 1, 1}));
  EXPECT_THROW(validate(DispatchShape{0, 1, 1}), std::invalid_argument);
  EXPECT_THROW(validate(DispatchShape{1, 0, 1}), std::invalid_argument);
  EXPECT_THROW(validate(DispatchShape{1, 1, 2}), std::invalid_argument);
  EXPECT_THROW(validate(DispatchShape{1, 1, 0}), std::invalid_argument);
}

TEST(DispatchShape, ResolutionAndInvocationCount)
{
  DispatchShape shape{3, 5, 1};
  Extent        res = dispatch_resolution(shape);

  EXPECT_EQ(res.width, 24u);
  EXPECT_EQ(res.height, 40u);
  EXPECT_EQ(invocation_count(shape), 24u * 40u);
}

TEST(TextureKernel, InvocationIdentityAddressesTilesRowMajor)
{
  InvocationId id = invocation_id(2, 3, 5, 7);
  EXPECT_EQ(id.x, 2u * kTileSize + 5u);
  EXPECT_EQ(id.y, 3u * kTileSize + 7u);
  EXPECT_EQ(id.z, 0u);

  Location loc = output_location(id);
  EXPECT_EQ(loc.x, 21);
  EXPECT_EQ(loc.y, 31);
}

TEST(TextureKernel, LocationsAreDisjointAndCoverTheGrid)
{
  for (const DispatchShape &shape :
       {DispatchShape{1, 1, 1}, DispatchShape{3, 2, 1}, DispatchShape{5, 7, 1}})
  {
    Extent                        res = dispatch_resolution(shape);
    std::set<std::pair<int, int>> seen;

    for (uint32_t ty = 0; ty < shape.tiles_y; ++ty)
      for (uint32_t tx = 0; tx < shape.tiles_x; ++tx)
        for (uint32_t ly = 0; ly < kTileSize; ++ly)
          for (uint32_t lx = 0; lx < kTileSize; ++lx)
          {
            Location loc = output_location(invocation_id(tx, ty, lx, ly));
            ASSERT_GE(loc.x, 0);
            ASSERT_GE(loc.y, 0);
            ASSERT_LT(static_cast<uint32_t>(loc.x), res.width);
            ASSERT_LT(static_cast<uint32_t>(loc.y), res.height);
            EXPECT_TRUE(seen.insert({loc.x, loc.y}).second)
                << "duplicate location (" << loc.x << ", " << loc.y << ")";
          }

    EXPECT_EQ(seen.size(), invocation_count(shape));
  }
}

TEST(TextureKernel, BoundaryValues64)
{
  DispatchShape shape = dispatch_shape_for(64, 64);

  Color c0 = color_at(0, 0, shape);
  EXPECT_FLOAT_EQ(c0.r, 0.f);
  EXPECT_FLOAT_EQ(c0.g, 0.f);
  EXPECT_FLOAT_EQ(c0.b, 1.f);
  EXPECT_FLOAT_EQ(c0.a, 1.f);

  Color c1 = color_at(63, 63, shape);
  EXPECT_FLOAT_EQ(c1.r, 0.984375f);
  EXPECT_FLOAT_EQ(c1.g, 0.984375f);
  EXPECT_FLOAT_EQ(c1.b, 1.f);
  EXPECT_FLOAT_EQ(c1.a, 1.f);
}

TEST(TextureKernel, SingleTileScenario)
{
  DispatchShape shape{1, 1, 1};

  Color center = color_at(4, 4, shape);
  EXPECT_FLOAT_EQ(center.r, 0.5f);
  EXPECT_FLOAT_EQ(center.g, 0.5f);
  EXPECT_FLOAT_EQ(center.b, 1.f);
  EXPECT_FLOAT_EQ(center.a, 1.f);

  Color left = color_at(0, 7, shape);
  EXPECT_FLOAT_EQ(left.r, 0.f);
  EXPECT_FLOAT_EQ(left.g, 0.875f);
  EXPECT_FLOAT_EQ(left.b, 1.f);
  EXPECT_FLOAT_EQ(left.a, 1.f);
}

TEST(TextureKernel, DividesInFloatingPoint)
{
  NormalizedCoord uv = normalized_coordinate(Location{1, 3}, Extent{8, 16});
  EXPECT_FLOAT_EQ(uv.u, 0.125f);
  EXPECT_FLOAT_EQ(uv.v, 0.1875f);
}

TEST(TextureKernel, GradientIsMonotonicAndBelowOne)
{
  DispatchShape shape{4, 3, 1};
  Extent        res = dispatch_resolution(shape);

  for (uint32_t y = 0; y < res.height; ++y)
    for (uint32_t x = 1; x < res.width; ++x)
    {
      Color prev = color_at(x - 1, y, shape);
      Color curr = color_at(x, y, shape);
      EXPECT_LE(prev.r, curr.r);
      EXPECT_LT(curr.r, 1.f);
      EXPECT_FLOAT_EQ(prev.g, curr.g);
    }

  for (uint32_t x = 0; x < res.width; ++x)
    for (uint32_t y = 1; y < res.height; ++y)
    {
      Color prev = color_at(x, y - 1, shape);
      Color curr = color_at(x, y, shape);
      EXPECT_LE(prev.g, curr.g);
      EXPECT_LT(curr.g, 1.f);
    }
}

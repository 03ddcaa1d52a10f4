/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <stdexcept>

#include <gtest/gtest.h>

#include "fractal/kernel/image.hpp"

using namespace fractal;

TEST(Image, DefaultFillIsOpaqueBlack)
{
  Image image(16, 8);

  EXPECT_EQ(image.width(), 16u);
  EXPECT_EQ(image.height(), 8u);
  EXPECT_EQ(image.size_bytes(), 16u * 8u * 4u);
  EXPECT_EQ(image.texel(0, 0), (Rgba8{0, 0, 0, 255}));
  EXPECT_EQ(image.texel(15, 7), (Rgba8{0, 0, 0, 255}));
}

TEST(Image, StoreQuantizesToUnorm8)
{
  Image image(8, 8, {0, 0, 0, 0});

  image.store(Location{2, 3}, Color{0.5f, 0.875f, 1.f, 1.f});
  EXPECT_EQ(image.texel(2, 3), (Rgba8{128, 223, 255, 255}));

  // clamped to [0, 1]
  image.store(Location{0, 0}, Color{-1.f, 2.f, 0.f, 1.f});
  EXPECT_EQ(image.texel(0, 0), (Rgba8{0, 255, 0, 255}));

  Color c = image.load(2, 3);
  EXPECT_NEAR(c.r, 0.5f, 1.f / 255.f);
  EXPECT_FLOAT_EQ(c.b, 1.f);
}

TEST(Image, OutOfBoundsStoresAreDiscarded)
{
  Image image(8, 8, {1, 2, 3, 4});
  Image before = image;

  image.store(Location{-1, 0}, Color{1.f, 1.f, 1.f, 1.f});
  image.store(Location{0, -1}, Color{1.f, 1.f, 1.f, 1.f});
  image.store(Location{8, 0}, Color{1.f, 1.f, 1.f, 1.f});
  image.store(Location{0, 8}, Color{1.f, 1.f, 1.f, 1.f});

  EXPECT_EQ(image, before);
  EXPECT_FALSE(image.contains(Location{8, 8}));
  EXPECT_TRUE(image.contains(Location{7, 7}));
}

TEST(Image, TexelOutsideThrows)
{
  Image image(8, 8);
  EXPECT_THROW(image.texel(8, 0), std::out_of_range);
  EXPECT_THROW(image.load(0, 8), std::out_of_range);
}

TEST(Image, FillAndCompare)
{
  Image a(8, 8);
  Image b(8, 8);
  EXPECT_EQ(a, b);

  b.fill({10, 20, 30, 40});
  EXPECT_NE(a, b);
  EXPECT_EQ(b.texel(5, 5), (Rgba8{10, 20, 30, 40}));

  EXPECT_NE(Image(8, 16), Image(16, 8));
}

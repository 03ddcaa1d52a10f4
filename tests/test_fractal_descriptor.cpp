/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <stdexcept>

#include <gtest/gtest.h>

#include "fractal/core/settings_manager.hpp"
#include "fractal/render/fractal_descriptor.hpp"

using namespace fractal;

class FractalDescriptorTest : public ::testing::Test
{
protected:
  void SetUp() override { SettingsManager::instance().reset(); }
  void TearDown() override { SettingsManager::instance().reset(); }
};

TEST_F(FractalDescriptorTest, KernelNames)
{
  EXPECT_EQ(kernel_name(FractalType::JULIA), "julia");
  EXPECT_EQ(fractal_type_from_string("julia"), FractalType::JULIA);
  EXPECT_EQ(fractal_type_from_string(kernel_name(FractalType::JULIA)), FractalType::JULIA);
  EXPECT_THROW(fractal_type_from_string("mandelbrot"), std::invalid_argument);
}

TEST_F(FractalDescriptorTest, Defaults)
{
  FractalDescriptor descriptor = descriptor_from_settings(SettingsManager::instance());

  EXPECT_EQ(descriptor.type, FractalType::JULIA);
  EXPECT_DOUBLE_EQ(descriptor.c_re, -0.45);
  EXPECT_DOUBLE_EQ(descriptor.c_im, 0.55);
  EXPECT_EQ(descriptor.iterations, 100);
  EXPECT_EQ(descriptor.width, 1280u);
  EXPECT_EQ(descriptor.height, 720u);
}

TEST_F(FractalDescriptorTest, Validate)
{
  FractalDescriptor descriptor;
  EXPECT_NO_THROW(validate(descriptor));

  descriptor.width = 100;
  EXPECT_THROW(validate(descriptor), std::invalid_argument);

  descriptor.width = 64;
  descriptor.height = 0;
  EXPECT_THROW(validate(descriptor), std::invalid_argument);

  descriptor.height = 64;
  descriptor.iterations = 0;
  EXPECT_THROW(validate(descriptor), std::invalid_argument);
}

TEST_F(FractalDescriptorTest, FromSettingsRejectsBadValues)
{
  auto &settings = SettingsManager::instance();

  settings.output.width = -8;
  EXPECT_THROW(descriptor_from_settings(settings), std::invalid_argument);

  settings.output.width = 1280;
  settings.output.height = 721;
  EXPECT_THROW(descriptor_from_settings(settings), std::invalid_argument);

  settings.output.height = 720;
  settings.fractal.type = "newton";
  EXPECT_THROW(descriptor_from_settings(settings), std::invalid_argument);
}

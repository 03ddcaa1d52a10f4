/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "fractal/core/settings_manager.hpp"

using namespace fractal;

class SettingsManagerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    SettingsManager::instance().reset();
    SettingsManager::instance().settings_changed = nullptr;

    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    this->dir_ = std::filesystem::temp_directory_path() / "fractal_tests" /
                 info->name();
    std::filesystem::remove_all(this->dir_);
  }

  void TearDown() override
  {
    SettingsManager::instance().reset();
    SettingsManager::instance().settings_changed = nullptr;
    std::filesystem::remove_all(this->dir_);
  }

  std::filesystem::path dir_;
};

TEST_F(SettingsManagerTest, MissingFileWritesDefaults)
{
  auto &settings = SettingsManager::instance();
  auto  path = this->dir_ / "settings.json";

  int notified = 0;
  settings.settings_changed = [&notified]() { ++notified; };
  settings.load(path);

  EXPECT_EQ(notified, 1);
  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(settings.output.width, 1280);
  EXPECT_EQ(settings.output.height, 720);
  EXPECT_EQ(settings.fractal.type, "julia");
}

TEST_F(SettingsManagerTest, SaveLoadRoundTrip)
{
  auto &settings = SettingsManager::instance();
  auto  path = this->dir_ / "settings.json";

  settings.output.width = 64;
  settings.output.height = 32;
  settings.compute.enable_vulkan = false;
  settings.compute.cpu_threads = 3;
  settings.compute.device_selection = "NVIDIA";
  settings.logging.stutter_threshold_ms = 20.f;
  settings.fractal.iterations = 42;
  settings.save(path);

  settings.reset();
  EXPECT_EQ(settings.output.width, 1280);

  int notified = 0;
  settings.settings_changed = [&notified]() { ++notified; };
  settings.load(path);

  EXPECT_EQ(notified, 1);
  EXPECT_EQ(settings.output.width, 64);
  EXPECT_EQ(settings.output.height, 32);
  EXPECT_FALSE(settings.compute.enable_vulkan);
  EXPECT_EQ(settings.compute.cpu_threads, 3);
  EXPECT_EQ(settings.compute.device_selection, "NVIDIA");
  EXPECT_FLOAT_EQ(settings.logging.stutter_threshold_ms, 20.f);
  EXPECT_EQ(settings.fractal.iterations, 42);
}

TEST_F(SettingsManagerTest, BadValuesAreIgnored)
{
  auto &settings = SettingsManager::instance();

  nlohmann::json j;
  j["output"]["width"] = "wide";
  j["output"]["height"] = 256;
  j["compute"]["enable_vulkan"] = 3.5;
  j["unknown_section"]["x"] = 1;

  settings.from_json(j);

  EXPECT_EQ(settings.output.width, 1280);
  EXPECT_EQ(settings.output.height, 256);
  EXPECT_TRUE(settings.compute.enable_vulkan);
}

TEST_F(SettingsManagerTest, MalformedFileKeepsDefaults)
{
  auto &settings = SettingsManager::instance();
  auto  path = this->dir_ / "settings.json";

  std::filesystem::create_directories(this->dir_);
  std::ofstream(path) << "{ not json";

  int notified = 0;
  settings.settings_changed = [&notified]() { ++notified; };
  settings.load(path);

  EXPECT_EQ(notified, 1);

  EXPECT_EQ(settings.output.width, 1280);
  EXPECT_EQ(settings.fractal.iterations, 100);
}

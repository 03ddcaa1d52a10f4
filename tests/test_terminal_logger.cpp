/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <gtest/gtest.h>

#include "fractal/core/terminal_logger.hpp"

using namespace fractal;

class TerminalLoggerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto &terminal = TerminalLogger::instance();
    terminal.set_logging_level(1);
    terminal.set_log_dispatch_timings(true);
    terminal.set_show_stutter_warnings(true);
    terminal.set_stutter_threshold_ms(150.f);
  }

  void TearDown() override
  {
    auto &terminal = TerminalLogger::instance();
    terminal.set_logging_level(2);
    terminal.set_stutter_threshold_ms(150.f);
    terminal.set_show_stutter_warnings(true);
  }
};

TEST_F(TerminalLoggerTest, SlowDispatchCountsAsStutter)
{
  auto &terminal = TerminalLogger::instance();
  int   before = terminal.get_stutter_count();

  terminal.log_dispatch("julia", "CPU", 10.f, 4);
  EXPECT_EQ(terminal.get_stutter_count(), before);

  terminal.log_dispatch("julia", "CPU", 200.f, 4);
  EXPECT_EQ(terminal.get_stutter_count(), before + 1);

  terminal.set_stutter_threshold_ms(5.f);
  terminal.log_dispatch("julia", "VULKAN", 10.f);
  EXPECT_EQ(terminal.get_stutter_count(), before + 2);
}

TEST_F(TerminalLoggerTest, StutterWarningsCanBeDisabled)
{
  auto &terminal = TerminalLogger::instance();
  int   before = terminal.get_stutter_count();

  terminal.set_show_stutter_warnings(false);
  terminal.log_dispatch("julia", "CPU", 1000.f);

  EXPECT_EQ(terminal.get_stutter_count(), before);
}

TEST_F(TerminalLoggerTest, Settings)
{
  auto &terminal = TerminalLogger::instance();

  terminal.set_logging_level(3);
  terminal.set_log_dispatch_timings(false);
  terminal.set_stutter_threshold_ms(42.f);

  EXPECT_EQ(terminal.get_logging_level(), 3);
  EXPECT_FALSE(terminal.get_log_dispatch_timings());
  EXPECT_FLOAT_EQ(terminal.get_stutter_threshold_ms(), 42.f);
}

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace fractal
{

// Process-wide spdlog logger ("fractal", colored stdout sink).
class Logger
{
public:
  static std::shared_ptr<spdlog::logger> &log();

private:
  Logger() = delete;

  static std::shared_ptr<spdlog::logger> instance;
};

} // namespace fractal

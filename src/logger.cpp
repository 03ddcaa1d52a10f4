/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <spdlog/sinks/stdout_color_sinks.h>

#include "fractal/logger.hpp"

namespace fractal
{

std::shared_ptr<spdlog::logger> Logger::instance = nullptr;

std::shared_ptr<spdlog::logger> &Logger::log()
{
  if (!instance)
  {
    instance = spdlog::get("fractal");
    if (!instance)
      instance = spdlog::stdout_color_mt("fractal");

    instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  }
  return instance;
}

} // namespace fractal

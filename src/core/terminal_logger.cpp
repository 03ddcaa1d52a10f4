/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include "fractal/core/terminal_logger.hpp"
#include "fractal/logger.hpp"

namespace fractal
{

TerminalLogger &TerminalLogger::instance()
{
  static TerminalLogger inst;
  return inst;
}

void TerminalLogger::log_dispatch_started(const std::string &kernel_name,
                                          uint32_t           width,
                                          uint32_t           height,
                                          uint32_t           tiles_x,
                                          uint32_t           tiles_y)
{
  if (logging_level_ < 3) // Debug
    return;

  Logger::log()->debug("[DISPATCH] {} {}x{} ({}x{} tiles)",
                       kernel_name,
                       width,
                       height,
                       tiles_x,
                       tiles_y);
}

void TerminalLogger::log_dispatch(const std::string &kernel_name,
                                  const std::string &backend,
                                  float              time_ms,
                                  int                cpu_threads)
{
  if (logging_level_ >= 2 && log_dispatch_timings_)
  {
    if (cpu_threads > 0)
      Logger::log()->info("[{}] {} -> {:.2f} ms (OpenMP {})",
                          backend,
                          kernel_name,
                          time_ms,
                          cpu_threads);
    else
      Logger::log()->info("[{}] {} -> {:.2f} ms", backend, kernel_name, time_ms);
  }

  if (show_stutter_warnings_ && time_ms > stutter_threshold_ms_)
    log_stutter_warning(kernel_name, time_ms);
}

void TerminalLogger::log_stutter_warning(const std::string &kernel_name, float time_ms)
{
  ++stutter_count_;

  if (logging_level_ < 1) // Warning
    return;

  Logger::log()->warn("[STUTTER] {} {:.0f} ms, above {:.0f} ms",
                      kernel_name,
                      time_ms,
                      stutter_threshold_ms_);
}

void TerminalLogger::log_fallback(const std::string &kernel_name,
                                  const std::string &reason)
{
  if (logging_level_ < 1)
    return;

  Logger::log()->warn("[FALLBACK] {} on CPU: {}", kernel_name, reason);
}

void TerminalLogger::set_logging_level(int level)
{
  logging_level_ = level;

  switch (level)
  {
  case 0: spdlog::set_level(spdlog::level::off); break;
  case 1: spdlog::set_level(spdlog::level::warn); break;
  case 2: spdlog::set_level(spdlog::level::info); break;
  case 3: spdlog::set_level(spdlog::level::debug); break;
  case 4: spdlog::set_level(spdlog::level::trace); break;
  default: spdlog::set_level(spdlog::level::info); break;
  }
}

void TerminalLogger::set_log_dispatch_timings(bool enabled)
{
  log_dispatch_timings_ = enabled;
}

void TerminalLogger::set_show_stutter_warnings(bool enabled)
{
  show_stutter_warnings_ = enabled;
}

void TerminalLogger::set_stutter_threshold_ms(float threshold_ms)
{
  stutter_threshold_ms_ = threshold_ms;
}

} // namespace fractal

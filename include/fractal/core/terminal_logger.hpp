/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General Public
   License. The full license is in the file LICENSE, distributed with this software. */
#pragma once
#include <cstdint>
#include <string>

#include <spdlog/spdlog.h>

namespace fractal
{

// Level-gated terminal reporting of texture dispatches: backend, timing,
// stutter detection (dispatches slower than the threshold are warned about).
class TerminalLogger
{
public:
  static TerminalLogger &instance();

  void log_dispatch_started(const std::string &kernel_name,
                            uint32_t           width,
                            uint32_t           height,
                            uint32_t           tiles_x,
                            uint32_t           tiles_y);

  void log_dispatch(const std::string &kernel_name,
                    const std::string &backend,
                    float              time_ms,
                    int                cpu_threads = 0);

  void log_stutter_warning(const std::string &kernel_name, float time_ms);

  void log_fallback(const std::string &kernel_name, const std::string &reason);

  // Settings
  void set_logging_level(int level); // 0=Silent, 1=Warning, 2=Info, 3=Debug, 4=Verbose
  void set_log_dispatch_timings(bool enabled);
  void set_show_stutter_warnings(bool enabled);
  void set_stutter_threshold_ms(float threshold_ms);

  int   get_logging_level() const { return logging_level_; }
  bool  get_log_dispatch_timings() const { return log_dispatch_timings_; }
  bool  get_show_stutter_warnings() const { return show_stutter_warnings_; }
  float get_stutter_threshold_ms() const { return stutter_threshold_ms_; }

  // Number of stutter warnings emitted so far.
  int get_stutter_count() const { return stutter_count_; }

private:
  TerminalLogger() = default;
  TerminalLogger(const TerminalLogger &) = delete;
  TerminalLogger &operator=(const TerminalLogger &) = delete;

  int   logging_level_ = 2; // Info
  bool  log_dispatch_timings_ = true;
  bool  show_stutter_warnings_ = true;
  float stutter_threshold_ms_ = 150.0f;
  int   stutter_count_ = 0;
};

} // namespace fractal

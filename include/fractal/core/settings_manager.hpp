/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General Public
   License. The full license is in the file LICENSE, distributed with this software. */
#pragma once
#include <filesystem>
#include <functional>
#include <string>

#include "nlohmann/json.hpp"

namespace fractal
{

// JSON-backed settings. Persisted to ~/.config/fractal/settings.json unless
// an explicit path is given.
class SettingsManager
{
public:
  static SettingsManager &instance();

  // Load settings from disk (creates defaults if missing). settings_changed
  // fires once per call, whether the file was read or not.
  void load();
  void load(const std::filesystem::path &path);

  void save() const;
  void save(const std::filesystem::path &path) const;

  std::filesystem::path get_settings_path() const;

  // Back to the built-in defaults.
  void reset();

  // --- Output texture ---
  struct Output
  {
    int width = 1280;  // multiple of 8
    int height = 720;  // multiple of 8
  } output;

  // --- Compute backends ---
  struct Compute
  {
    bool        enable_vulkan = true;
    bool        fallback_to_cpu_on_error = true;
    std::string device_selection = "Auto"; // "Auto" or a device name substring
    int         cpu_threads = 0;           // 0 = OpenMP default
  } compute;

  // --- Logging ---
  struct Logging
  {
    int   terminal_logging_level = 2; // 0=Silent, 1=Warning, 2=Info, 3=Debug, 4=Verbose
    bool  log_dispatch_timings = true;
    bool  show_stutter_warnings = true;
    float stutter_threshold_ms = 150.f;
  } logging;

  // --- Fractal ---
  struct Fractal
  {
    std::string type = "julia";
    double      c_re = -0.45;
    double      c_im = 0.55;
    int         iterations = 100;
  } fractal;

  // Called at the end of every load()
  std::function<void()> settings_changed;

  nlohmann::json to_json() const;
  void           from_json(const nlohmann::json &j);

private:
  SettingsManager() = default;

  void read_file(const std::filesystem::path &path);
  SettingsManager(const SettingsManager &) = delete;
  SettingsManager &operator=(const SettingsManager &) = delete;
};

} // namespace fractal

/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <cstdlib>
#include <fstream>

#include "fractal/core/settings_manager.hpp"
#include "fractal/logger.hpp"

namespace fractal
{

SettingsManager &SettingsManager::instance()
{
  static SettingsManager inst;
  return inst;
}

std::filesystem::path SettingsManager::get_settings_path() const
{
  std::filesystem::path config_dir;

#ifdef _WIN32
  const char *appdata = std::getenv("APPDATA");
  if (appdata)
    config_dir = std::filesystem::path(appdata) / "fractal";
  else
    config_dir = std::filesystem::path(".") / ".fractal";
#else
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg)
    config_dir = std::filesystem::path(xdg) / "fractal";
  else
  {
    const char *home = std::getenv("HOME");
    if (home)
      config_dir = std::filesystem::path(home) / ".config" / "fractal";
    else
      config_dir = std::filesystem::path(".") / ".fractal";
  }
#endif

  return config_dir / "settings.json";
}

void SettingsManager::reset()
{
  this->output = Output{};
  this->compute = Compute{};
  this->logging = Logging{};
  this->fractal = Fractal{};
}

void SettingsManager::load() { this->load(this->get_settings_path()); }

void SettingsManager::load(const std::filesystem::path &path)
{
  this->read_file(path);

  if (this->settings_changed)
    this->settings_changed();
}

void SettingsManager::read_file(const std::filesystem::path &path)
{
  if (!std::filesystem::exists(path))
  {
    Logger::log()->info("SettingsManager: no settings file at {}, using defaults",
                        path.string());
    this->save(path);
    return;
  }

  std::ifstream file(path);
  if (!file.is_open())
  {
    Logger::log()->warn("SettingsManager: cannot open {}", path.string());
    return;
  }

  try
  {
    nlohmann::json j;
    file >> j;
    this->from_json(j);
    Logger::log()->info("SettingsManager: loaded settings from {}", path.string());
  }
  catch (const nlohmann::json::exception &e)
  {
    Logger::log()->warn("SettingsManager: failed to load settings: {}", e.what());
  }
}

void SettingsManager::save() const { this->save(this->get_settings_path()); }

void SettingsManager::save(const std::filesystem::path &path) const
{
  try
  {
    if (path.has_parent_path())
      std::filesystem::create_directories(path.parent_path());

    std::ofstream file(path);
    if (file.is_open())
    {
      file << this->to_json().dump(2) << "\n";
      Logger::log()->trace("SettingsManager: saved settings to {}", path.string());
    }
    else
    {
      Logger::log()->error("SettingsManager: cannot write {}", path.string());
    }
  }
  catch (const std::exception &e)
  {
    Logger::log()->error("SettingsManager: failed to save settings: {}", e.what());
  }
}

nlohmann::json SettingsManager::to_json() const
{
  nlohmann::json j;

  j["output"]["width"] = output.width;
  j["output"]["height"] = output.height;

  j["compute"]["enable_vulkan"] = compute.enable_vulkan;
  j["compute"]["fallback_to_cpu_on_error"] = compute.fallback_to_cpu_on_error;
  j["compute"]["device_selection"] = compute.device_selection;
  j["compute"]["cpu_threads"] = compute.cpu_threads;

  j["logging"]["terminal_logging_level"] = logging.terminal_logging_level;
  j["logging"]["log_dispatch_timings"] = logging.log_dispatch_timings;
  j["logging"]["show_stutter_warnings"] = logging.show_stutter_warnings;
  j["logging"]["stutter_threshold_ms"] = logging.stutter_threshold_ms;

  j["fractal"]["type"] = fractal.type;
  j["fractal"]["c_re"] = fractal.c_re;
  j["fractal"]["c_im"] = fractal.c_im;
  j["fractal"]["iterations"] = fractal.iterations;

  return j;
}

void SettingsManager::from_json(const nlohmann::json &j)
{
  auto safe_get = [](const nlohmann::json &obj,
                     const std::string    &key,
                     auto                 &target)
  {
    if (!obj.contains(key))
      return;

    try
    {
      target = obj.at(key).get<std::decay_t<decltype(target)>>();
    }
    catch (const nlohmann::json::exception &e)
    {
      Logger::log()->warn("SettingsManager: ignoring key '{}': {}", key, e.what());
    }
  };

  if (j.contains("output"))
  {
    auto &s = j["output"];
    safe_get(s, "width", output.width);
    safe_get(s, "height", output.height);
  }

  if (j.contains("compute"))
  {
    auto &s = j["compute"];
    safe_get(s, "enable_vulkan", compute.enable_vulkan);
    safe_get(s, "fallback_to_cpu_on_error", compute.fallback_to_cpu_on_error);
    safe_get(s, "device_selection", compute.device_selection);
    safe_get(s, "cpu_threads", compute.cpu_threads);
  }

  if (j.contains("logging"))
  {
    auto &s = j["logging"];
    safe_get(s, "terminal_logging_level", logging.terminal_logging_level);
    safe_get(s, "log_dispatch_timings", logging.log_dispatch_timings);
    safe_get(s, "show_stutter_warnings", logging.show_stutter_warnings);
    safe_get(s, "stutter_threshold_ms", logging.stutter_threshold_ms);
  }

  if (j.contains("fractal"))
  {
    auto &s = j["fractal"];
    safe_get(s, "type", fractal.type);
    safe_get(s, "c_re", fractal.c_re);
    safe_get(s, "c_im", fractal.c_im);
    safe_get(s, "iterations", fractal.iterations);
  }
}

} // namespace fractal

#include "core/settings_store.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace guardian::core {
namespace {

constexpr int kSettingsVersion = 1;

nlohmann::json to_json(const PersistedSettings& settings) {
  return nlohmann::json{
      {"version", kSettingsVersion},
      {"thresholds",
       {{"cpu", {{"throttle", settings.cpu_throttle_threshold}, {"recovery", settings.cpu_recovery_threshold}}},
        {"gpu", {{"throttle", settings.gpu_throttle_threshold}, {"recovery", settings.gpu_recovery_threshold}}}}},
      {"poll_interval_ms", settings.poll_interval_ms},
      {"target_process_name", settings.target_process_name},
      {"ui",
       {{"start_in_widget_mode", settings.start_in_widget_mode},
        {"widget_x", settings.widget_x},
        {"widget_y", settings.widget_y}}},
  };
}

PersistedSettings from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw ConfigError("settings root must be a JSON object");
  }

  PersistedSettings settings{};
  const auto thresholds = json.value("thresholds", nlohmann::json::object());
  const auto cpu = thresholds.value("cpu", nlohmann::json::object());
  const auto gpu = thresholds.value("gpu", nlohmann::json::object());
  settings.cpu_throttle_threshold = cpu.value("throttle", settings.cpu_throttle_threshold);
  settings.cpu_recovery_threshold = cpu.value("recovery", settings.cpu_recovery_threshold);
  settings.gpu_throttle_threshold = gpu.value("throttle", settings.gpu_throttle_threshold);
  settings.gpu_recovery_threshold = gpu.value("recovery", settings.gpu_recovery_threshold);
  settings.poll_interval_ms = json.value("poll_interval_ms", settings.poll_interval_ms);
  settings.target_process_name = json.value("target_process_name", settings.target_process_name);

  const auto ui = json.value("ui", nlohmann::json::object());
  settings.start_in_widget_mode = ui.value("start_in_widget_mode", settings.start_in_widget_mode);
  settings.widget_x = ui.value("widget_x", settings.widget_x);
  settings.widget_y = ui.value("widget_y", settings.widget_y);
  return settings;
}

}  // namespace

PersistedSettings capture_settings(const GuardianConfig& config, const PersistedSettings& ui) {
  PersistedSettings settings = ui;
  settings.cpu_throttle_threshold = config.cpu_throttle_threshold;
  settings.cpu_recovery_threshold = config.cpu_recovery_threshold;
  settings.gpu_throttle_threshold = config.gpu_throttle_threshold;
  settings.gpu_recovery_threshold = config.gpu_recovery_threshold;
  settings.poll_interval_ms = config.poll_interval.count();
  settings.target_process_name = config.target_process_name;
  return settings;
}

void apply_settings(const PersistedSettings& settings, GuardianConfig& config) {
  config.cpu_throttle_threshold = settings.cpu_throttle_threshold;
  config.cpu_recovery_threshold = settings.cpu_recovery_threshold;
  config.gpu_throttle_threshold = settings.gpu_throttle_threshold;
  config.gpu_recovery_threshold = settings.gpu_recovery_threshold;
  config.poll_interval = std::chrono::milliseconds(settings.poll_interval_ms);
  if (!settings.target_process_name.empty()) {
    config.target_process_name = settings.target_process_name;
  }
}

SettingsStore::SettingsStore(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<PersistedSettings> SettingsStore::load() const {
  std::ifstream input(path_);
  if (!input.is_open()) {
    return std::nullopt;
  }

  try {
    return from_json(nlohmann::json::parse(input));
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigError("malformed settings file " + path_.string() + ": " + ex.what());
  }
}

void SettingsStore::save(const PersistedSettings& settings) const {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("unable to create " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  std::filesystem::path temp = path_;
  temp += ".tmp";
  {
    std::ofstream output(temp, std::ios::trunc);
    if (!output.is_open()) {
      throw std::runtime_error("unable to write settings file: " + temp.string());
    }
    output << to_json(settings).dump(2) << '\n';
    if (!output.good()) {
      throw std::runtime_error("short write to settings file: " + temp.string());
    }
  }

  std::filesystem::rename(temp, path_, ec);
  if (ec) {
    throw std::runtime_error("unable to replace " + path_.string() + ": " + ec.message());
  }
}

std::filesystem::path expand_home(const std::string& path) {
  if (path.rfind("~/", 0) == 0) {
    if (const char* home = std::getenv("HOME"); home != nullptr) {
      return std::filesystem::path(home) / path.substr(2);
    }
  }
  return std::filesystem::path(path);
}

}  // namespace guardian::core

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "core/config.hpp"

namespace guardian::core {

// State carried across restarts. The engine treats it as plain config input;
// the widget fields belong to the presentation layer and are stored verbatim.
struct PersistedSettings {
  float cpu_throttle_threshold{90.0F};
  float cpu_recovery_threshold{75.0F};
  float gpu_throttle_threshold{90.0F};
  float gpu_recovery_threshold{75.0F};
  std::int64_t poll_interval_ms{1000};
  std::string target_process_name{};
  bool start_in_widget_mode{true};
  int widget_x{100};
  int widget_y{100};
};

PersistedSettings capture_settings(const GuardianConfig& config, const PersistedSettings& ui = {});

// Overlays persisted values on a config loaded from file.
void apply_settings(const PersistedSettings& settings, GuardianConfig& config);

// JSON file store. Writes go to a sibling temp file and are renamed into place.
class SettingsStore {
 public:
  explicit SettingsStore(std::filesystem::path path);

  const std::filesystem::path& path() const noexcept { return path_; }

  // std::nullopt when no settings were saved yet. Throws ConfigError on a malformed file.
  std::optional<PersistedSettings> load() const;

  // Throws std::runtime_error when the file cannot be written.
  void save(const PersistedSettings& settings) const;

 private:
  std::filesystem::path path_;
};

// Expands a leading "~/" using $HOME.
std::filesystem::path expand_home(const std::string& path);

}  // namespace guardian::core

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>

#include "model/process_policy.hpp"

namespace guardian::core {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Immutable for one engine configuration; replaced wholesale via Guardian::reconfigure.
struct GuardianConfig {
  float cpu_throttle_threshold{90.0F};
  float cpu_recovery_threshold{75.0F};
  float gpu_throttle_threshold{90.0F};
  float gpu_recovery_threshold{75.0F};
  std::chrono::milliseconds poll_interval{1000};
  std::string target_process_name{};

  model::priority_level throttle_priority{model::priority_level::BELOW_NORMAL};
  model::match_mode match{model::match_mode::EXACT};

  std::uint32_t sample_retries{2};
  std::uint32_t degraded_after_cycles{3};
  float smoothing_alpha{1.0F};

  std::size_t event_buffer{64};
  bool stdout_status{true};
  bool json_events{false};

  std::uint32_t gpu_device_index{0};
  bool gpu_enabled{true};

  std::string settings_path{};
};

GuardianConfig load_guardian_config(const std::string& path);

GuardianConfig parse_guardian_config(std::istream& input);

// Throws ConfigError when the config cannot drive an engine.
void validate_config(const GuardianConfig& config);

}  // namespace guardian::core

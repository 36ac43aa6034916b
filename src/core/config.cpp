#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace guardian::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::invalid_argument("expected a boolean");
}

std::uint32_t parse_count(const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed < 0) {
    throw std::out_of_range("must be greater than or equal to 0");
  }
  return static_cast<std::uint32_t>(parsed);
}

struct ConfigLine {
  std::size_t depth{0};
  std::string key{};
  std::string value{};
};

// Two spaces per nesting level. Blank, comment-only and colon-less lines yield nothing.
std::optional<ConfigLine> split_line(std::string line) {
  if (const auto comment = line.find('#'); comment != std::string::npos) {
    line.erase(comment);
  }

  const auto colon = line.find(':');
  if (colon == std::string::npos || trim(line).empty()) {
    return std::nullopt;
  }

  ConfigLine out{};
  out.depth = line.find_first_not_of(' ') / 2;
  out.key = trim(line.substr(0, colon));
  out.value = trim(line.substr(colon + 1));
  return out;
}

void apply_key_value(GuardianConfig& config, const std::string& key, const std::string& value) {
  if (key == "thresholds.cpu.throttle") {
    config.cpu_throttle_threshold = std::stof(value);
  } else if (key == "thresholds.cpu.recovery") {
    config.cpu_recovery_threshold = std::stof(value);
  } else if (key == "thresholds.gpu.throttle") {
    config.gpu_throttle_threshold = std::stof(value);
  } else if (key == "thresholds.gpu.recovery") {
    config.gpu_recovery_threshold = std::stof(value);
  } else if (key == "poll_interval_ms") {
    config.poll_interval = std::chrono::milliseconds(std::stoll(value));
  } else if (key == "target.name") {
    config.target_process_name = unquote(value);
  } else if (key == "target.match") {
    config.match = model::parse_match_mode(value);
  } else if (key == "target.throttle_priority") {
    config.throttle_priority = model::parse_priority_level(value);
  } else if (key == "sampling.retries") {
    config.sample_retries = parse_count(value);
  } else if (key == "sampling.degraded_after_cycles") {
    config.degraded_after_cycles = parse_count(value);
  } else if (key == "sampling.smoothing_alpha") {
    config.smoothing_alpha = std::stof(value);
  } else if (key == "events.buffer") {
    config.event_buffer = parse_count(value);
  } else if (key == "events.stdout_status") {
    config.stdout_status = parse_bool(value);
  } else if (key == "events.json") {
    config.json_events = parse_bool(value);
  } else if (key == "gpu.device_index") {
    config.gpu_device_index = parse_count(value);
  } else if (key == "sensors.gpu") {
    config.gpu_enabled = parse_bool(value);
  } else if (key == "settings.path") {
    config.settings_path = unquote(value);
  }
}

}  // namespace

GuardianConfig parse_guardian_config(std::istream& input) {
  GuardianConfig config{};
  std::vector<std::string> sections;
  std::string raw;
  std::size_t line_number = 0;

  while (std::getline(input, raw)) {
    ++line_number;
    const auto line = split_line(raw);
    if (!line.has_value()) {
      continue;
    }

    // A deeper indent than the open sections leaves empty levels in between.
    sections.resize(std::min(sections.size(), line->depth));
    if (line->value.empty()) {
      sections.resize(line->depth);
      sections.push_back(line->key);
      continue;
    }

    std::string full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key += section + '.';
      }
    }
    full_key += line->key;

    try {
      apply_key_value(config, full_key, line->value);
    } catch (const std::logic_error& ex) {
      throw ConfigError("line " + std::to_string(line_number) + ": invalid value for " + full_key + " (" +
                        ex.what() + ")");
    }
  }

  return config;
}

GuardianConfig load_guardian_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw ConfigError("unable to open config file: " + path);
  }
  return parse_guardian_config(input);
}

void validate_config(const GuardianConfig& config) {
  const auto in_percent_range = [](const float value) { return value >= 0.0F && value <= 100.0F; };

  if (!in_percent_range(config.cpu_throttle_threshold) || !in_percent_range(config.cpu_recovery_threshold) ||
      !in_percent_range(config.gpu_throttle_threshold) || !in_percent_range(config.gpu_recovery_threshold)) {
    throw ConfigError("thresholds must be within 0..100");
  }

  if (config.cpu_recovery_threshold >= config.cpu_throttle_threshold) {
    throw ConfigError("thresholds.cpu.recovery must be strictly below thresholds.cpu.throttle");
  }

  if (config.gpu_recovery_threshold >= config.gpu_throttle_threshold) {
    throw ConfigError("thresholds.gpu.recovery must be strictly below thresholds.gpu.throttle");
  }

  if (config.poll_interval.count() <= 0) {
    throw ConfigError("poll_interval_ms must be greater than 0");
  }

  if (config.target_process_name.empty()) {
    throw ConfigError("target.name must not be empty");
  }

  if (config.throttle_priority == model::priority_level::NORMAL) {
    throw ConfigError("target.throttle_priority must be below normal");
  }

  if (!(config.smoothing_alpha > 0.0F && config.smoothing_alpha <= 1.0F)) {
    throw ConfigError("sampling.smoothing_alpha must be in (0, 1]");
  }

  if (config.degraded_after_cycles == 0) {
    throw ConfigError("sampling.degraded_after_cycles must be greater than 0");
  }

  if (config.event_buffer == 0) {
    throw ConfigError("events.buffer must be greater than 0");
  }
}

}  // namespace guardian::core
